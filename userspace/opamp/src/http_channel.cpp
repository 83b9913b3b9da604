/**
 * @file
 *
 * Implementation of poco_http_channel.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "http_channel.h"
#include "common_logger.h"

#include <Poco/Exception.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/NetException.h>
#include <Poco/StreamCopier.h>

#include <limits>

COMMON_LOGGER();

namespace opamp
{

poco_http_channel::poco_http_channel(const endpoint_settings& settings) :
	m_settings(settings),
	m_uri(settings.url)
{
}

std::shared_ptr<Poco::Net::HTTPClientSession> poco_http_channel::session()
{
	std::lock_guard<std::mutex> lock(m_session_lock);

	if (!m_session)
	{
		m_session = endpoint::create_session(m_uri, m_settings);
	}
	return m_session;
}

void poco_http_channel::drop_session()
{
	std::lock_guard<std::mutex> lock(m_session_lock);
	m_session.reset();
}

transport_error poco_http_channel::head(int& status)
{
	try
	{
		std::shared_ptr<Poco::Net::HTTPClientSession> s = session();
		Poco::Net::HTTPRequest request(Poco::Net::HTTPRequest::HTTP_HEAD,
		                               endpoint::request_target(m_uri),
		                               Poco::Net::HTTPMessage::HTTP_1_1);
		endpoint::decorate_request(request, m_settings);

		s->sendRequest(request);

		Poco::Net::HTTPResponse response;
		std::istream& in = s->receiveResponse(response);
		in.ignore(std::numeric_limits<std::streamsize>::max());
		status = response.getStatus();
		return transport_error::NONE;
	}
	catch (const Poco::TimeoutException& ex)
	{
		LOG_WARNING("HEAD %s timed out: %s", m_settings.url.c_str(), ex.displayText().c_str());
		drop_session();
		return transport_error::TIMEOUT;
	}
	catch (const Poco::Exception& ex)
	{
		LOG_WARNING("HEAD %s failed: %s", m_settings.url.c_str(), ex.displayText().c_str());
		drop_session();
		return transport_error::DISCONNECTED;
	}
}

transport_error poco_http_channel::post(const std::string& body,
                                        const std::string& content_encoding,
                                        http_response& out)
{
	try
	{
		std::shared_ptr<Poco::Net::HTTPClientSession> s = session();
		Poco::Net::HTTPRequest request(Poco::Net::HTTPRequest::HTTP_POST,
		                               endpoint::request_target(m_uri),
		                               Poco::Net::HTTPMessage::HTTP_1_1);
		request.setContentType(protocol::CONTENT_TYPE);
		request.setContentLength(body.size());
		request.set("Accept-Encoding", "gzip");
		if (!content_encoding.empty())
		{
			request.set("Content-Encoding", content_encoding);
		}
		endpoint::decorate_request(request, m_settings);

		std::ostream& os = s->sendRequest(request);
		os.write(body.data(), body.size());

		Poco::Net::HTTPResponse response;
		std::istream& in = s->receiveResponse(response);

		out.body.clear();
		Poco::StreamCopier::copyToString(in, out.body);
		out.status = response.getStatus();
		out.content_encoding = response.get("Content-Encoding", "");
		return transport_error::NONE;
	}
	catch (const Poco::TimeoutException& ex)
	{
		LOG_WARNING("POST %s timed out: %s", m_settings.url.c_str(), ex.displayText().c_str());
		drop_session();
		return transport_error::TIMEOUT;
	}
	catch (const Poco::Exception& ex)
	{
		LOG_WARNING("POST %s failed: %s", m_settings.url.c_str(), ex.displayText().c_str());
		drop_session();
		return transport_error::DISCONNECTED;
	}
}

void poco_http_channel::close()
{
	std::shared_ptr<Poco::Net::HTTPClientSession> s;
	{
		std::lock_guard<std::mutex> lock(m_session_lock);
		s.swap(m_session);
	}

	if (s)
	{
		// Shuts the socket down, which unblocks a request in progress
		s->abort();
	}
}

} // namespace opamp
