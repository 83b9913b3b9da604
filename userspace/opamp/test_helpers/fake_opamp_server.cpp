/**
 * @file
 *
 * Implementation of fake_opamp_server.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "fake_opamp_server.h"

#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPRequestHandler.h>
#include <Poco/Net/HTTPRequestHandlerFactory.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/HTTPServerParams.h>
#include <Poco/Net/HTTPServerRequest.h>
#include <Poco/Net/HTTPServerResponse.h>
#include <Poco/Net/ServerSocket.h>
#include <Poco/StreamCopier.h>

#include <atomic>
#include <sstream>

using namespace opamp;
using Poco::Net::HTTPResponse;

namespace
{

class opamp_request_handler : public Poco::Net::HTTPRequestHandler
{
public:
	opamp_request_handler(const test_helpers::fake_opamp_peer::ptr& peer,
	                      std::atomic<uint64_t>& connection) :
		m_peer(peer),
		m_connection(connection)
	{
	}

	void handleRequest(Poco::Net::HTTPServerRequest& request,
	                   Poco::Net::HTTPServerResponse& response) override
	{
		if (request.getURI() != test_helpers::fake_opamp_server::PATH)
		{
			response.setStatusAndReason(HTTPResponse::HTTP_NOT_FOUND);
			response.send();
			return;
		}

		if (request.getMethod() == Poco::Net::HTTPRequest::HTTP_HEAD)
		{
			const uint64_t connection = m_peer->accept_connection();
			if (connection == 0)
			{
				response.setStatusAndReason(HTTPResponse::HTTP_SERVICE_UNAVAILABLE);
			}
			else
			{
				m_connection = connection;
				response.setStatusAndReason(HTTPResponse::HTTP_OK);
			}
			response.send();
			return;
		}

		if (request.getMethod() != Poco::Net::HTTPRequest::HTTP_POST)
		{
			response.setStatusAndReason(HTTPResponse::HTTP_METHOD_NOT_ALLOWED);
			response.send();
			return;
		}

		wire_frame frame;
		try
		{
			frame.encoding = protocol::parse_content_encoding(
				request.get("Content-Encoding", ""));
		}
		catch (const protocol_error&)
		{
			response.setStatusAndReason(HTTPResponse::HTTP_UNSUPPORTED_MEDIA_TYPE);
			response.send();
			return;
		}

		std::ostringstream body;
		Poco::StreamCopier::copyStream(request.stream(), body);
		frame.payload = body.str();

		if (m_peer->deliver(m_connection, frame) != transport_error::NONE)
		{
			response.setStatusAndReason(HTTPResponse::HTTP_BAD_REQUEST);
			response.send();
			return;
		}

		wire_frame reply;
		response.setStatusAndReason(HTTPResponse::HTTP_OK);
		if (!m_peer->pop_reply(m_connection, reply))
		{
			response.setContentLength(0);
			response.send();
			return;
		}

		response.setContentType(protocol::CONTENT_TYPE);
		const std::string encoding = protocol::content_encoding(reply.encoding);
		if (!encoding.empty())
		{
			response.set("Content-Encoding", encoding);
		}
		response.setContentLength(static_cast<std::streamsize>(reply.payload.size()));
		response.send() << reply.payload;
	}

private:
	test_helpers::fake_opamp_peer::ptr m_peer;
	std::atomic<uint64_t>& m_connection;
};

class opamp_handler_factory : public Poco::Net::HTTPRequestHandlerFactory
{
public:
	explicit opamp_handler_factory(const test_helpers::fake_opamp_peer::ptr& peer) :
		m_peer(peer),
		m_connection(0)
	{
	}

	Poco::Net::HTTPRequestHandler* createRequestHandler(const Poco::Net::HTTPServerRequest&) override
	{
		return new opamp_request_handler(m_peer, m_connection);
	}

private:
	test_helpers::fake_opamp_peer::ptr m_peer;
	std::atomic<uint64_t> m_connection;
};

}  // namespace

namespace test_helpers
{

const char* const fake_opamp_server::PATH = "/v1/opamp";

fake_opamp_server::fake_opamp_server(const fake_opamp_peer::ptr& peer) :
	m_srv(new opamp_handler_factory(peer),
	      Poco::Net::ServerSocket(Poco::Net::SocketAddress("127.0.0.1", 0)),
	      new Poco::Net::HTTPServerParams)
{
	m_srv.start();
}

fake_opamp_server::~fake_opamp_server()
{
	m_srv.stopAll(true);
}

uint16_t fake_opamp_server::port() const
{
	return m_srv.port();
}

std::string fake_opamp_server::url() const
{
	return "http://127.0.0.1:" + std::to_string(port()) + PATH;
}

}  // namespace test_helpers
