/**
 * @file
 *
 * Implementation of transport.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "transport.h"
#include "common_logger.h"

#include <Poco/Exception.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/URI.h>

COMMON_LOGGER();

namespace opamp
{

transport::transport(const kind k,
                     std::unique_ptr<http_channel> http,
                     std::unique_ptr<stream_channel> stream) :
	m_kind(k),
	m_http(std::move(http)),
	m_stream(std::move(stream)),
	m_closed(true)
{
}

std::unique_ptr<transport> transport::polling(std::unique_ptr<http_channel> channel)
{
	return std::unique_ptr<transport>(new transport(kind::POLLING, std::move(channel), nullptr));
}

std::unique_ptr<transport> transport::streaming(std::unique_ptr<stream_channel> channel)
{
	return std::unique_ptr<transport>(new transport(kind::STREAMING, nullptr, std::move(channel)));
}

std::unique_ptr<transport> transport::create(const endpoint_settings& settings)
{
	try
	{
		const Poco::URI uri(settings.url);
		const std::string& scheme = uri.getScheme();

		if (scheme == "http" || scheme == "https")
		{
			return polling(std::unique_ptr<http_channel>(new poco_http_channel(settings)));
		}

		if (scheme == "ws" || scheme == "wss")
		{
			return streaming(std::unique_ptr<stream_channel>(new poco_websocket_channel(settings)));
		}

		LOG_ERROR("Unsupported endpoint scheme \"%s\" in %s",
		          scheme.c_str(),
		          settings.url.c_str());
	}
	catch (const Poco::SyntaxException& ex)
	{
		LOG_ERROR("Malformed endpoint %s: %s", settings.url.c_str(), ex.displayText().c_str());
	}

	return nullptr;
}

transport_error transport::connect()
{
	switch (m_kind)
	{
	case kind::POLLING:
	{
		{
			std::lock_guard<std::mutex> lock(m_lock);
			m_replies.clear();
			m_closed = false;
		}

		int status = 0;
		const transport_error err = m_http->head(status);
		if (err != transport_error::NONE)
		{
			return err;
		}

		if (status == Poco::Net::HTTPResponse::HTTP_NOT_FOUND)
		{
			LOG_WARNING("Server endpoint not found (404)");
			return transport_error::DISCONNECTED;
		}
		return transport_error::NONE;
	}
	case kind::STREAMING:
	{
		const transport_error err = m_stream->open();
		if (err == transport_error::NONE)
		{
			std::lock_guard<std::mutex> lock(m_lock);
			m_closed = false;
		}
		return err;
	}
	}
	return transport_error::PROTOCOL_VIOLATION;
}

transport_error transport::send(const wire_frame& frame)
{
	switch (m_kind)
	{
	case kind::POLLING:
		return polling_send(frame);
	case kind::STREAMING:
		return m_stream->send_frame(protocol::ws_encode(frame));
	}
	return transport_error::PROTOCOL_VIOLATION;
}

transport_error transport::polling_send(const wire_frame& frame)
{
	http_response response;
	const transport_error err = m_http->post(frame.payload,
	                                         protocol::content_encoding(frame.encoding),
	                                         response);
	if (err != transport_error::NONE)
	{
		return err;
	}

	if (response.status < 200 || response.status >= 300)
	{
		LOG_WARNING("Server replied with HTTP status %d", response.status);
		return transport_error::DISCONNECTED;
	}

	if (response.body.empty())
	{
		return transport_error::NONE;
	}

	wire_frame reply;
	try
	{
		reply.encoding = protocol::parse_content_encoding(response.content_encoding);
	}
	catch (const protocol_error& ex)
	{
		LOG_WARNING("%s", ex.what());
		return transport_error::PROTOCOL_VIOLATION;
	}
	reply.payload = std::move(response.body);

	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_replies.push_back(std::move(reply));
	}
	m_cv.notify_all();
	return transport_error::NONE;
}

transport_error transport::poll_receive(wire_frame& frame,
                                        bool& received,
                                        const std::chrono::milliseconds timeout)
{
	received = false;

	switch (m_kind)
	{
	case kind::POLLING:
		return polling_receive(frame, received, timeout);
	case kind::STREAMING:
		return streaming_receive(frame, received, timeout);
	}
	return transport_error::PROTOCOL_VIOLATION;
}

transport_error transport::polling_receive(wire_frame& frame,
                                           bool& received,
                                           const std::chrono::milliseconds timeout)
{
	std::unique_lock<std::mutex> lock(m_lock);

	m_cv.wait_for(lock, timeout, [this]()
	{
		return m_closed || !m_replies.empty();
	});

	if (!m_replies.empty())
	{
		frame = std::move(m_replies.front());
		m_replies.pop_front();
		received = true;
		return transport_error::NONE;
	}

	return m_closed ? transport_error::DISCONNECTED : transport_error::NONE;
}

transport_error transport::streaming_receive(wire_frame& frame,
                                             bool& received,
                                             const std::chrono::milliseconds timeout)
{
	{
		std::lock_guard<std::mutex> lock(m_lock);
		if (m_closed)
		{
			return transport_error::DISCONNECTED;
		}
	}

	std::string message;
	bool got = false;
	const transport_error err = m_stream->receive_frame(message, got, timeout);
	if (err != transport_error::NONE || !got)
	{
		return err;
	}

	try
	{
		frame = protocol::ws_decode(message);
	}
	catch (const protocol_error& ex)
	{
		LOG_WARNING("Malformed WebSocket message: %s", ex.what());
		return transport_error::PROTOCOL_VIOLATION;
	}

	received = true;
	return transport_error::NONE;
}

void transport::close()
{
	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_closed = true;
	}
	m_cv.notify_all();

	switch (m_kind)
	{
	case kind::POLLING:
		m_http->close();
		break;
	case kind::STREAMING:
		m_stream->close();
		break;
	}
}

const char* transport::to_string(const kind k)
{
	switch (k)
	{
	case kind::POLLING:
		return "polling";
	case kind::STREAMING:
		return "streaming";
	}
	return "unknown";
}

} // namespace opamp
