/**
 * @file
 *
 * Implementation of poco_websocket_channel.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "stream_channel.h"
#include "common_logger.h"

#include <Poco/Buffer.h>
#include <Poco/Exception.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/NetException.h>
#include <Poco/Net/WebSocket.h>
#include <Poco/Timespan.h>

COMMON_LOGGER();

namespace opamp
{

poco_websocket_channel::poco_websocket_channel(const endpoint_settings& settings) :
	m_settings(settings),
	m_uri(settings.url)
{
}

poco_websocket_channel::~poco_websocket_channel()
{
	close();
}

std::shared_ptr<Poco::Net::WebSocket> poco_websocket_channel::socket()
{
	std::lock_guard<std::mutex> lock(m_socket_lock);
	return m_ws;
}

transport_error poco_websocket_channel::open()
{
	close();

	try
	{
		std::unique_ptr<Poco::Net::HTTPClientSession> session =
		        endpoint::create_session(m_uri, m_settings);
		Poco::Net::HTTPRequest request(Poco::Net::HTTPRequest::HTTP_GET,
		                               endpoint::request_target(m_uri),
		                               Poco::Net::HTTPMessage::HTTP_1_1);
		endpoint::decorate_request(request, m_settings);
		Poco::Net::HTTPResponse response;

		std::shared_ptr<Poco::Net::WebSocket> ws =
		        std::make_shared<Poco::Net::WebSocket>(*session, request, response);
		ws->setSendTimeout(Poco::Timespan(static_cast<Poco::Timespan::TimeDiff>(m_settings.timeout_ms) * 1000));

		std::lock_guard<std::mutex> lock(m_socket_lock);
		m_session = std::move(session);
		m_ws = ws;
		LOG_INFO("WebSocket connected to %s", m_settings.url.c_str());
		return transport_error::NONE;
	}
	catch (const Poco::TimeoutException& ex)
	{
		LOG_WARNING("WebSocket connect to %s timed out: %s",
		            m_settings.url.c_str(),
		            ex.displayText().c_str());
		return transport_error::TIMEOUT;
	}
	catch (const Poco::Net::WebSocketException& ex)
	{
		LOG_WARNING("WebSocket handshake with %s failed: %s",
		            m_settings.url.c_str(),
		            ex.displayText().c_str());
		return transport_error::PROTOCOL_VIOLATION;
	}
	catch (const Poco::Exception& ex)
	{
		LOG_WARNING("WebSocket connect to %s failed: %s",
		            m_settings.url.c_str(),
		            ex.displayText().c_str());
		return transport_error::DISCONNECTED;
	}
}

transport_error poco_websocket_channel::send_raw(Poco::Net::WebSocket& ws,
                                                 const char* const data,
                                                 const size_t len,
                                                 const int flags)
{
	std::lock_guard<std::mutex> lock(m_send_lock);

	try
	{
		const int sent = ws.sendFrame(data, static_cast<int>(len), flags);
		if (sent < 0 || static_cast<size_t>(sent) < len)
		{
			LOG_WARNING("Short WebSocket write: %d of %zu bytes", sent, len);
			return transport_error::DISCONNECTED;
		}
		return transport_error::NONE;
	}
	catch (const Poco::TimeoutException& ex)
	{
		LOG_WARNING("WebSocket send timed out: %s", ex.displayText().c_str());
		return transport_error::TIMEOUT;
	}
	catch (const Poco::Exception& ex)
	{
		LOG_WARNING("WebSocket send failed: %s", ex.displayText().c_str());
		return transport_error::DISCONNECTED;
	}
}

transport_error poco_websocket_channel::send_frame(const std::string& data)
{
	std::shared_ptr<Poco::Net::WebSocket> ws = socket();
	if (!ws)
	{
		return transport_error::DISCONNECTED;
	}

	return send_raw(*ws,
	                data.data(),
	                data.size(),
	                Poco::Net::WebSocket::FRAME_BINARY);
}

transport_error poco_websocket_channel::receive_frame(std::string& data,
                                                      bool& received,
                                                      const std::chrono::milliseconds timeout)
{
	received = false;

	std::shared_ptr<Poco::Net::WebSocket> ws = socket();
	if (!ws)
	{
		return transport_error::DISCONNECTED;
	}

	try
	{
		ws->setReceiveTimeout(Poco::Timespan(static_cast<Poco::Timespan::TimeDiff>(timeout.count()) * 1000));

		Poco::Buffer<char> buffer(0);
		int flags = 0;
		const int n = ws->receiveFrame(buffer, flags);
		const int opcode = flags & Poco::Net::WebSocket::FRAME_OP_BITMASK;

		if (n == 0 && opcode != Poco::Net::WebSocket::FRAME_OP_PONG &&
		    opcode != Poco::Net::WebSocket::FRAME_OP_PING)
		{
			LOG_INFO("WebSocket closed by peer");
			return transport_error::DISCONNECTED;
		}

		switch (opcode)
		{
		case Poco::Net::WebSocket::FRAME_OP_CLOSE:
			LOG_INFO("WebSocket close frame received");
			return transport_error::DISCONNECTED;
		case Poco::Net::WebSocket::FRAME_OP_PING:
			return send_raw(*ws,
			                buffer.begin(),
			                buffer.size(),
			                Poco::Net::WebSocket::FRAME_FLAG_FIN |
			                        Poco::Net::WebSocket::FRAME_OP_PONG);
		case Poco::Net::WebSocket::FRAME_OP_PONG:
			return transport_error::NONE;
		case Poco::Net::WebSocket::FRAME_OP_BINARY:
			data.assign(buffer.begin(), buffer.size());
			received = true;
			return transport_error::NONE;
		default:
			LOG_WARNING("Unexpected WebSocket opcode %d", opcode);
			return transport_error::PROTOCOL_VIOLATION;
		}
	}
	catch (const Poco::TimeoutException&)
	{
		return transport_error::NONE;
	}
	catch (const Poco::Exception& ex)
	{
		LOG_WARNING("WebSocket receive failed: %s", ex.displayText().c_str());
		return transport_error::DISCONNECTED;
	}
}

void poco_websocket_channel::close()
{
	std::shared_ptr<Poco::Net::WebSocket> ws;
	std::unique_ptr<Poco::Net::HTTPClientSession> session;
	{
		std::lock_guard<std::mutex> lock(m_socket_lock);
		ws.swap(m_ws);
		session.swap(m_session);
	}

	if (!ws)
	{
		return;
	}

	try
	{
		ws->shutdown();
		ws->close();
	}
	catch (const Poco::Exception& ex)
	{
		LOG_DEBUG("WebSocket close: %s", ex.displayText().c_str());
	}
}

} // namespace opamp
