/**
 * @file
 *
 * Implementation of the fake channels.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "fake_channels.h"

using namespace opamp;

namespace test_helpers
{

fake_http_channel::fake_http_channel(const fake_opamp_peer::ptr& peer) :
	m_peer(peer),
	m_connection(0)
{
}

transport_error fake_http_channel::head(int& status)
{
	const uint64_t connection = m_peer->accept_connection();

	if (connection == 0)
	{
		return transport_error::DISCONNECTED;
	}

	m_connection = connection;
	status = 200;
	return transport_error::NONE;
}

transport_error fake_http_channel::post(const std::string& body,
                                        const std::string& content_encoding,
                                        http_response& response)
{
	wire_frame frame;

	try
	{
		frame.encoding = protocol::parse_content_encoding(content_encoding);
	}
	catch (const protocol_error&)
	{
		response.status = 415;
		return transport_error::NONE;
	}
	frame.payload = body;

	const transport_error err = m_peer->deliver(m_connection, frame);
	if (err != transport_error::NONE)
	{
		return err;
	}

	response.status = 200;
	wire_frame reply;
	if (m_peer->pop_reply(m_connection, reply))
	{
		response.content_encoding = protocol::content_encoding(reply.encoding);
		response.body = reply.payload;
	}
	return transport_error::NONE;
}

void fake_http_channel::close()
{
	m_connection = 0;
	m_peer->wake();
}

fake_stream_channel::fake_stream_channel(const fake_opamp_peer::ptr& peer) :
	m_peer(peer),
	m_connection(0),
	m_closed(false)
{
}

transport_error fake_stream_channel::open()
{
	const uint64_t connection = m_peer->accept_connection();

	if (connection == 0)
	{
		return transport_error::DISCONNECTED;
	}

	m_connection = connection;
	m_closed = false;
	return transport_error::NONE;
}

transport_error fake_stream_channel::send_frame(const std::string& data)
{
	if (m_closed)
	{
		return transport_error::DISCONNECTED;
	}

	wire_frame frame;
	try
	{
		frame = protocol::ws_decode(data);
	}
	catch (const protocol_error&)
	{
		return transport_error::PROTOCOL_VIOLATION;
	}
	return m_peer->deliver(m_connection, frame);
}

transport_error fake_stream_channel::receive_frame(std::string& data,
                                                   bool& received,
                                                   const std::chrono::milliseconds timeout)
{
	received = false;

	wire_frame frame;
	const fake_opamp_peer::receive_result result =
		m_peer->next_reply(m_connection, frame, timeout, [this]() { return m_closed.load(); });

	switch (result)
	{
	case fake_opamp_peer::receive_result::FRAME:
		data = protocol::ws_encode(frame);
		received = true;
		return transport_error::NONE;
	case fake_opamp_peer::receive_result::TIMEOUT:
		return transport_error::NONE;
	case fake_opamp_peer::receive_result::DISCONNECTED:
		break;
	}
	return transport_error::DISCONNECTED;
}

void fake_stream_channel::close()
{
	m_closed = true;
	m_peer->wake();
}

std::function<std::shared_ptr<transport>(const endpoint_settings&)>
fake_transport_factory(const fake_opamp_peer::ptr& peer, const transport::kind kind)
{
	return [peer, kind](const endpoint_settings&) -> std::shared_ptr<transport>
	{
		if (kind == transport::kind::POLLING)
		{
			return std::shared_ptr<transport>(
				transport::polling(std::unique_ptr<http_channel>(new fake_http_channel(peer))));
		}
		return std::shared_ptr<transport>(
			transport::streaming(std::unique_ptr<stream_channel>(new fake_stream_channel(peer))));
	};
}

}  // namespace test_helpers
