/**
 * @file
 *
 * Unit tests for transport.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "fake_channels.h"
#include "fake_opamp_peer.h"
#include "protobuf_compression.h"
#include "transport.h"

#include <gtest.h>

#include <chrono>
#include <thread>

using namespace opamp;
using namespace test_helpers;
using namespace std::chrono;

namespace
{

/**
 * http_channel that answers with canned responses.
 */
class scripted_http_channel : public http_channel
{
public:
	scripted_http_channel(int head_status, const http_response& post_response) :
		m_head_status(head_status),
		m_post_response(post_response),
		m_closed(false)
	{
	}

	transport_error head(int& status) override
	{
		status = m_head_status;
		return transport_error::NONE;
	}

	transport_error post(const std::string&,
	                     const std::string&,
	                     http_response& response) override
	{
		response = m_post_response;
		return transport_error::NONE;
	}

	void close() override
	{
		m_closed = true;
	}

	bool closed() const { return m_closed; }

private:
	const int m_head_status;
	const http_response m_post_response;
	bool m_closed;
};

wire_frame encode(const google::protobuf::MessageLite& msg)
{
	wire_frame frame;
	std::shared_ptr<protobuf_compressor> compressor =
		protobuf_compressor_factory::get(compression_method::NONE);
	EXPECT_TRUE(protocol::message_to_frame(msg, *compressor, frame));
	return frame;
}

std::unique_ptr<transport> scripted(int head_status, const http_response& post_response)
{
	return transport::polling(std::unique_ptr<http_channel>(
		new scripted_http_channel(head_status, post_response)));
}

}  // namespace

TEST(transport_test, polling_not_found_is_disconnected)
{
	auto t = scripted(404, http_response());

	ASSERT_EQ(transport_error::DISCONNECTED, t->connect());
}

TEST(transport_test, polling_other_head_statuses_connect)
{
	auto t = scripted(405, http_response());

	ASSERT_EQ(transport::kind::POLLING, t->get_kind());
	ASSERT_EQ(transport_error::NONE, t->connect());
}

TEST(transport_test, polling_error_status_on_post_is_disconnected)
{
	http_response response;
	response.status = 500;
	auto t = scripted(200, response);

	ASSERT_EQ(transport_error::NONE, t->connect());
	ASSERT_EQ(transport_error::DISCONNECTED, t->send(wire_frame()));
}

TEST(transport_test, polling_unknown_reply_encoding_is_a_violation)
{
	http_response response;
	response.status = 200;
	response.content_encoding = "br";
	response.body = "xyz";
	auto t = scripted(200, response);

	ASSERT_EQ(transport_error::NONE, t->connect());
	ASSERT_EQ(transport_error::PROTOCOL_VIOLATION, t->send(wire_frame()));
}

TEST(transport_test, polling_reply_is_handed_to_receive)
{
	auto peer = std::make_shared<fake_opamp_peer>();
	peer->set_responder(fake_opamp_peer::echo_capabilities(0x3));
	auto t = transport::polling(std::unique_ptr<http_channel>(new fake_http_channel(peer)));

	ASSERT_EQ(transport_error::NONE, t->connect());

	opampproto::AgentToServer hello;
	hello.set_instance_uid("0123456789abcdef");
	hello.set_sequence_num(1);
	ASSERT_EQ(transport_error::NONE, t->send(encode(hello)));
	ASSERT_EQ(1u, peer->received_count());

	wire_frame frame;
	bool received = false;
	ASSERT_EQ(transport_error::NONE, t->poll_receive(frame, received, milliseconds(10)));
	ASSERT_TRUE(received);

	opampproto::ServerToAgent reply;
	protocol::frame_to_protobuf(frame, &reply);
	ASSERT_EQ(0x3u, reply.capabilities());
	ASSERT_EQ("0123456789abcdef", reply.instance_uid());

	// Nothing else pending
	ASSERT_EQ(transport_error::NONE, t->poll_receive(frame, received, milliseconds(10)));
	ASSERT_FALSE(received);
}

TEST(transport_test, polling_close_wakes_receiver)
{
	auto peer = std::make_shared<fake_opamp_peer>();
	std::shared_ptr<transport> t(
		transport::polling(std::unique_ptr<http_channel>(new fake_http_channel(peer))));
	ASSERT_EQ(transport_error::NONE, t->connect());

	std::thread closer([t]()
	{
		std::this_thread::sleep_for(milliseconds(50));
		t->close();
	});

	wire_frame frame;
	bool received = true;
	const auto start = steady_clock::now();
	ASSERT_EQ(transport_error::DISCONNECTED, t->poll_receive(frame, received, seconds(10)));
	ASSERT_FALSE(received);
	ASSERT_LT(steady_clock::now() - start, seconds(5));
	closer.join();
}

TEST(transport_test, polling_unreachable)
{
	auto peer = std::make_shared<fake_opamp_peer>();
	peer->set_reachable(false);
	auto t = transport::polling(std::unique_ptr<http_channel>(new fake_http_channel(peer)));

	ASSERT_EQ(transport_error::DISCONNECTED, t->connect());
	ASSERT_EQ(1u, peer->connection_attempts());
}

TEST(transport_test, streaming_round_trip)
{
	auto peer = std::make_shared<fake_opamp_peer>();
	peer->set_responder(fake_opamp_peer::echo_capabilities(0x81));
	auto t = transport::streaming(std::unique_ptr<stream_channel>(new fake_stream_channel(peer)));

	ASSERT_EQ(transport::kind::STREAMING, t->get_kind());
	ASSERT_EQ(transport_error::NONE, t->connect());

	opampproto::AgentToServer hello;
	hello.set_sequence_num(1);
	ASSERT_EQ(transport_error::NONE, t->send(encode(hello)));

	wire_frame frame;
	bool received = false;
	ASSERT_EQ(transport_error::NONE, t->poll_receive(frame, received, seconds(5)));
	ASSERT_TRUE(received);

	opampproto::ServerToAgent reply;
	protocol::frame_to_protobuf(frame, &reply);
	ASSERT_EQ(0x81u, reply.capabilities());
	ASSERT_EQ(1u, reply.sequence_num());
}

TEST(transport_test, streaming_timeout_is_not_an_error)
{
	auto peer = std::make_shared<fake_opamp_peer>();
	auto t = transport::streaming(std::unique_ptr<stream_channel>(new fake_stream_channel(peer)));
	ASSERT_EQ(transport_error::NONE, t->connect());

	wire_frame frame;
	bool received = true;
	ASSERT_EQ(transport_error::NONE, t->poll_receive(frame, received, milliseconds(20)));
	ASSERT_FALSE(received);
}

TEST(transport_test, streaming_dropped_connection)
{
	auto peer = std::make_shared<fake_opamp_peer>();
	auto t = transport::streaming(std::unique_ptr<stream_channel>(new fake_stream_channel(peer)));
	ASSERT_EQ(transport_error::NONE, t->connect());

	peer->drop_connection();

	wire_frame frame;
	bool received = true;
	ASSERT_EQ(transport_error::DISCONNECTED, t->poll_receive(frame, received, seconds(1)));
	ASSERT_EQ(transport_error::DISCONNECTED, t->send(encode(opampproto::AgentToServer())));
}

TEST(transport_test, streaming_closed_transport_is_disconnected)
{
	auto peer = std::make_shared<fake_opamp_peer>();
	auto t = transport::streaming(std::unique_ptr<stream_channel>(new fake_stream_channel(peer)));
	ASSERT_EQ(transport_error::NONE, t->connect());

	t->close();

	wire_frame frame;
	bool received = true;
	ASSERT_EQ(transport_error::DISCONNECTED, t->poll_receive(frame, received, seconds(1)));
	ASSERT_FALSE(received);
}

TEST(transport_test, create_picks_variant_from_scheme)
{
	endpoint_settings settings;

	settings.url = "http://localhost:4320/v1/opamp";
	auto polling = transport::create(settings);
	ASSERT_NE(nullptr, polling);
	ASSERT_EQ(transport::kind::POLLING, polling->get_kind());

	settings.url = "wss://localhost:4320/v1/opamp";
	auto streaming = transport::create(settings);
	ASSERT_NE(nullptr, streaming);
	ASSERT_EQ(transport::kind::STREAMING, streaming->get_kind());

	settings.url = "ftp://localhost/v1/opamp";
	ASSERT_EQ(nullptr, transport::create(settings));
}
