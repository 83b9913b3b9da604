/**
 * @file
 *
 * In-memory http_channel and stream_channel talking to a fake_opamp_peer.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "fake_opamp_peer.h"
#include "http_channel.h"
#include "stream_channel.h"
#include "transport.h"

#include <atomic>
#include <memory>

namespace test_helpers
{

/**
 * Every POST is delivered to the peer; the oldest reply queued by then
 * becomes the response body.
 */
class fake_http_channel : public opamp::http_channel
{
public:
	explicit fake_http_channel(const fake_opamp_peer::ptr& peer);

	opamp::transport_error head(int& status) override;
	opamp::transport_error post(const std::string& body,
	                            const std::string& content_encoding,
	                            opamp::http_response& response) override;
	void close() override;

private:
	fake_opamp_peer::ptr m_peer;
	std::atomic<uint64_t> m_connection;
};

/**
 * Frames travel with the WebSocket header varint, just like on the
 * wire.
 */
class fake_stream_channel : public opamp::stream_channel
{
public:
	explicit fake_stream_channel(const fake_opamp_peer::ptr& peer);

	opamp::transport_error open() override;
	opamp::transport_error send_frame(const std::string& data) override;
	opamp::transport_error receive_frame(std::string& data,
	                                     bool& received,
	                                     std::chrono::milliseconds timeout) override;
	void close() override;

private:
	fake_opamp_peer::ptr m_peer;
	std::atomic<uint64_t> m_connection;
	std::atomic<bool> m_closed;
};

/**
 * @return a transport factory for opamp_client that connects every new
 *         transport of the given kind to the peer
 */
std::function<std::shared_ptr<opamp::transport>(const opamp::endpoint_settings&)>
fake_transport_factory(const fake_opamp_peer::ptr& peer, opamp::transport::kind kind);

}  // namespace test_helpers
