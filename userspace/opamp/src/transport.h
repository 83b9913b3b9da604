/**
 * @file
 *
 * Interface to transport.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "endpoint_settings.h"
#include "http_channel.h"
#include "protocol.h"
#include "stream_channel.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

namespace opamp
{

/**
 * Moves wire frames between the engine and the server over one of two
 * variants. The variant is fixed at construction and the engine never
 * needs to know which one it talks to.
 *
 * POLLING: every send() is one HTTP POST; the reply (if any) is kept
 *          and handed out by the next poll_receive().
 * STREAMING: send() writes one WebSocket message; poll_receive() reads
 *          inbound messages in the order they arrive.
 *
 * send() and poll_receive() may be called from different threads.
 */
class transport
{
public:
	enum class kind
	{
		POLLING,
		STREAMING
	};

	static std::unique_ptr<transport> polling(std::unique_ptr<http_channel> channel);
	static std::unique_ptr<transport> streaming(std::unique_ptr<stream_channel> channel);

	/**
	 * Pick the variant from the url scheme and build the Poco channel.
	 *
	 * @return nullptr if the scheme is not http, https, ws or wss
	 */
	static std::unique_ptr<transport> create(const endpoint_settings& settings);

	kind get_kind() const { return m_kind; }

	/**
	 * POLLING: check reachability with a HEAD request; only a 404 or a
	 *          network failure is an error.
	 * STREAMING: open the WebSocket.
	 */
	transport_error connect();

	transport_error send(const wire_frame& frame);

	/**
	 * Wait up to timeout for one inbound frame.
	 */
	transport_error poll_receive(wire_frame& frame,
	                             bool& received,
	                             std::chrono::milliseconds timeout);

	/**
	 * Abort in-flight I/O. Blocked callers return DISCONNECTED.
	 */
	void close();

	static const char* to_string(kind k);

private:
	transport(kind k,
	          std::unique_ptr<http_channel> http,
	          std::unique_ptr<stream_channel> stream);

	transport_error polling_send(const wire_frame& frame);
	transport_error polling_receive(wire_frame& frame,
	                                bool& received,
	                                std::chrono::milliseconds timeout);
	transport_error streaming_receive(wire_frame& frame,
	                                  bool& received,
	                                  std::chrono::milliseconds timeout);

	const kind m_kind;
	std::unique_ptr<http_channel> m_http;
	std::unique_ptr<stream_channel> m_stream;

	// Replies stored by polling sends, guarded by m_lock
	std::mutex m_lock;
	std::condition_variable m_cv;
	std::deque<wire_frame> m_replies;
	bool m_closed;
};

} // namespace opamp
