/**
 * @file
 *
 * Interface to fake_opamp_peer -- the server end of the in-memory
 * channels used by the engine tests.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "protocol.h"
#include "opamp.pb.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace test_helpers
{

/**
 * Plays the server. Every envelope the agent sends is decoded and kept;
 * the optional responder may queue replies for it. Replies are handed
 * to whichever fake channel is currently connected.
 *
 * One peer outlives any number of connections: drop_connection() breaks
 * the current one and the agent is free to connect again.
 */
class fake_opamp_peer
{
public:
	using ptr = std::shared_ptr<fake_opamp_peer>;
	using clock = std::chrono::steady_clock;

	// Called, without any lock held, for every envelope the agent sends
	using responder = std::function<void(const opampproto::AgentToServer&, fake_opamp_peer&)>;

	enum class receive_result
	{
		FRAME,
		TIMEOUT,
		DISCONNECTED
	};

	fake_opamp_peer();

	void set_responder(const responder& r);

	/**
	 * Queue a message for the agent.
	 */
	void reply(const opampproto::ServerToAgent& msg,
	           opamp::compression_method encoding = opamp::compression_method::NONE);

	/**
	 * Queue a frame as is, for example one that does not decode.
	 */
	void reply_raw(const opamp::wire_frame& frame);

	/**
	 * Break the current connection. Pending and future operations on it
	 * fail with DISCONNECTED.
	 */
	void drop_connection();

	/**
	 * Make connection attempts fail while false.
	 */
	void set_reachable(bool reachable);

	/**
	 * Make sends on the current connection fail while true.
	 */
	void set_fail_sends(bool fail);

	//
	// Agent side, used by the fake channels
	//

	/**
	 * @return the id of the new connection, or 0 if unreachable
	 */
	uint64_t accept_connection();

	/**
	 * Record one envelope from the agent.
	 */
	opamp::transport_error deliver(uint64_t connection, const opamp::wire_frame& frame);

	/**
	 * Take the oldest reply, waiting up to timeout. The abort delegate is
	 * checked while waiting.
	 */
	receive_result next_reply(uint64_t connection,
	                          opamp::wire_frame& frame,
	                          std::chrono::milliseconds timeout,
	                          const std::function<bool()>& aborted);

	/**
	 * Take the oldest reply without waiting.
	 */
	bool pop_reply(uint64_t connection, opamp::wire_frame& frame);

	bool connection_alive(uint64_t connection) const;

	/**
	 * Wake any wait in next_reply() so it rechecks its abort delegate.
	 */
	void wake();

	//
	// Inspection, used by the tests
	//

	std::vector<opampproto::AgentToServer> received() const;

	std::vector<opamp::compression_method> received_encodings() const;

	size_t received_count() const;

	/**
	 * Wait until at least count envelopes arrived.
	 */
	bool wait_for_received(size_t count, std::chrono::milliseconds timeout) const;

	/**
	 * Wait until some received envelope matches the predicate.
	 */
	bool wait_for(const std::function<bool(const opampproto::AgentToServer&)>& pred,
	              std::chrono::milliseconds timeout,
	              opampproto::AgentToServer* match = nullptr) const;

	uint32_t connection_attempts() const;

	uint32_t connections() const;

	/**
	 * @return a responder that answers every envelope with the given
	 *         capabilities and an increasing sequence number
	 */
	static responder echo_capabilities(uint64_t server_caps);

	/**
	 * Next server sequence number, for tests which script replies by hand.
	 */
	uint64_t next_sequence();

private:
	mutable std::mutex m_lock;
	mutable std::condition_variable m_cv;

	responder m_responder;
	std::deque<opamp::wire_frame> m_replies;
	std::vector<opampproto::AgentToServer> m_received;
	std::vector<opamp::compression_method> m_encodings;

	uint64_t m_connection;
	bool m_connected;
	bool m_reachable;
	bool m_fail_sends;
	uint32_t m_attempts;
	uint32_t m_connections;
	uint64_t m_sequence;
};

}  // namespace test_helpers
