/**
 * @file
 *
 * Interface to send_task.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "client_config.h"
#include "reconnect_backoff.h"
#include "running_state_runnable.h"
#include "session.h"
#include "transport_holder.h"
#include "opamp.pb.h"

#include <chrono>
#include <functional>
#include <memory>

namespace opamp
{

/**
 * Owns the connection: connects with backoff, runs the handshake, sends
 * queued data and heartbeats in sequence order, and on shutdown makes a
 * final flush carrying AgentDisconnect.
 *
 * An unrecoverable configuration error (a required feature the server
 * does not offer) is raised as a watchdog_runnable_fatal_error.
 */
class send_task : public running_state_runnable
{
public:
	using transport_factory =
		std::function<std::shared_ptr<transport>(const endpoint_settings&)>;

	send_task(running_state& state,
	          session& s,
	          transport_holder& holder,
	          const client_config& config,
	          const transport_factory& factory,
	          const reconnect_backoff::random_source& random = reconnect_backoff::random_source());

	void do_run() override;

	/**
	 * The default factory: transport::create().
	 */
	static std::shared_ptr<transport> create_transport(const endpoint_settings& settings);

private:
	using clock = std::chrono::steady_clock;

	/**
	 * Wait out the backoff, connect and run the handshake.
	 *
	 * @return true if the session is connected
	 */
	bool connect();

	/**
	 * Serialize, compress and send.
	 *
	 * @return false if the transport failed
	 */
	bool send(const opampproto::AgentToServer& msg,
	          const std::shared_ptr<protobuf_compressor>& compressor);

	void disconnect(const char* why);

	void final_flush();

	/**
	 * Sample the health reporter once per poll interval.
	 */
	void poll_health();

	bool heartbeat_enabled() const;

	session& m_session;
	transport_holder& m_holder;
	const client_config m_config;
	transport_factory m_factory;
	reconnect_backoff m_backoff;
	endpoint_settings m_endpoint;

	std::shared_ptr<transport> m_transport;
	uint64_t m_generation;
	clock::time_point m_next_heartbeat;
	clock::time_point m_next_health_poll;

	// An envelope which the transport failed to send
	bool m_have_in_flight;
	opampproto::AgentToServer m_in_flight;
};

} // namespace opamp
