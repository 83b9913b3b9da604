/**
 * @file
 *
 * Interface to opamp_client.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "client_config.h"
#include "collaborators.h"
#include "extension_registry.h"
#include "receive_task.h"
#include "running_state.h"
#include "send_task.h"
#include "session.h"
#include "transport_holder.h"

#include <Poco/Thread.h>

#include <chrono>
#include <mutex>
#include <string>

namespace opamp
{

/**
 * An OpAMP client embedded in an agent process. start() launches a send
 * and a receive thread; stop() flushes, says goodbye to the server and
 * joins them within the configured grace period.
 *
 * The report functions may be called from any thread.
 */
class opamp_client
{
public:
	using transport_factory = send_task::transport_factory;

	/**
	 * @param factory builds the transport for an endpoint; the default
	 *        picks polling or streaming from the url scheme
	 */
	opamp_client(const client_config& config,
	             const session::collaborators& collab,
	             const transport_factory& factory = transport_factory(),
	             const reconnect_backoff::random_source& random = reconnect_backoff::random_source());

	~opamp_client();

	void start();

	/**
	 * Stop the client. Safe to call more than once.
	 */
	void stop();

	/**
	 * @return false once the client was stopped or died of a fatal error
	 */
	bool is_running() const;

	bool report_health(const agent_health& health);

	/**
	 * The config store's effective configuration changed.
	 */
	bool report_effective_config_changed();

	bool report_package_status(const package_status& status);

	/**
	 * Queue a custom message. When the queue is full the oldest message
	 * is dropped and the listener's on_backpressure is called.
	 */
	bool send_custom_message(const custom_message& msg);

	bool register_custom_handler(const std::string& capability,
	                             const extension_registry::handler& h);

	bool unregister_custom_handler(const std::string& capability);

	session::state get_state() const;

	bool wait_for_state(session::state expected, std::chrono::milliseconds timeout);

	instance_uid get_instance_uid() const;

	feature_set effective_features() const;

	/**
	 * Why the client stopped, if it did.
	 */
	std::string stop_reason() const;

	const session& get_session() const { return m_session; }

private:
	const client_config m_config;
	extension_registry m_registry;
	running_state m_running_state;
	session m_session;
	transport_holder m_holder;
	send_task m_send_task;
	receive_task m_receive_task;
	Poco::Thread m_send_thread;
	Poco::Thread m_receive_thread;

	std::mutex m_lifecycle_lock;
	bool m_started;
	bool m_stopped;
};

} // namespace opamp
