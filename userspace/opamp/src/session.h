/**
 * @file
 *
 * Interface to session.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "capabilities.h"
#include "client_config.h"
#include "collaborators.h"
#include "compression_negotiator.h"
#include "extension_registry.h"
#include "instance_uid.h"
#include "outbound_queue.h"
#include "package_status_tracker.h"
#include "sequencer.h"
#include "session_state_machine.h"
#include "transport.h"
#include "opamp.pb.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace opamp
{

class protobuf_compressor;

/**
 * Protocol state shared by the send and receive tasks of one client:
 * connection state, instance uid, sequence counters, negotiated
 * features and the outbound queue. Every member is guarded by one lock.
 *
 * Collaborators (config store, certificate and package managers,
 * custom message handlers) are always called without the lock held.
 * The listener's on_state_change and on_backpressure are called with
 * the lock held and must not call back into the client.
 *
 * Each transport connection gets a new generation number; reports
 * tagged with an older generation are ignored.
 */
class session
{
public:
	using state = session_state_machine::state;
	using event = session_state_machine::event;

	struct collaborators
	{
		config_store::ptr config;
		health_reporter::ptr health;
		certificate_manager::ptr certificates;
		package_manager::ptr packages;
		session_listener::ptr listener;
	};

	session(const client_config& config,
	        const collaborators& collab,
	        extension_registry& registry);

	~session();

	//
	// Lifecycle, driven by the send task
	//

	/**
	 * IDLE -> CONNECTING.
	 */
	bool start();

	/**
	 * A transport of the given kind is connected. Applies the resumption
	 * policy and restarts compression negotiation.
	 *
	 * @return the generation of the new connection
	 */
	uint64_t begin_connection(transport::kind kind);

	/**
	 * The connection of the given generation was lost. Stale reports are
	 * ignored.
	 */
	void on_disconnected(uint64_t generation);

	/**
	 * @return true if the given generation is no longer the live one
	 */
	bool connection_lost(uint64_t generation) const;

	/**
	 * Stop accepting new reports and wake every wait. Does not change
	 * the state.
	 */
	void request_stop();

	bool stop_requested() const;

	/**
	 * Move to CLOSED.
	 */
	void shutdown();

	/**
	 * @return true, with the reason, if the session closed on an
	 *         unrecoverable configuration error
	 */
	bool fatal_error(std::string& reason) const;

	//
	// Outbound envelopes
	//

	/**
	 * The first envelope of a connection: instance uid, sequence number,
	 * agent description and capabilities.
	 */
	void build_hello(opampproto::AgentToServer& out);

	/**
	 * Move pending data into out and stamp it.
	 *
	 * @param force build an envelope even when nothing is pending
	 * @return false if there was nothing to send
	 */
	bool build_envelope(opampproto::AgentToServer& out, bool force);

	/**
	 * The final envelope: whatever is pending plus AgentDisconnect.
	 */
	void build_disconnect(opampproto::AgentToServer& out);

	/**
	 * Give an envelope that failed to send a fresh sequence number before
	 * it is sent again.
	 */
	void restamp(opampproto::AgentToServer& out);

	std::shared_ptr<protobuf_compressor> outbound_compressor() const;

	/**
	 * Wait until the handshake of the given connection finished or failed.
	 *
	 * @return the state at the end of the wait
	 */
	state wait_for_handshake(uint64_t generation, std::chrono::milliseconds timeout);

	/**
	 * Wait until there is something to send, the connection is lost or a
	 * stop is requested.
	 *
	 * @return true if there is something to send
	 */
	bool wait_for_outbound(uint64_t generation, std::chrono::milliseconds timeout);

	/**
	 * @return whether anything is still queued, including fields held
	 *         until negotiation completes
	 */
	bool has_outbound() const;

	/**
	 * Ask the health reporter for the current health and queue it when it
	 * differs from the last reported value.
	 *
	 * @return true if a new health value was queued
	 */
	bool poll_health();

	//
	// Inbound envelopes, driven by the receive task
	//

	void handle_inbound(const opampproto::ServerToAgent& msg, uint64_t generation);

	/**
	 * An inbound frame could not be decoded.
	 */
	void on_decode_failure(uint64_t generation);

	//
	// Reports from the agent
	//

	bool report_health(const agent_health& health);

	/**
	 * Pull the effective configuration from the config store and queue it.
	 */
	bool report_effective_config();

	/**
	 * @return false if the transition is illegal or the client is stopping
	 */
	bool report_package_status(const package_status& status);

	/**
	 * @return false if the client is stopping
	 */
	bool send_custom_message(const custom_message& msg);

	/**
	 * Queue the capabilities currently in the extension registry.
	 */
	void update_custom_capabilities();

	//
	// Retry and connection settings
	//

	bool take_server_advised_delay(std::chrono::milliseconds& delay);

	/**
	 * @return true, with the new settings, if the server moved the
	 *         endpoint since the last call
	 */
	bool take_endpoint_change(endpoint_settings& settings);

	std::chrono::milliseconds poll_interval() const;

	//
	// Queries
	//

	state get_state() const;

	/**
	 * Wait until the session reaches the given state.
	 *
	 * @return false on timeout
	 */
	bool wait_for_state(state expected, std::chrono::milliseconds timeout);

	instance_uid get_instance_uid() const;
	feature_set effective_features() const;
	bool features_negotiated() const;
	compression_method selected_compression() const;
	uint64_t last_sent_sequence() const;
	uint64_t last_received_sequence() const;
	uint64_t dropped_messages() const;
	std::string last_remote_config_hash() const;

private:
	// Work collected under the lock and carried out without it
	struct inbound_actions;

	void transition(event e);
	void degrade(const char* reason);
	outbound_queue::disposition gate(outbound_queue::field f) const;
	void stamp(opampproto::AgentToServer& out);
	bool negotiate(uint64_t server_caps);
	void collect_inbound(const opampproto::ServerToAgent& msg, inbound_actions& actions);
	void run_collaborators(inbound_actions& actions);
	void queue_results(const inbound_actions& actions);
	void gather_full_report(inbound_actions& actions);
	void queue_full_report(const inbound_actions& actions);
	bool can_accept_reports() const;
	opampproto::AgentDescription describe() const;

	mutable std::mutex m_lock;
	std::condition_variable m_cv;

	const client_config m_config;
	const collaborators m_collab;
	extension_registry& m_registry;

	std::unique_ptr<session_state_machine> m_fsm;
	instance_uid m_uid;
	sequencer m_sequencer;
	compression_negotiator m_compression;
	outbound_queue m_queue;
	package_status_tracker m_packages;

	feature_set m_local;
	feature_set m_effective;
	uint64_t m_server_caps;
	bool m_negotiated;

	uint64_t m_generation;
	bool m_connection_up;
	bool m_stopping;
	bool m_force_send;
	std::string m_fatal_reason;

	bool m_have_advised_delay;
	std::chrono::milliseconds m_advised_delay;
	endpoint_settings m_endpoint;
	bool m_endpoint_changed;
	std::chrono::milliseconds m_poll_interval;

	// Last values, kept for full state reports
	opampproto::RemoteConfigStatus m_remote_config_status;
	std::string m_last_remote_config_hash;
	bool m_have_health;
	agent_health m_last_health;
};

} // namespace opamp
