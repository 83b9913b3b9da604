/**
 * @file
 *
 * Implementation of session.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "session.h"
#include "agent_description.h"
#include "common_logger.h"
#include "protobuf_compression.h"

#include <cinttypes>

COMMON_LOGGER();

namespace opamp
{

struct session::inbound_actions
{
	bool accepted = false;
	bool full_report = false;
	bool full_state_marker = false;

	bool server_error = false;
	std::string error_type;
	std::string error_message;

	bool uid_changed = false;
	std::string old_uid;
	std::string new_uid;

	bool have_remote_config = false;
	remote_config config;
	apply_result config_result;
	bool have_effective = false;
	effective_config effective;

	bool have_connection_settings = false;
	std::string settings_hash;
	bool have_certificate = false;
	certificate_offer cert_offer;
	certificate_result cert_result;

	bool have_packages = false;
	packages_available packages;
	std::string packages_error;

	bool restart = false;

	bool have_custom = false;
	custom_message custom;

	// Full state report gathered from the collaborators
	bool have_full_health = false;
	agent_health full_health;
	bool have_full_effective = false;
	effective_config full_effective;
};

namespace
{

opampproto::ComponentHealth to_proto(const agent_health& health)
{
	opampproto::ComponentHealth ret;

	ret.set_healthy(health.healthy);
	ret.set_start_time_unix_nano(health.start_time_unix_nano);
	ret.set_status_time_unix_nano(health.status_time_unix_nano);
	ret.set_status(health.status);
	ret.set_last_error(health.last_error);
	return ret;
}

opampproto::EffectiveConfig to_proto(const effective_config& config)
{
	opampproto::EffectiveConfig ret;

	for (const auto& file : config.files)
	{
		opampproto::AgentConfigFile& out =
			(*ret.mutable_config_map()->mutable_config_map())[file.first];
		out.set_body(file.second.body);
		out.set_content_type(file.second.content_type);
	}
	ret.set_config_hash(config.hash);
	return ret;
}

remote_config from_proto(const opampproto::AgentRemoteConfig& config)
{
	remote_config ret;

	ret.hash = config.config_hash();
	for (const auto& file : config.config().config_map())
	{
		config_file& out = ret.files[file.first];
		out.body = file.second.body();
		out.content_type = file.second.content_type();
	}
	return ret;
}

certificate_offer from_proto(const std::string& settings_hash,
                             const opampproto::TLSCertificate& cert)
{
	certificate_offer ret;

	ret.settings_hash = settings_hash;
	ret.certificate.cert = cert.cert();
	ret.certificate.private_key = cert.private_key();
	ret.certificate.ca_cert = cert.ca_cert();
	return ret;
}

// Status time moves on every sample, so it does not count as a change
bool same_health(const agent_health& a, const agent_health& b)
{
	return a.healthy == b.healthy &&
	       a.start_time_unix_nano == b.start_time_unix_nano &&
	       a.status == b.status &&
	       a.last_error == b.last_error;
}

feature required_feature(const outbound_queue::field f)
{
	switch (f)
	{
	case outbound_queue::field::HEALTH:
		return feature::HEALTH;
	case outbound_queue::field::EFFECTIVE_CONFIG:
		return feature::EFFECTIVE_CONFIG;
	case outbound_queue::field::REMOTE_CONFIG_STATUS:
		return feature::REMOTE_CONFIG;
	case outbound_queue::field::PACKAGE_STATUSES:
		return feature::PACKAGE_STATUSES;
	case outbound_queue::field::CONNECTION_SETTINGS_STATUS:
		return feature::CONNECTION_SETTINGS;
	case outbound_queue::field::AGENT_DESCRIPTION:
	case outbound_queue::field::CUSTOM_CAPABILITIES:
	case outbound_queue::field::CUSTOM_MESSAGE:
		break;
	}
	return feature::CUSTOM_CAPABILITIES;
}

} // namespace

session::session(const client_config& config,
                 const collaborators& collab,
                 extension_registry& registry) :
	m_config(config),
	m_collab(collab),
	m_registry(registry),
	m_fsm(build_session_fsm(this)),
	m_sequencer(config.require_sequencing),
	m_compression(config.compression),
	m_queue(config.queue_bound),
	m_local(config.local_features),
	m_server_caps(0),
	m_negotiated(false),
	m_generation(0),
	m_connection_up(false),
	m_stopping(false),
	m_force_send(false),
	m_have_advised_delay(false),
	m_advised_delay(0),
	m_endpoint(config.endpoint),
	m_endpoint_changed(false),
	m_poll_interval(config.poll_interval),
	m_have_health(false)
{
	if (!config.instance_uid.empty() &&
	    instance_uid::from_string(config.instance_uid, m_uid))
	{
		LOG_INFO("Using configured instance uid %s", m_uid.to_string().c_str());
	}
	else
	{
		if (!config.instance_uid.empty())
		{
			LOG_WARNING("Configured instance uid %s is not a UUID, generating one",
			            config.instance_uid.c_str());
		}
		m_uid = instance_uid::generate();
		LOG_INFO("Generated instance uid %s", m_uid.to_string().c_str());
	}

	if (m_local.has(feature::GZIP_COMPRESSION) &&
	    !m_compression.supports(compression_method::GZIP))
	{
		m_local.clear(feature::GZIP_COMPRESSION);
	}
}

session::~session()
{
}

bool session::start()
{
	std::lock_guard<std::mutex> lock(m_lock);

	if (m_fsm->get_state() != state::IDLE)
	{
		LOG_WARNING("Session already started");
		return false;
	}
	transition(event::START);
	return true;
}

uint64_t session::begin_connection(const transport::kind kind)
{
	std::lock_guard<std::mutex> lock(m_lock);

	const bool reset = m_config.resumption_policy == client_config::resumption::RESET ||
	                   (m_config.resumption_policy == client_config::resumption::AUTO &&
	                    kind == transport::kind::STREAMING);
	if (reset)
	{
		m_sequencer.reset();
	}

	m_compression.reset();
	++m_generation;
	m_connection_up = true;
	m_force_send = false;

	LOG_INFO("Connection %" PRIu64 " established over %s transport, sequence %s",
	         m_generation,
	         transport::to_string(kind),
	         reset ? "restarted" : "resumed");
	return m_generation;
}

void session::on_disconnected(const uint64_t generation)
{
	std::lock_guard<std::mutex> lock(m_lock);

	if (generation != m_generation || !m_connection_up)
	{
		LOG_DEBUG("Ignoring disconnect of stale connection %" PRIu64, generation);
		return;
	}

	LOG_WARNING("Connection %" PRIu64 " lost", generation);
	m_connection_up = false;
	transition(event::DISCONNECTED);
	m_cv.notify_all();
}

bool session::connection_lost(const uint64_t generation) const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return generation != m_generation || !m_connection_up;
}

void session::request_stop()
{
	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_stopping = true;
	}
	m_cv.notify_all();
}

bool session::stop_requested() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_stopping;
}

void session::shutdown()
{
	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_stopping = true;
		m_connection_up = false;
		if (m_fsm->get_state() != state::CLOSED)
		{
			transition(event::SHUTDOWN);
		}
	}
	m_cv.notify_all();
}

bool session::fatal_error(std::string& reason) const
{
	std::lock_guard<std::mutex> lock(m_lock);

	if (m_fatal_reason.empty())
	{
		return false;
	}
	reason = m_fatal_reason;
	return true;
}

void session::build_hello(opampproto::AgentToServer& out)
{
	std::lock_guard<std::mutex> lock(m_lock);

	out.Clear();
	*out.mutable_agent_description() = describe();
	stamp(out);
}

bool session::build_envelope(opampproto::AgentToServer& out, const bool force)
{
	std::lock_guard<std::mutex> lock(m_lock);

	out.Clear();
	const bool moved = m_queue.take([this](outbound_queue::field f) { return gate(f); },
	                                out);
	if (!moved && !force && !m_force_send)
	{
		return false;
	}

	m_force_send = false;
	stamp(out);
	return true;
}

void session::build_disconnect(opampproto::AgentToServer& out)
{
	std::lock_guard<std::mutex> lock(m_lock);

	out.Clear();
	m_queue.take([this](outbound_queue::field f) { return gate(f); }, out);
	out.mutable_agent_disconnect();
	stamp(out);
}

void session::restamp(opampproto::AgentToServer& out)
{
	std::lock_guard<std::mutex> lock(m_lock);
	stamp(out);
}

std::shared_ptr<protobuf_compressor> session::outbound_compressor() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_compression.compressor();
}

session::state session::wait_for_handshake(const uint64_t generation,
                                           const std::chrono::milliseconds timeout)
{
	std::unique_lock<std::mutex> lock(m_lock);

	m_cv.wait_for(lock, timeout, [this, generation]()
	{
		return m_fsm->get_state() != state::CONNECTING ||
		       generation != m_generation ||
		       !m_connection_up ||
		       m_stopping;
	});
	return m_fsm->get_state();
}

bool session::wait_for_outbound(const uint64_t generation,
                                const std::chrono::milliseconds timeout)
{
	std::unique_lock<std::mutex> lock(m_lock);

	m_cv.wait_for(lock, timeout, [this, generation]()
	{
		return !m_queue.empty() ||
		       m_force_send ||
		       generation != m_generation ||
		       !m_connection_up ||
		       m_stopping;
	});
	return !m_queue.empty() || m_force_send;
}

bool session::has_outbound() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return !m_queue.empty();
}

void session::handle_inbound(const opampproto::ServerToAgent& msg, const uint64_t generation)
{
	inbound_actions actions;

	{
		std::lock_guard<std::mutex> lock(m_lock);

		if (generation != m_generation || !m_connection_up ||
		    m_fsm->get_state() == state::CLOSED)
		{
			LOG_DEBUG("Ignoring message from stale connection %" PRIu64, generation);
			return;
		}

		collect_inbound(msg, actions);
	}

	if (!actions.accepted)
	{
		return;
	}

	if (actions.full_report)
	{
		gather_full_report(actions);
	}
	run_collaborators(actions);

	{
		std::lock_guard<std::mutex> lock(m_lock);

		queue_results(actions);
		if (actions.full_state_marker && generation == m_generation)
		{
			const state s = m_fsm->get_state();
			if (s == state::DEGRADED || s == state::CONNECTED)
			{
				LOG_INFO("Full server state applied");
				transition(event::FULL_STATE_APPLIED);
			}
		}
	}
	m_cv.notify_all();

	if (m_collab.listener)
	{
		if (actions.server_error)
		{
			m_collab.listener->on_server_error(actions.error_type, actions.error_message);
		}
		if (actions.uid_changed)
		{
			m_collab.listener->on_instance_uid_changed(actions.old_uid, actions.new_uid);
		}
		if (actions.restart)
		{
			m_collab.listener->on_restart_requested();
		}
	}
}

void session::collect_inbound(const opampproto::ServerToAgent& msg, inbound_actions& actions)
{
	const uint64_t seq = msg.sequence_num();
	const sequencer::verdict verdict = m_sequencer.validate_inbound(seq);
	if (verdict == sequencer::verdict::DUPLICATE_DISCARD)
	{
		const state current = m_fsm->get_state();

		if (seq != 0 && current == state::CONNECTING && msg.capabilities() != 0)
		{
			// Handshake reply from a server that lost our resumed numbering
			m_sequencer.rebaseline_inbound(seq);
		}
		else if ((current == state::CONNECTED || current == state::DEGRADED) &&
		         m_sequencer.is_restart(seq))
		{
			m_sequencer.rebaseline_inbound(seq);
			degrade("server sequence restart");
		}
		else
		{
			return;
		}
	}
	actions.accepted = true;

	if (verdict == sequencer::verdict::GAP_DETECTED)
	{
		degrade("sequence gap");
	}

	if (msg.has_error_response())
	{
		const opampproto::ServerErrorResponse& err = msg.error_response();

		actions.server_error = true;
		actions.error_type = opampproto::ServerErrorResponseType_Name(err.type());
		actions.error_message = err.error_message();
		LOG_WARNING("Server error response %s: %s",
		            actions.error_type.c_str(),
		            actions.error_message.c_str());

		if (err.type() == opampproto::ServerErrorResponseType_Unavailable &&
		    err.has_retry_info())
		{
			m_advised_delay = std::chrono::milliseconds(
				err.retry_info().retry_after_nanoseconds() / 1000000);
			m_have_advised_delay = true;
		}
	}

	if (msg.capabilities() != 0)
	{
		if (m_fsm->get_state() == state::CONNECTING)
		{
			if (!negotiate(msg.capabilities()))
			{
				return;
			}
			m_compression.negotiate(m_effective, m_server_caps);
			transition(event::HANDSHAKE_COMPLETE);
			actions.full_report = true;
		}
		else if (msg.capabilities() != m_server_caps)
		{
			LOG_INFO("Server capabilities changed");
			if (!negotiate(msg.capabilities()))
			{
				return;
			}
		}
	}

	const state current = m_fsm->get_state();
	if (current != state::CONNECTED && current != state::DEGRADED)
	{
		LOG_DEBUG("Handshake not complete, ignoring message content");
		return;
	}

	if (msg.flags() & opampproto::ServerToAgentFlags_ReportFullState)
	{
		degrade("server asked for full state");
		actions.full_report = true;
	}

	if (msg.has_agent_identification())
	{
		instance_uid next;

		if (!instance_uid::from_bytes(msg.agent_identification().new_instance_uid(), next) ||
		    next.is_nil())
		{
			LOG_WARNING("Ignoring invalid instance uid from server");
		}
		else if (next != m_uid)
		{
			actions.uid_changed = true;
			actions.old_uid = m_uid.to_string();
			actions.new_uid = next.to_string();
			LOG_INFO("Server assigned instance uid %s (was %s)",
			         actions.new_uid.c_str(),
			         actions.old_uid.c_str());
			m_uid = next;
			m_queue.set_agent_description(describe());
		}
	}

	if (msg.has_remote_config())
	{
		const std::string& hash = msg.remote_config().config_hash();

		if (!m_effective.has(feature::REMOTE_CONFIG))
		{
			LOG_WARNING("Capability not negotiated, ignoring remote config");
		}
		else if (!hash.empty() && hash == m_last_remote_config_hash)
		{
			LOG_DEBUG("Remote config unchanged, not applying it again");
		}
		else
		{
			actions.have_remote_config = true;
			actions.config = from_proto(msg.remote_config());
		}
	}

	if (msg.has_connection_settings())
	{
		if (!m_effective.has(feature::CONNECTION_SETTINGS))
		{
			LOG_WARNING("Capability not negotiated, ignoring connection settings");
		}
		else
		{
			const opampproto::ConnectionSettingsOffers& offers = msg.connection_settings();

			actions.have_connection_settings = true;
			actions.settings_hash = offers.hash();

			if (offers.has_opamp())
			{
				const opampproto::OpAMPConnectionSettings& opamp = offers.opamp();
				endpoint_settings next = m_endpoint;

				if (!opamp.destination_endpoint().empty())
				{
					next.url = opamp.destination_endpoint();
				}
				if (opamp.has_headers())
				{
					next.headers.clear();
					for (const auto& header : opamp.headers().headers())
					{
						next.headers[header.key()] = header.value();
					}
				}
				if (next != m_endpoint)
				{
					LOG_INFO("Server moved the endpoint to %s, switching on reconnect",
					         next.url.c_str());
					m_endpoint = next;
					m_endpoint_changed = true;
				}

				if (opamp.heartbeat_interval_seconds() > 0)
				{
					m_poll_interval = std::chrono::seconds(opamp.heartbeat_interval_seconds());
					LOG_INFO("Heartbeat interval set to %" PRIu64 " s",
					         static_cast<uint64_t>(opamp.heartbeat_interval_seconds()));
				}

				if (opamp.has_certificate())
				{
					actions.have_certificate = true;
					actions.cert_offer = from_proto(offers.hash(), opamp.certificate());
				}
			}
		}
	}

	if (msg.has_packages_available())
	{
		if (!m_effective.has(feature::PACKAGES))
		{
			LOG_WARNING("Capability not negotiated, ignoring package offer");
		}
		else
		{
			actions.have_packages = true;
			actions.packages = package_status_tracker::from_proto(msg.packages_available());
			m_packages.on_offered(actions.packages);
		}
	}

	if (msg.has_command() && msg.command().type() == opampproto::CommandType_Restart)
	{
		if (m_effective.has(feature::RESTART_COMMAND))
		{
			LOG_INFO("Server requested a restart");
			actions.restart = true;
		}
		else
		{
			LOG_WARNING("Capability not negotiated, ignoring restart command");
		}
	}

	if (msg.has_custom_message())
	{
		if (m_effective.has(feature::CUSTOM_CAPABILITIES))
		{
			actions.have_custom = true;
			actions.custom.capability = msg.custom_message().capability();
			actions.custom.type = msg.custom_message().type();
			actions.custom.data = msg.custom_message().data();
		}
		else
		{
			LOG_WARNING("Capability not negotiated, ignoring custom message");
		}
	}

	actions.full_state_marker = (msg.flags() & opampproto::ServerToAgentFlags_FullState) != 0;
}

void session::run_collaborators(inbound_actions& actions)
{
	if (actions.have_remote_config)
	{
		if (!m_collab.config)
		{
			actions.config_result = apply_result::failed("no config store");
		}
		else
		{
			try
			{
				actions.config_result = m_collab.config->apply(actions.config);
			}
			catch (const std::exception& ex)
			{
				actions.config_result = apply_result::failed(ex.what());
			}

			if (actions.config_result.result == apply_result::status::APPLIED)
			{
				try
				{
					actions.effective = m_collab.config->current_effective_config();
					actions.have_effective = true;
				}
				catch (const std::exception& ex)
				{
					LOG_ERROR("Unable to read the effective config after apply: %s", ex.what());
				}
			}
		}

		if (actions.config_result.result == apply_result::status::APPLIED)
		{
			LOG_INFO("Applied remote config %s", actions.config.hash.c_str());
		}
		else
		{
			LOG_ERROR("Failed to apply remote config: %s",
			          actions.config_result.reason.c_str());
		}
	}

	if (actions.have_certificate)
	{
		if (!m_collab.certificates)
		{
			actions.cert_result.error = "no certificate manager";
		}
		else
		{
			try
			{
				actions.cert_result = m_collab.certificates->on_certificate_offered(actions.cert_offer);
			}
			catch (const std::exception& ex)
			{
				actions.cert_result = certificate_result();
				actions.cert_result.error = ex.what();
			}
		}

		if (!actions.cert_result.accepted)
		{
			LOG_ERROR("Certificate rejected: %s", actions.cert_result.error.c_str());
		}
	}

	if (actions.have_packages && m_collab.packages)
	{
		try
		{
			m_collab.packages->on_packages_available(actions.packages);
		}
		catch (const std::exception& ex)
		{
			LOG_ERROR("Package manager failed on offer %s: %s",
			          actions.packages.all_packages_hash.c_str(),
			          ex.what());
			actions.packages_error = ex.what();
		}
	}

	if (actions.have_custom)
	{
		if (!m_registry.dispatch(actions.custom))
		{
			LOG_DEBUG("Custom message %s/%s not handled",
			          actions.custom.capability.c_str(),
			          actions.custom.type.c_str());
		}
	}
}

void session::queue_results(const inbound_actions& actions)
{
	if (actions.full_report)
	{
		queue_full_report(actions);
	}

	if (actions.have_remote_config)
	{
		opampproto::RemoteConfigStatus status;

		status.set_last_remote_config_hash(actions.config.hash);
		if (actions.config_result.result == apply_result::status::APPLIED)
		{
			status.set_status(opampproto::RemoteConfigStatuses_APPLIED);
		}
		else
		{
			status.set_status(opampproto::RemoteConfigStatuses_FAILED);
			status.set_error_message(actions.config_result.reason);
		}

		m_last_remote_config_hash = actions.config.hash;
		m_remote_config_status = status;
		m_queue.set_remote_config_status(status);

		if (actions.have_effective)
		{
			m_queue.set_effective_config(to_proto(actions.effective));
		}
	}

	if (actions.have_connection_settings)
	{
		opampproto::ConnectionSettingsStatus status;

		status.set_last_connection_settings_hash(actions.settings_hash);
		status.set_status(opampproto::ConnectionSettingsStatuses_APPLIED);
		if (actions.have_certificate)
		{
			if (actions.cert_result.accepted)
			{
				status.set_active_certificate(actions.cert_result.certificate);
			}
			else
			{
				status.set_status(opampproto::ConnectionSettingsStatuses_FAILED);
				status.set_error_message(actions.cert_result.error);
			}
		}
		m_queue.set_connection_settings_status(status);
	}

	if (actions.have_packages)
	{
		if (!actions.packages_error.empty())
		{
			for (const auto& offered : actions.packages.packages)
			{
				package_status failed;
				failed.name = offered.name;
				failed.state = package_state::FAILED;
				failed.error = actions.packages_error;
				if (!m_packages.update(failed))
				{
					LOG_DEBUG("Package %s keeps its previous state", offered.name.c_str());
				}
			}
		}

		opampproto::PackageStatuses statuses;
		m_packages.to_proto(statuses);
		statuses.set_error_message(actions.packages_error);
		m_queue.set_package_statuses(statuses);
	}
}

void session::gather_full_report(inbound_actions& actions)
{
	if (m_collab.health)
	{
		try
		{
			actions.full_health = m_collab.health->current_health();
			actions.have_full_health = true;
		}
		catch (const std::exception& ex)
		{
			LOG_ERROR("Unable to read agent health: %s", ex.what());
		}
	}

	if (m_collab.config)
	{
		try
		{
			actions.full_effective = m_collab.config->current_effective_config();
			actions.have_full_effective = true;
		}
		catch (const std::exception& ex)
		{
			LOG_ERROR("Unable to read the effective config: %s", ex.what());
		}
	}
}

void session::queue_full_report(const inbound_actions& actions)
{
	LOG_DEBUG("Queueing full agent state");

	m_queue.set_agent_description(describe());

	if (actions.have_full_health)
	{
		m_last_health = actions.full_health;
		m_have_health = true;
	}
	if (m_have_health)
	{
		m_queue.set_health(to_proto(m_last_health));
	}

	if (actions.have_full_effective)
	{
		m_queue.set_effective_config(to_proto(actions.full_effective));
	}

	if (!m_remote_config_status.last_remote_config_hash().empty())
	{
		m_queue.set_remote_config_status(m_remote_config_status);
	}

	if (m_packages.size() > 0)
	{
		opampproto::PackageStatuses statuses;
		m_packages.to_proto(statuses);
		m_queue.set_package_statuses(statuses);
	}

	const std::vector<std::string> custom = m_registry.capabilities();
	if (!custom.empty())
	{
		opampproto::CustomCapabilities caps;
		for (const auto& name : custom)
		{
			caps.add_capabilities(name);
		}
		m_queue.set_custom_capabilities(caps);
	}
}

void session::on_decode_failure(const uint64_t generation)
{
	std::lock_guard<std::mutex> lock(m_lock);

	if (generation != m_generation || !m_connection_up)
	{
		return;
	}
	degrade("undecodable message");
}

bool session::can_accept_reports() const
{
	if (m_stopping || m_fsm->get_state() == state::CLOSED)
	{
		LOG_DEBUG("Client is stopping, report rejected");
		return false;
	}
	return true;
}

bool session::report_health(const agent_health& health)
{
	{
		std::lock_guard<std::mutex> lock(m_lock);

		if (!can_accept_reports())
		{
			return false;
		}
		m_last_health = health;
		m_have_health = true;
		m_queue.set_health(to_proto(health));
	}
	m_cv.notify_all();
	return true;
}

bool session::poll_health()
{
	if (!m_collab.health || stop_requested())
	{
		return false;
	}

	agent_health health;
	try
	{
		health = m_collab.health->current_health();
	}
	catch (const std::exception& ex)
	{
		LOG_ERROR("Unable to read agent health: %s", ex.what());
		return false;
	}

	{
		std::lock_guard<std::mutex> lock(m_lock);

		if (!can_accept_reports() || (m_have_health && same_health(health, m_last_health)))
		{
			return false;
		}
		m_last_health = health;
		m_have_health = true;
		m_queue.set_health(to_proto(health));
	}
	m_cv.notify_all();
	return true;
}

bool session::report_effective_config()
{
	if (!m_collab.config)
	{
		LOG_WARNING("No config store, cannot report effective config");
		return false;
	}

	if (stop_requested())
	{
		return false;
	}

	effective_config config;
	try
	{
		config = m_collab.config->current_effective_config();
	}
	catch (const std::exception& ex)
	{
		LOG_ERROR("Unable to read the effective config: %s", ex.what());
		return false;
	}

	{
		std::lock_guard<std::mutex> lock(m_lock);

		if (!can_accept_reports())
		{
			return false;
		}
		m_queue.set_effective_config(to_proto(config));
	}
	m_cv.notify_all();
	return true;
}

bool session::report_package_status(const package_status& status)
{
	{
		std::lock_guard<std::mutex> lock(m_lock);

		if (!can_accept_reports() || !m_packages.update(status))
		{
			return false;
		}

		opampproto::PackageStatuses statuses;
		m_packages.to_proto(statuses);
		m_queue.set_package_statuses(statuses);
	}
	m_cv.notify_all();
	return true;
}

bool session::send_custom_message(const custom_message& msg)
{
	{
		std::lock_guard<std::mutex> lock(m_lock);

		if (!can_accept_reports())
		{
			return false;
		}

		opampproto::AgentToServer envelope;
		opampproto::CustomMessage* custom = envelope.mutable_custom_message();
		custom->set_capability(msg.capability);
		custom->set_type(msg.type);
		custom->set_data(msg.data);

		const uint32_t dropped = m_queue.push_critical(envelope);
		if (dropped > 0 && m_collab.listener)
		{
			m_collab.listener->on_backpressure(dropped);
		}
	}
	m_cv.notify_all();
	return true;
}

void session::update_custom_capabilities()
{
	{
		std::lock_guard<std::mutex> lock(m_lock);

		opampproto::CustomCapabilities caps;
		for (const auto& name : m_registry.capabilities())
		{
			caps.add_capabilities(name);
		}
		m_queue.set_custom_capabilities(caps);
	}
	m_cv.notify_all();
}

bool session::take_server_advised_delay(std::chrono::milliseconds& delay)
{
	std::lock_guard<std::mutex> lock(m_lock);

	if (!m_have_advised_delay)
	{
		return false;
	}
	m_have_advised_delay = false;
	delay = m_advised_delay;
	return true;
}

bool session::take_endpoint_change(endpoint_settings& settings)
{
	std::lock_guard<std::mutex> lock(m_lock);

	if (!m_endpoint_changed)
	{
		return false;
	}
	m_endpoint_changed = false;
	settings = m_endpoint;
	return true;
}

std::chrono::milliseconds session::poll_interval() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_poll_interval;
}

session::state session::get_state() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_fsm->get_state();
}

bool session::wait_for_state(const state expected, const std::chrono::milliseconds timeout)
{
	std::unique_lock<std::mutex> lock(m_lock);

	return m_cv.wait_for(lock, timeout, [this, expected]()
	{
		return m_fsm->get_state() == expected;
	});
}

instance_uid session::get_instance_uid() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_uid;
}

feature_set session::effective_features() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_effective;
}

bool session::features_negotiated() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_negotiated;
}

compression_method session::selected_compression() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_compression.selected();
}

uint64_t session::last_sent_sequence() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_sequencer.last_sent();
}

uint64_t session::last_received_sequence() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_sequencer.last_received();
}

uint64_t session::dropped_messages() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_queue.dropped_total();
}

std::string session::last_remote_config_hash() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_last_remote_config_hash;
}

void session::transition(const event e)
{
	const state from = m_fsm->get_state();

	if (!m_fsm->send_event(e))
	{
		LOG_DEBUG("Ignoring %s in state %s",
		          session_state_machine::to_string(e),
		          session_state_machine::to_string(from));
		return;
	}

	const state to = m_fsm->get_state();
	if (from != to)
	{
		LOG_INFO("Session %s -> %s",
		         session_state_machine::to_string(from),
		         session_state_machine::to_string(to));
		if (m_collab.listener)
		{
			m_collab.listener->on_state_change(session_state_machine::to_string(from),
			                                   session_state_machine::to_string(to));
		}
	}
	m_cv.notify_all();
}

void session::degrade(const char* const reason)
{
	const state s = m_fsm->get_state();

	if (s != state::CONNECTED && s != state::DEGRADED)
	{
		LOG_DEBUG("Not degrading on %s in state %s",
		          reason,
		          session_state_machine::to_string(s));
		return;
	}

	if (s == state::CONNECTED)
	{
		LOG_WARNING("Session degraded on %s, requesting full server state", reason);
	}
	transition(event::DEGRADE);
	m_force_send = true;
}

outbound_queue::disposition session::gate(const outbound_queue::field f) const
{
	if (f == outbound_queue::field::AGENT_DESCRIPTION)
	{
		return outbound_queue::disposition::SEND;
	}

	if (!m_negotiated)
	{
		return outbound_queue::disposition::HOLD;
	}

	return m_effective.has(required_feature(f)) ? outbound_queue::disposition::SEND
	                                            : outbound_queue::disposition::DROP;
}

void session::stamp(opampproto::AgentToServer& out)
{
	out.set_instance_uid(m_uid.bytes());
	out.set_sequence_num(m_sequencer.next_outbound());
	out.set_capabilities(capabilities::to_agent_capabilities(m_local));

	uint64_t flags = out.flags() & ~static_cast<uint64_t>(
		opampproto::AgentToServerFlags_RequestServerFullState);
	if (m_fsm->get_state() == state::DEGRADED)
	{
		flags |= opampproto::AgentToServerFlags_RequestServerFullState;
	}
	out.set_flags(flags);
}

bool session::negotiate(const uint64_t server_caps)
{
	m_server_caps = server_caps;
	m_effective = capabilities::negotiate(m_local, server_caps);
	m_negotiated = true;

	LOG_INFO("Effective features: %s", m_effective.to_string().c_str());

	const feature_set missing = m_config.required_features.missing_from(m_effective);
	if (!missing.empty())
	{
		m_fatal_reason = "Server does not offer required features: " + missing.to_string();
		LOG_ERROR("%s", m_fatal_reason.c_str());
		m_connection_up = false;
		transition(event::FATAL);
		return false;
	}
	return true;
}

opampproto::AgentDescription session::describe() const
{
	return agent_description::build(m_config.service_name,
	                                m_config.service_version,
	                                m_uid,
	                                m_config.extra_attributes);
}

} // namespace opamp
