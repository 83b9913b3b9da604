/**
 * @file
 *
 * Implementation of opamp_client.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "opamp_client.h"
#include "common_logger.h"

#include <cinttypes>

COMMON_LOGGER();

namespace opamp
{

opamp_client::opamp_client(const client_config& config,
                           const session::collaborators& collab,
                           const transport_factory& factory,
                           const reconnect_backoff::random_source& random) :
	m_config(config),
	m_registry(),
	m_running_state(),
	m_session(config, collab, m_registry),
	m_holder(),
	m_send_task(m_running_state, m_session, m_holder, config, factory, random),
	m_receive_task(m_running_state, m_session, m_holder, config.receive_timeout),
	m_send_thread("opamp_send"),
	m_receive_thread("opamp_receive"),
	m_started(false),
	m_stopped(false)
{
	m_running_state.add_shutdown_listener([this]()
	{
		m_session.request_stop();
		m_holder.interrupt();
	});
}

opamp_client::~opamp_client()
{
	stop();
}

void opamp_client::start()
{
	std::lock_guard<std::mutex> lock(m_lifecycle_lock);

	if (m_started)
	{
		LOG_WARNING("OpAMP client already started");
		return;
	}

	LOG_INFO("Starting OpAMP client for %s", m_config.endpoint.url.c_str());
	m_started = true;
	m_receive_thread.start(m_receive_task);
	m_send_thread.start(m_send_task);
}

void opamp_client::stop()
{
	std::lock_guard<std::mutex> lock(m_lifecycle_lock);

	if (!m_started || m_stopped)
	{
		m_stopped = true;
		m_running_state.shut_down("Stopping OpAMP client");
		m_session.shutdown();
		return;
	}
	m_stopped = true;

	m_running_state.shut_down("Stopping OpAMP client");

	const long grace_ms = static_cast<long>(m_config.shutdown_grace.count());
	if (!m_send_thread.tryJoin(grace_ms))
	{
		LOG_WARNING("Final flush did not finish within %ld ms, aborting it", grace_ms);
		m_holder.close_current();
		m_send_thread.join();
	}

	m_holder.close_current();
	m_holder.interrupt();
	m_receive_thread.join();

	m_session.shutdown();
	LOG_INFO("OpAMP client stopped");
}

bool opamp_client::is_running() const
{
	return !m_running_state.is_terminated();
}

bool opamp_client::report_health(const agent_health& health)
{
	return m_session.report_health(health);
}

bool opamp_client::report_effective_config_changed()
{
	return m_session.report_effective_config();
}

bool opamp_client::report_package_status(const package_status& status)
{
	return m_session.report_package_status(status);
}

bool opamp_client::send_custom_message(const custom_message& msg)
{
	return m_session.send_custom_message(msg);
}

bool opamp_client::register_custom_handler(const std::string& capability,
                                           const extension_registry::handler& h)
{
	if (!m_registry.register_handler(capability, h))
	{
		return false;
	}
	m_session.update_custom_capabilities();
	return true;
}

bool opamp_client::unregister_custom_handler(const std::string& capability)
{
	if (!m_registry.unregister_handler(capability))
	{
		return false;
	}
	m_session.update_custom_capabilities();
	return true;
}

session::state opamp_client::get_state() const
{
	return m_session.get_state();
}

bool opamp_client::wait_for_state(const session::state expected,
                                  const std::chrono::milliseconds timeout)
{
	return m_session.wait_for_state(expected, timeout);
}

instance_uid opamp_client::get_instance_uid() const
{
	return m_session.get_instance_uid();
}

feature_set opamp_client::effective_features() const
{
	return m_session.effective_features();
}

std::string opamp_client::stop_reason() const
{
	std::string reason;

	if (m_session.fatal_error(reason))
	{
		return reason;
	}
	return m_running_state.reason();
}

} // namespace opamp
