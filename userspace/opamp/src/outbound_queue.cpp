/**
 * @file
 *
 * Implementation of outbound_queue.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "outbound_queue.h"
#include "common_logger.h"

COMMON_LOGGER();

namespace opamp
{

outbound_queue::outbound_queue(const uint32_t critical_bound) :
	m_critical_bound(critical_bound == 0 ? 1 : critical_bound),
	m_dropped_total(0)
{
}

void outbound_queue::set_agent_description(const opampproto::AgentDescription& value)
{
	*m_pending.mutable_agent_description() = value;
}

void outbound_queue::set_health(const opampproto::ComponentHealth& value)
{
	*m_pending.mutable_health() = value;
}

void outbound_queue::set_effective_config(const opampproto::EffectiveConfig& value)
{
	*m_pending.mutable_effective_config() = value;
}

void outbound_queue::set_remote_config_status(const opampproto::RemoteConfigStatus& value)
{
	*m_pending.mutable_remote_config_status() = value;
}

void outbound_queue::set_package_statuses(const opampproto::PackageStatuses& value)
{
	*m_pending.mutable_package_statuses() = value;
}

void outbound_queue::set_connection_settings_status(const opampproto::ConnectionSettingsStatus& value)
{
	*m_pending.mutable_connection_settings_status() = value;
}

void outbound_queue::set_custom_capabilities(const opampproto::CustomCapabilities& value)
{
	*m_pending.mutable_custom_capabilities() = value;
}

uint32_t outbound_queue::push_critical(const opampproto::AgentToServer& message)
{
	uint32_t dropped = 0;

	while (m_critical.size() >= m_critical_bound)
	{
		m_critical.pop_front();
		++dropped;
	}

	m_critical.push_back(message);

	if (dropped)
	{
		m_dropped_total += dropped;
		LOG_WARNING("Outbound queue full (%u), dropped %u oldest message(s)",
		            m_critical_bound,
		            dropped);
	}
	return dropped;
}

outbound_queue::disposition outbound_queue::check(const gate& g, const field f) const
{
	const disposition d = g ? g(f) : disposition::SEND;

	if (d == disposition::DROP)
	{
		LOG_WARNING("Capability not negotiated, dropping %s", to_string(f));
	}
	return d;
}

template<typename T>
bool outbound_queue::take_field(const gate& g,
                                const field f,
                                bool (opampproto::AgentToServer::*has)() const,
                                T* (opampproto::AgentToServer::*get_mutable)(),
                                void (opampproto::AgentToServer::*clear)(),
                                opampproto::AgentToServer& out)
{
	if (!(m_pending.*has)())
	{
		return false;
	}

	const disposition d = check(g, f);
	if (d == disposition::SEND)
	{
		(out.*get_mutable)()->Swap((m_pending.*get_mutable)());
		(m_pending.*clear)();
		return true;
	}
	if (d == disposition::DROP)
	{
		(m_pending.*clear)();
	}
	return false;
}

bool outbound_queue::take(const gate& g, opampproto::AgentToServer& out)
{
	bool moved = false;

	// Critical messages go first so that a dropped or held one never
	// reorders the ones behind it.
	while (!m_critical.empty())
	{
		const opampproto::AgentToServer& front = m_critical.front();
		disposition d = disposition::SEND;

		if (front.has_custom_message())
		{
			d = check(g, field::CUSTOM_MESSAGE);
		}

		if (d == disposition::HOLD)
		{
			break;
		}

		if (d == disposition::SEND)
		{
			out.MergeFrom(front);
			moved = true;
		}

		m_critical.pop_front();
		if (moved)
		{
			break;
		}
	}

	using msg = opampproto::AgentToServer;

	moved = take_field(g, field::AGENT_DESCRIPTION, &msg::has_agent_description,
	                   &msg::mutable_agent_description, &msg::clear_agent_description, out) || moved;
	moved = take_field(g, field::HEALTH, &msg::has_health,
	                   &msg::mutable_health, &msg::clear_health, out) || moved;
	moved = take_field(g, field::EFFECTIVE_CONFIG, &msg::has_effective_config,
	                   &msg::mutable_effective_config, &msg::clear_effective_config, out) || moved;
	moved = take_field(g, field::REMOTE_CONFIG_STATUS, &msg::has_remote_config_status,
	                   &msg::mutable_remote_config_status, &msg::clear_remote_config_status, out) || moved;
	moved = take_field(g, field::PACKAGE_STATUSES, &msg::has_package_statuses,
	                   &msg::mutable_package_statuses, &msg::clear_package_statuses, out) || moved;
	moved = take_field(g, field::CONNECTION_SETTINGS_STATUS, &msg::has_connection_settings_status,
	                   &msg::mutable_connection_settings_status,
	                   &msg::clear_connection_settings_status, out) || moved;
	moved = take_field(g, field::CUSTOM_CAPABILITIES, &msg::has_custom_capabilities,
	                   &msg::mutable_custom_capabilities, &msg::clear_custom_capabilities, out) || moved;

	return moved;
}

bool outbound_queue::empty() const
{
	return m_critical.empty() &&
	       !m_pending.has_agent_description() &&
	       !m_pending.has_health() &&
	       !m_pending.has_effective_config() &&
	       !m_pending.has_remote_config_status() &&
	       !m_pending.has_package_statuses() &&
	       !m_pending.has_connection_settings_status() &&
	       !m_pending.has_custom_capabilities();
}

void outbound_queue::clear()
{
	m_pending.Clear();
	m_critical.clear();
}

const char* outbound_queue::to_string(const field f)
{
	switch (f)
	{
	case field::AGENT_DESCRIPTION:
		return "agent_description";
	case field::HEALTH:
		return "health";
	case field::EFFECTIVE_CONFIG:
		return "effective_config";
	case field::REMOTE_CONFIG_STATUS:
		return "remote_config_status";
	case field::PACKAGE_STATUSES:
		return "package_statuses";
	case field::CONNECTION_SETTINGS_STATUS:
		return "connection_settings_status";
	case field::CUSTOM_CAPABILITIES:
		return "custom_capabilities";
	case field::CUSTOM_MESSAGE:
		return "custom_message";
	}
	return "unknown";
}

} // namespace opamp
