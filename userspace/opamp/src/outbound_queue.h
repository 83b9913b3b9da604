/**
 * @file
 *
 * Interface to outbound_queue.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "opamp.pb.h"

#include <cstdint>
#include <deque>
#include <functional>

namespace opamp
{

/**
 * Agent to server data waiting to be sent.
 *
 * Status fields are coalesced: only the latest value of each is kept.
 * Critical messages are kept in order up to a bound; pushing onto a full
 * queue drops the oldest one.
 *
 * Not thread safe; the session guards it.
 */
class outbound_queue
{
public:
	enum class field
	{
		AGENT_DESCRIPTION,
		HEALTH,
		EFFECTIVE_CONFIG,
		REMOTE_CONFIG_STATUS,
		PACKAGE_STATUSES,
		CONNECTION_SETTINGS_STATUS,
		CUSTOM_CAPABILITIES,
		CUSTOM_MESSAGE,
	};

	enum class disposition
	{
		SEND,
		HOLD,
		DROP
	};

	// Decides what happens to a pending field when an envelope is built
	using gate = std::function<disposition(field)>;

	explicit outbound_queue(uint32_t critical_bound);

	void set_agent_description(const opampproto::AgentDescription& value);
	void set_health(const opampproto::ComponentHealth& value);
	void set_effective_config(const opampproto::EffectiveConfig& value);
	void set_remote_config_status(const opampproto::RemoteConfigStatus& value);
	void set_package_statuses(const opampproto::PackageStatuses& value);
	void set_connection_settings_status(const opampproto::ConnectionSettingsStatus& value);
	void set_custom_capabilities(const opampproto::CustomCapabilities& value);

	/**
	 * Queue a message which must not be coalesced.
	 *
	 * @return the number of older messages dropped to make room
	 */
	uint32_t push_critical(const opampproto::AgentToServer& message);

	/**
	 * Move everything the gate lets through into out. Critical messages
	 * leave in FIFO order, at most one per envelope.
	 *
	 * @return true if anything was moved into out
	 */
	bool take(const gate& g, opampproto::AgentToServer& out);

	bool empty() const;

	size_t critical_size() const { return m_critical.size(); }

	uint64_t dropped_total() const { return m_dropped_total; }

	void clear();

	static const char* to_string(field f);

private:
	disposition check(const gate& g, field f) const;

	/**
	 * Move one coalesced field of the pending envelope into out if the
	 * gate lets it through, or clear it if the gate drops it.
	 *
	 * @return true if the field was moved
	 */
	template<typename T>
	bool take_field(const gate& g,
	                field f,
	                bool (opampproto::AgentToServer::*has)() const,
	                T* (opampproto::AgentToServer::*get_mutable)(),
	                void (opampproto::AgentToServer::*clear)(),
	                opampproto::AgentToServer& out);

	const uint32_t m_critical_bound;
	// Presence of a sub-message means the field is pending
	opampproto::AgentToServer m_pending;
	std::deque<opampproto::AgentToServer> m_critical;
	uint64_t m_dropped_total;
};

} // namespace opamp
