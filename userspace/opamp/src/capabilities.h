/**
 * @file
 *
 * Engine level protocol features and their mapping to the capability
 * bits carried on the wire.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace opamp
{

/**
 * Optional protocol features known to the engine. Each value is a single
 * bit of a feature_set.
 */
enum class feature : uint32_t
{
	REPORTS_STATUS      = 1 << 0,
	REMOTE_CONFIG       = 1 << 1,
	EFFECTIVE_CONFIG    = 1 << 2,
	PACKAGES            = 1 << 3,
	PACKAGE_STATUSES    = 1 << 4,
	CONNECTION_SETTINGS = 1 << 5,
	HEALTH              = 1 << 6,
	RESTART_COMMAND     = 1 << 7,
	HEARTBEAT           = 1 << 8,
	GZIP_COMPRESSION    = 1 << 9,
	CUSTOM_CAPABILITIES = 1 << 10,
};

class feature_set
{
public:
	feature_set() : m_bits(0) {}
	explicit feature_set(uint32_t bits) : m_bits(bits) {}
	feature_set(std::initializer_list<feature> features);

	bool has(feature f) const
	{
		return (m_bits & static_cast<uint32_t>(f)) != 0;
	}

	void set(feature f) { m_bits |= static_cast<uint32_t>(f); }
	void clear(feature f) { m_bits &= ~static_cast<uint32_t>(f); }
	bool empty() const { return m_bits == 0; }
	uint32_t bits() const { return m_bits; }

	feature_set operator&(const feature_set& rhs) const
	{
		return feature_set(m_bits & rhs.m_bits);
	}

	feature_set operator|(const feature_set& rhs) const
	{
		return feature_set(m_bits | rhs.m_bits);
	}

	bool operator==(const feature_set& rhs) const { return m_bits == rhs.m_bits; }
	bool operator!=(const feature_set& rhs) const { return m_bits != rhs.m_bits; }

	/**
	 * @return the features in this set that are not in other
	 */
	feature_set missing_from(const feature_set& other) const
	{
		return feature_set(m_bits & ~other.m_bits);
	}

	std::string to_string() const;

private:
	uint32_t m_bits;
};

namespace capabilities
{

/**
 * One row of the feature table: the AgentCapabilities bit the agent
 * advertises and the ServerCapabilities bit the server must advertise.
 * A server bit of 0 means the feature needs no server side counterpart
 * beyond a valid capability set.
 */
struct feature_mapping
{
	feature engine_feature;
	const char* name;
	uint64_t agent_bit;
	uint64_t server_bit;
};

const std::vector<feature_mapping>& feature_table();

/**
 * @return every feature the engine knows about
 */
feature_set all_features();

/**
 * Bits to put in AgentToServer.capabilities for the given local features.
 */
uint64_t to_agent_capabilities(const feature_set& local);

/**
 * Features the server enables with the given ServerCapabilities bits.
 * An empty (0) capability set enables nothing.
 */
feature_set from_server_capabilities(uint64_t server_caps);

/**
 * The effective feature set: local AND server.
 */
feature_set negotiate(const feature_set& local, uint64_t server_caps);

const char* to_string(feature f);

/**
 * Parse a feature name such as "remote_config".
 *
 * @return false if the name is unknown
 */
bool from_string(const std::string& name, feature& out);

/**
 * Parse a list of feature names, ignoring and logging unknown ones.
 */
feature_set parse_feature_list(const std::vector<std::string>& names);

} // namespace capabilities
} // namespace opamp
