/**
 * @file
 *
 * Implementation of the feature table.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "capabilities.h"
#include "common_logger.h"
#include "opamp.pb.h"

COMMON_LOGGER();

namespace opamp
{

feature_set::feature_set(std::initializer_list<feature> features) :
	m_bits(0)
{
	for (const feature f : features)
	{
		set(f);
	}
}

std::string feature_set::to_string() const
{
	std::string out;

	for (const auto& row : capabilities::feature_table())
	{
		if (!has(row.engine_feature))
		{
			continue;
		}

		if (!out.empty())
		{
			out += ",";
		}
		out += row.name;
	}

	return out.empty() ? "none" : out;
}

namespace capabilities
{

const std::vector<feature_mapping>& feature_table()
{
	static const std::vector<feature_mapping> s_table = {
		{feature::REPORTS_STATUS, "reports_status",
		 opampproto::AgentCapabilities_ReportsStatus,
		 opampproto::ServerCapabilities_AcceptsStatus},
		{feature::REMOTE_CONFIG, "remote_config",
		 opampproto::AgentCapabilities_AcceptsRemoteConfig |
		         opampproto::AgentCapabilities_ReportsRemoteConfig,
		 opampproto::ServerCapabilities_OffersRemoteConfig},
		{feature::EFFECTIVE_CONFIG, "effective_config",
		 opampproto::AgentCapabilities_ReportsEffectiveConfig,
		 opampproto::ServerCapabilities_AcceptsEffectiveConfig},
		{feature::PACKAGES, "packages",
		 opampproto::AgentCapabilities_AcceptsPackages,
		 opampproto::ServerCapabilities_OffersPackages},
		{feature::PACKAGE_STATUSES, "package_statuses",
		 opampproto::AgentCapabilities_ReportsPackageStatuses,
		 opampproto::ServerCapabilities_AcceptsPackagesStatus},
		{feature::CONNECTION_SETTINGS, "connection_settings",
		 opampproto::AgentCapabilities_AcceptsOpAMPConnectionSettings,
		 opampproto::ServerCapabilities_OffersConnectionSettings},
		{feature::HEALTH, "health",
		 opampproto::AgentCapabilities_ReportsHealth,
		 opampproto::ServerCapabilities_AcceptsStatus},
		{feature::RESTART_COMMAND, "restart_command",
		 opampproto::AgentCapabilities_AcceptsRestartCommand,
		 0},
		{feature::HEARTBEAT, "heartbeat",
		 opampproto::AgentCapabilities_ReportsHeartbeat,
		 0},
		{feature::GZIP_COMPRESSION, "gzip",
		 opampproto::AgentCapabilities_AcceptsGzipCompression,
		 opampproto::ServerCapabilities_AcceptsGzipCompression},
		{feature::CUSTOM_CAPABILITIES, "custom_capabilities",
		 opampproto::AgentCapabilities_ReportsCustomCapabilities,
		 opampproto::ServerCapabilities_OffersCustomCapabilities},
	};

	return s_table;
}

feature_set all_features()
{
	feature_set all;

	for (const auto& row : feature_table())
	{
		all.set(row.engine_feature);
	}
	return all;
}

uint64_t to_agent_capabilities(const feature_set& local)
{
	uint64_t caps = 0;

	for (const auto& row : feature_table())
	{
		if (local.has(row.engine_feature))
		{
			caps |= row.agent_bit;
		}
	}
	return caps;
}

feature_set from_server_capabilities(const uint64_t server_caps)
{
	feature_set offered;

	if (server_caps == 0)
	{
		return offered;
	}

	for (const auto& row : feature_table())
	{
		if (row.server_bit == 0 || (server_caps & row.server_bit) == row.server_bit)
		{
			offered.set(row.engine_feature);
		}
	}
	return offered;
}

feature_set negotiate(const feature_set& local, const uint64_t server_caps)
{
	return local & from_server_capabilities(server_caps);
}

const char* to_string(const feature f)
{
	for (const auto& row : feature_table())
	{
		if (row.engine_feature == f)
		{
			return row.name;
		}
	}
	return "unknown";
}

bool from_string(const std::string& name, feature& out)
{
	for (const auto& row : feature_table())
	{
		if (name == row.name)
		{
			out = row.engine_feature;
			return true;
		}
	}
	return false;
}

feature_set parse_feature_list(const std::vector<std::string>& names)
{
	feature_set features;

	for (const auto& name : names)
	{
		feature f;
		if (from_string(name, f))
		{
			features.set(f);
		}
		else
		{
			LOG_WARNING("Ignoring unknown feature \"%s\"", name.c_str());
		}
	}
	return features;
}

} // namespace capabilities
} // namespace opamp
