/**
 * @file
 *
 * Interface to client_config.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "capabilities.h"
#include "endpoint_settings.h"
#include "protocol.h"
#include "reconnect_backoff.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace opamp
{

/**
 * Everything an opamp_client needs to run. Usually built from the
 * "opamp:" section of the yaml configuration with from_configuration(),
 * but tests may fill it in directly.
 */
struct client_config
{
	/**
	 * What happens to the sequence counters when a new connection is made.
	 * AUTO keeps them for polling and restarts them for streaming.
	 */
	enum class resumption
	{
		AUTO,
		RESET,
		RESUME
	};

	endpoint_settings endpoint;

	// Interval between polls, and between heartbeats when streaming
	std::chrono::milliseconds poll_interval{30000};
	// How long one receive wait may block
	std::chrono::milliseconds receive_timeout{1000};
	reconnect_backoff::settings backoff;
	uint32_t queue_bound = 64;
	resumption resumption_policy = resumption::AUTO;
	std::vector<compression_method> compression{compression_method::NONE,
	                                             compression_method::GZIP};
	feature_set local_features = capabilities::all_features();
	// Features the server must offer or the client shuts down
	feature_set required_features;
	bool require_sequencing = false;
	std::chrono::milliseconds shutdown_grace{5000};

	// Agent description
	std::string service_name = "opamp-agent";
	std::string service_version;
	std::map<std::string, std::string> extra_attributes;

	// Empty means generate a new one
	std::string instance_uid;

	/**
	 * Snapshot the registered opamp.* configuration values.
	 */
	static client_config from_configuration();

	/**
	 * @return false if the name is not one of auto, reset, resume
	 */
	static bool parse_resumption(const std::string& name, resumption& out);

	static const char* to_string(resumption policy);
};

} // namespace opamp
