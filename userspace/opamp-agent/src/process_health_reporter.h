/**
 * @file
 *
 * Interface to process_health_reporter.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "collaborators.h"

#include <cstdint>
#include <mutex>
#include <string>

namespace opamp_agent
{

/**
 * Reports the health of the running process: when it started and the
 * last error the application recorded, if any.
 */
class process_health_reporter : public opamp::health_reporter
{
public:
	process_health_reporter();

	opamp::agent_health current_health() override;

	/**
	 * Mark the process unhealthy until clear_error() is called.
	 */
	void set_error(const std::string& error);

	void clear_error();

private:
	static uint64_t now_unix_nano();

	const uint64_t m_start_time_unix_nano;
	std::mutex m_lock;
	std::string m_last_error;
};

}  // namespace opamp_agent
