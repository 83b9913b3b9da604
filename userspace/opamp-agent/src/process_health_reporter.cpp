/**
 * @file
 *
 * Implementation of process_health_reporter.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "process_health_reporter.h"

#include <Poco/Timestamp.h>

namespace opamp_agent
{

process_health_reporter::process_health_reporter() :
	m_start_time_unix_nano(now_unix_nano())
{
}

opamp::agent_health process_health_reporter::current_health()
{
	std::lock_guard<std::mutex> lock(m_lock);
	opamp::agent_health health;

	health.healthy = m_last_error.empty();
	health.start_time_unix_nano = m_start_time_unix_nano;
	health.status_time_unix_nano = now_unix_nano();
	health.status = health.healthy ? "running" : "degraded";
	health.last_error = m_last_error;
	return health;
}

void process_health_reporter::set_error(const std::string& error)
{
	std::lock_guard<std::mutex> lock(m_lock);
	m_last_error = error;
}

void process_health_reporter::clear_error()
{
	std::lock_guard<std::mutex> lock(m_lock);
	m_last_error.clear();
}

uint64_t process_health_reporter::now_unix_nano()
{
	return static_cast<uint64_t>(Poco::Timestamp().epochMicroseconds()) * 1000;
}

}  // namespace opamp_agent
