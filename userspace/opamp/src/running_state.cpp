/**
 * @file
 *
 * Implementation of running_state.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "running_state.h"
#include "common_logger.h"

COMMON_LOGGER();

namespace opamp
{

running_state::running_state() : m_terminated(false)
{
}

bool running_state::is_terminated() const
{
	return m_terminated;
}

void running_state::shut_down(const std::string& reason)
{
	std::vector<std::function<void()>> listeners;
	{
		std::lock_guard<std::mutex> lock(m_lock);
		if (m_terminated)
		{
			LOG_DEBUG("Ignoring additional call to terminate. Only "
			          "the first call is obeyed. Ignoring \"%s\"",
			          reason.c_str());
			return;
		}

		m_reason = reason;
		m_terminated = true;
		listeners.swap(m_listeners);
	}

	LOG_INFO("%s", reason.c_str());
	m_cv.notify_all();

	for (const auto& listener : listeners)
	{
		listener();
	}
}

void running_state::add_shutdown_listener(const std::function<void()>& listener)
{
	{
		std::lock_guard<std::mutex> lock(m_lock);
		if (!m_terminated)
		{
			m_listeners.push_back(listener);
			return;
		}
	}
	listener();
}

bool running_state::wait_for(const std::chrono::milliseconds timeout) const
{
	std::unique_lock<std::mutex> lock(m_lock);
	return m_cv.wait_for(lock, timeout, [this]() { return m_terminated.load(); });
}

std::string running_state::reason() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_reason;
}

} // namespace opamp
