/**
 * @file
 *
 * Interface to running_state.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <functional>
#include <string>
#include <vector>

namespace opamp
{

/**
 * Running state of one opamp_client and its threads. Every client owns
 * its own instance so several clients can live in one process.
 */
class running_state
{
public:
	running_state();

	/**
	 * Return whether the client is being shut down.
	 */
	bool is_terminated() const;

	/**
	 * Request shutdown and wake every wait_for(). Only the first call
	 * is obeyed.
	 */
	void shut_down(const std::string& reason = "Shutting down OpAMP client gracefully.");

	/**
	 * Sleep until the timeout expires or shutdown is requested.
	 *
	 * @return true if shutdown was requested
	 */
	bool wait_for(std::chrono::milliseconds timeout) const;

	/**
	 * The reason given to the first shut_down().
	 */
	std::string reason() const;

	/**
	 * Register a function called once by the first shut_down(), after
	 * the state has changed. Called right away if already terminated.
	 */
	void add_shutdown_listener(const std::function<void()>& listener);

private:
	std::atomic<bool> m_terminated;
	mutable std::mutex m_lock;
	mutable std::condition_variable m_cv;
	std::string m_reason;
	std::vector<std::function<void()>> m_listeners;

	// Deleted to prevent accidental usage
	running_state(const running_state&) = delete;
	running_state& operator=(const running_state&) = delete;
};

} // namespace opamp
