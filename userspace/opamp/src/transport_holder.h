/**
 * @file
 *
 * Interface to transport_holder.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "transport.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace opamp
{

/**
 * Hands the current connection from the send task, which creates and
 * replaces it, to the receive task, which reads from it. Each connection
 * is tagged with the session's connection generation.
 */
class transport_holder
{
public:
	transport_holder();

	/**
	 * Publish a connected transport.
	 */
	void set(const std::shared_ptr<transport>& t, uint64_t generation);

	/**
	 * Close and forget the transport if it belongs to the given
	 * generation.
	 */
	void clear(uint64_t generation);

	/**
	 * Wait for a transport whose generation is greater than newer_than.
	 *
	 * @return false on timeout or interrupt
	 */
	bool wait_for(std::chrono::milliseconds timeout,
	              uint64_t newer_than,
	              std::shared_ptr<transport>& t,
	              uint64_t& generation);

	/**
	 * Close the current transport without forgetting it. Blocked I/O
	 * on it returns.
	 */
	void close_current();

	/**
	 * Wake every wait_for().
	 */
	void interrupt();

private:
	std::mutex m_lock;
	std::condition_variable m_cv;
	std::shared_ptr<transport> m_transport;
	uint64_t m_generation;
	bool m_interrupted;
};

} // namespace opamp
