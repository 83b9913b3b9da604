/**
 * @file
 *
 * Implementation of transport_holder.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "transport_holder.h"

namespace opamp
{

transport_holder::transport_holder() : m_generation(0), m_interrupted(false)
{
}

void transport_holder::set(const std::shared_ptr<transport>& t, const uint64_t generation)
{
	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_transport = t;
		m_generation = generation;
	}
	m_cv.notify_all();
}

void transport_holder::clear(const uint64_t generation)
{
	std::shared_ptr<transport> old;
	{
		std::lock_guard<std::mutex> lock(m_lock);
		if (generation != m_generation || !m_transport)
		{
			return;
		}
		old.swap(m_transport);
	}

	// Outside the lock; close() may block on the channel
	old->close();
}

bool transport_holder::wait_for(const std::chrono::milliseconds timeout,
                                const uint64_t newer_than,
                                std::shared_ptr<transport>& t,
                                uint64_t& generation)
{
	std::unique_lock<std::mutex> lock(m_lock);

	const bool ready = m_cv.wait_for(lock, timeout, [this, newer_than]()
	{
		return m_interrupted || (m_transport && m_generation > newer_than);
	});

	if (!ready || !m_transport || m_generation <= newer_than)
	{
		return false;
	}

	t = m_transport;
	generation = m_generation;
	return true;
}

void transport_holder::close_current()
{
	std::shared_ptr<transport> current;
	{
		std::lock_guard<std::mutex> lock(m_lock);
		current = m_transport;
	}

	if (current)
	{
		current->close();
	}
}

void transport_holder::interrupt()
{
	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_interrupted = true;
	}
	m_cv.notify_all();
}

} // namespace opamp
