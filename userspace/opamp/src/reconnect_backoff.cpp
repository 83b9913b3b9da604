/**
 * @file
 *
 * Implementation of reconnect_backoff.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "reconnect_backoff.h"
#include "common_logger.h"

#include <algorithm>
#include <cinttypes>
#include <memory>
#include <random>

COMMON_LOGGER();

namespace opamp
{

reconnect_backoff::settings reconnect_backoff::sanitize(const settings& config)
{
	settings out = config;

	if (out.base.count() <= 0)
	{
		LOG_WARNING("Backoff base must be positive, using 1 ms");
		out.base = std::chrono::milliseconds(1);
	}

	if (out.max < out.base)
	{
		LOG_WARNING("Backoff max %" PRId64 " ms is below base, using base",
		            static_cast<int64_t>(out.max.count()));
		out.max = out.base;
	}

	if (out.jitter < 0.0 || out.jitter > 1.0)
	{
		LOG_WARNING("Backoff jitter %.2f outside [0, 1], clamping", out.jitter);
		out.jitter = std::min(1.0, std::max(0.0, out.jitter));
	}

	if (out.multiplier < 1.0 + out.jitter)
	{
		LOG_WARNING("Backoff multiplier %.2f is below 1 + jitter, using %.2f",
		            out.multiplier,
		            1.0 + out.jitter);
		out.multiplier = 1.0 + out.jitter;
	}

	return out;
}

reconnect_backoff::reconnect_backoff(const settings& config, random_source random) :
	m_settings(sanitize(config)),
	m_random(std::move(random)),
	m_interval_ms(0),
	m_last_delay(0),
	m_first_attempt(true),
	m_have_advised(false),
	m_advised(0),
	m_connected(false)
{
	if (!m_random)
	{
		auto engine = std::make_shared<std::mt19937_64>(std::random_device{}());
		m_random = [engine]()
		{
			return std::uniform_real_distribution<double>(0.0, 1.0)(*engine);
		};
	}
}

std::chrono::milliseconds reconnect_backoff::next_delay()
{
	if (m_have_advised)
	{
		m_have_advised = false;
		LOG_INFO("Using server advised reconnect delay of %" PRId64 " ms",
		         static_cast<int64_t>(m_advised.count()));
		return m_advised;
	}

	if (m_first_attempt)
	{
		m_first_attempt = false;
		return std::chrono::milliseconds(0);
	}

	const double max_ms = static_cast<double>(m_settings.max.count());

	if (m_interval_ms == 0)
	{
		m_interval_ms = static_cast<double>(m_settings.base.count());
	}
	else
	{
		m_interval_ms = std::min(max_ms, m_interval_ms * m_settings.multiplier);
	}

	const double r = std::min(std::max(m_random(), 0.0), 1.0);
	const double jittered = std::min(max_ms, m_interval_ms * (1.0 + m_settings.jitter * r));

	m_last_delay = std::chrono::milliseconds(static_cast<int64_t>(jittered));
	return m_last_delay;
}

void reconnect_backoff::on_connected(const clock::time_point now)
{
	m_connected = true;
	m_connected_at = now;
}

void reconnect_backoff::on_disconnected(const clock::time_point now)
{
	if (!m_connected)
	{
		return;
	}

	m_connected = false;
	if (now - m_connected_at >= m_settings.stability_threshold)
	{
		LOG_DEBUG("Connection was stable, restarting backoff");
		reset();
	}
}

void reconnect_backoff::set_server_advised(const std::chrono::milliseconds delay)
{
	m_have_advised = true;
	m_advised = delay;
}

void reconnect_backoff::reset()
{
	m_interval_ms = 0;
	m_last_delay = std::chrono::milliseconds(0);
}

} // namespace opamp
