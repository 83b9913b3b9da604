/**
 * @file
 *
 * Interface to reconnect_backoff.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace opamp
{

/**
 * Exponential reconnect backoff with jitter.
 *
 * The un-jittered interval starts at base and is multiplied on every
 * failed attempt up to max. The delay actually waited is
 * min(max, interval * (1 + jitter * r)) with r in [0, 1). With
 * multiplier >= 1 + jitter the delays never decrease.
 *
 * A connection which stays up for at least the stability threshold
 * restarts the sequence from base on its next disconnect.
 */
class reconnect_backoff
{
public:
	using clock = std::chrono::steady_clock;
	// Returns a value in [0, 1)
	using random_source = std::function<double()>;

	struct settings
	{
		std::chrono::milliseconds base{1000};
		std::chrono::milliseconds max{300000};
		double multiplier = 2.0;
		double jitter = 0.2;
		std::chrono::milliseconds stability_threshold{60000};
	};

	explicit reconnect_backoff(const settings& config,
	                           random_source random = random_source());

	/**
	 * The delay to wait before the next connection attempt. The very
	 * first attempt does not wait; after reset() the sequence starts from base.
	 */
	std::chrono::milliseconds next_delay();

	/**
	 * Record that a connection was established.
	 */
	void on_connected(clock::time_point now = clock::now());

	/**
	 * Record that the connection dropped. Restarts the sequence if the
	 * connection had been stable.
	 */
	void on_disconnected(clock::time_point now = clock::now());

	/**
	 * Use the given delay for the next attempt only.
	 */
	void set_server_advised(std::chrono::milliseconds delay);

	void reset();

	std::chrono::milliseconds last_delay() const { return m_last_delay; }
	const settings& get_settings() const { return m_settings; }

private:
	static settings sanitize(const settings& config);

	const settings m_settings;
	random_source m_random;
	double m_interval_ms;
	std::chrono::milliseconds m_last_delay;
	bool m_first_attempt;
	bool m_have_advised;
	std::chrono::milliseconds m_advised;
	bool m_connected;
	clock::time_point m_connected_at;
};

} // namespace opamp
