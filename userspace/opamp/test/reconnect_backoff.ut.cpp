/**
 * @file
 *
 * Unit tests for reconnect_backoff.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "reconnect_backoff.h"

#include <gtest.h>

#include <random>

using namespace opamp;
using std::chrono::milliseconds;

namespace
{

reconnect_backoff::settings test_settings()
{
	reconnect_backoff::settings s;
	s.base = milliseconds(100);
	s.max = milliseconds(5000);
	s.multiplier = 2.0;
	s.jitter = 0.2;
	s.stability_threshold = milliseconds(1000);
	return s;
}

}  // namespace

TEST(reconnect_backoff_test, first_attempt_is_immediate)
{
	reconnect_backoff backoff(test_settings(), []() { return 0.0; });

	ASSERT_EQ(milliseconds(0), backoff.next_delay());
	ASSERT_EQ(milliseconds(100), backoff.next_delay());
	ASSERT_EQ(milliseconds(200), backoff.next_delay());
	ASSERT_EQ(milliseconds(400), backoff.next_delay());
}

TEST(reconnect_backoff_test, capped_at_max)
{
	reconnect_backoff backoff(test_settings(), []() { return 0.99; });

	milliseconds last(0);
	for (int i = 0; i < 20; ++i)
	{
		last = backoff.next_delay();
		ASSERT_LE(last, milliseconds(5000));
	}
	ASSERT_EQ(milliseconds(5000), last);
}

TEST(reconnect_backoff_test, delays_never_decrease)
{
	std::mt19937 engine(1234);
	std::uniform_real_distribution<double> dist(0.0, 1.0);
	reconnect_backoff backoff(test_settings(), [&]() { return dist(engine); });

	milliseconds previous = backoff.next_delay();
	for (int i = 0; i < 30; ++i)
	{
		const milliseconds next = backoff.next_delay();
		ASSERT_GE(next, previous) << "attempt " << i;
		previous = next;
	}
}

TEST(reconnect_backoff_test, low_multiplier_is_raised)
{
	reconnect_backoff::settings s = test_settings();
	s.multiplier = 1.0;
	s.jitter = 0.5;

	reconnect_backoff backoff(s);

	ASSERT_DOUBLE_EQ(1.5, backoff.get_settings().multiplier);
}

TEST(reconnect_backoff_test, stable_connection_restarts_from_base)
{
	reconnect_backoff backoff(test_settings(), []() { return 0.0; });
	const reconnect_backoff::clock::time_point t0 = reconnect_backoff::clock::now();

	backoff.next_delay();
	backoff.next_delay();
	backoff.next_delay();
	ASSERT_EQ(milliseconds(400), backoff.next_delay());

	backoff.on_connected(t0);
	backoff.on_disconnected(t0 + milliseconds(2000));

	ASSERT_EQ(milliseconds(100), backoff.next_delay());
}

TEST(reconnect_backoff_test, short_connection_keeps_growing)
{
	reconnect_backoff backoff(test_settings(), []() { return 0.0; });
	const reconnect_backoff::clock::time_point t0 = reconnect_backoff::clock::now();

	backoff.next_delay();
	ASSERT_EQ(milliseconds(100), backoff.next_delay());

	backoff.on_connected(t0);
	backoff.on_disconnected(t0 + milliseconds(10));

	ASSERT_EQ(milliseconds(200), backoff.next_delay());
}

TEST(reconnect_backoff_test, server_advice_is_used_once)
{
	reconnect_backoff backoff(test_settings(), []() { return 0.0; });

	backoff.set_server_advised(milliseconds(7000));
	ASSERT_EQ(milliseconds(7000), backoff.next_delay());
	ASSERT_EQ(milliseconds(0), backoff.next_delay());
	ASSERT_EQ(milliseconds(100), backoff.next_delay());
}

TEST(reconnect_backoff_test, jitter_stays_in_range)
{
	reconnect_backoff backoff(test_settings(), []() { return 0.5; });

	backoff.next_delay();
	ASSERT_EQ(milliseconds(110), backoff.next_delay());
}
