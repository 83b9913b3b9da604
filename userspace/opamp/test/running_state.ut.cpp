/**
 * @file
 *
 * Unit tests for running_state.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "running_state.h"

#include <gtest.h>

#include <thread>

using namespace opamp;
using namespace std::chrono;

TEST(running_state_test, initial)
{
	running_state state;

	ASSERT_FALSE(state.is_terminated());
	ASSERT_FALSE(state.wait_for(milliseconds(1)));
	ASSERT_EQ("", state.reason());
}

TEST(running_state_test, only_first_shut_down_counts)
{
	running_state state;

	state.shut_down("first");
	state.shut_down("second");

	ASSERT_TRUE(state.is_terminated());
	ASSERT_EQ("first", state.reason());
}

TEST(running_state_test, shut_down_wakes_waiter)
{
	running_state state;

	std::thread stopper([&state]()
	{
		std::this_thread::sleep_for(milliseconds(50));
		state.shut_down();
	});

	const auto start = steady_clock::now();
	ASSERT_TRUE(state.wait_for(seconds(10)));
	ASSERT_LT(steady_clock::now() - start, seconds(5));
	stopper.join();
}

TEST(running_state_test, listeners)
{
	running_state state;
	int early = 0;
	int late = 0;

	state.add_shutdown_listener([&early]() { ++early; });
	ASSERT_EQ(0, early);

	state.shut_down();
	state.shut_down();
	ASSERT_EQ(1, early);

	state.add_shutdown_listener([&late]() { ++late; });
	ASSERT_EQ(1, late);
}
