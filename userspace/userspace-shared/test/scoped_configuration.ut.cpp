/**
 * @file
 *
 * Unit tests for the scoped_configuration and scoped_config test helpers.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "scoped_config.h"
#include "scoped_configuration.h"
#include "type_config.h"

#include <gtest.h>

#include <stdexcept>
#include <string>

using namespace test_helpers;

TEST(scoped_configuration_test, values_reset_on_destruction)
{
	type_config<int> timeout(30000, "description", "sc_opamp", "timeout_ms");
	type_config<std::string> endpoint("ws://localhost", "description", "sc_opamp", "endpoint");
	type_config<bool> verify(true, "description", "sc_opamp", "tls", "verify");

	{
		scoped_configuration config(R"(
sc_opamp:
  timeout_ms: 500
  tls:
    verify: false
)");
		ASSERT_TRUE(config.loaded());
		ASSERT_EQ(500, timeout.get_value());
		ASSERT_EQ("ws://localhost", endpoint.get_value());
		ASSERT_FALSE(verify.get_value());
	}

	ASSERT_EQ(30000, timeout.get_value());
	ASSERT_TRUE(verify.get_value());
}

TEST(scoped_configuration_test, malformed_yaml_not_loaded)
{
	type_config<int> timeout(30000, "description", "sc_bad", "timeout_ms");
	scoped_configuration config("sc_bad: [");

	ASSERT_FALSE(config.loaded());
	ASSERT_EQ(30000, timeout.get_value());
}

TEST(scoped_config_test, single_value_restored)
{
	type_config<int> queue(64, "description", "sc_single", "queue_bound");

	{
		scoped_config<int> config("sc_single.queue_bound", 2);
		ASSERT_EQ(2, queue.get_value());
	}

	ASSERT_EQ(64, queue.get_value());
}

TEST(scoped_config_test, unknown_key_throws)
{
	ASSERT_THROW(scoped_config<int>("sc_single.nothing", 2), std::invalid_argument);
}
