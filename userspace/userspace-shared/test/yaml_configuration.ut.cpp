/**
 * @file
 *
 * Unit tests for yaml_configuration.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "scoped_temp_directory.h"
#include "yaml_configuration.h"

#include <gtest.h>

#include <cstdint>
#include <string>

namespace
{

const std::string OVERRIDE_YAML = R"(
opamp:
  endpoint: "wss://opamp.example.com/v1/opamp"
  headers:
    x-tenant: blue
  tls:
    verify: false
log:
  file_priority: debug
)";

const std::string DEFAULT_YAML = R"(
opamp:
  endpoint: "ws://127.0.0.1:4320/v1/opamp"
  timeout_ms: 30000
  headers:
    x-tenant: red
    x-region: eu
log:
  file_priority: info
  console_priority: error
)";

}  // namespace

TEST(yaml_configuration_test, scalars_from_string)
{
	yaml_configuration conf(DEFAULT_YAML);

	ASSERT_TRUE(conf.errors().empty());
	ASSERT_EQ("ws://127.0.0.1:4320/v1/opamp", conf.get_scalar<std::string>("opamp", "endpoint", ""));
	ASSERT_EQ(30000u, conf.get_scalar<uint32_t>("opamp", "timeout_ms", 0));
	ASSERT_EQ("error", conf.get_scalar<std::string>("log", "console_priority", ""));
	ASSERT_EQ(7, conf.get_scalar<int>("opamp", "missing", 7));
	ASSERT_EQ("fallback", conf.get_scalar<std::string>("nothere", std::string("fallback")));
}

TEST(yaml_configuration_test, three_levels)
{
	yaml_configuration conf(OVERRIDE_YAML);
	bool verify = true;

	ASSERT_EQ(0, conf.get_scalar_depth<bool>("opamp", "tls", "verify", verify));
	ASSERT_FALSE(verify);
	ASSERT_EQ(-1, conf.get_scalar_depth<bool>("opamp", "tls", "insecure", verify));
}

TEST(yaml_configuration_test, missing_required_scalar_throws)
{
	yaml_configuration conf(DEFAULT_YAML);

	ASSERT_THROW(conf.get_scalar<std::string>("endpoint"), yaml_configuration_exception);
}

TEST(yaml_configuration_test, malformed_string)
{
	yaml_configuration conf("opamp: [unterminated");

	ASSERT_EQ(1u, conf.errors().size());
	ASSERT_EQ(0u, conf.errors()[0].find("Cannot read config file, reason: "));
	ASSERT_EQ(3, conf.get_scalar<int>("opamp", "timeout_ms", 3));
}

TEST(yaml_configuration_test, sequence_root_rejected)
{
	yaml_configuration conf("- a\n- b\n");

	ASSERT_EQ(1u, conf.errors().size());
	ASSERT_EQ("Cannot read config file, reason: not valid format", conf.errors()[0]);
}

TEST(yaml_configuration_test, bad_conversion_is_recorded)
{
	yaml_configuration conf("opamp:\n  timeout_ms: soon\n");

	ASSERT_EQ(500u, conf.get_scalar<uint32_t>("opamp", "timeout_ms", 500));
	ASSERT_EQ(1u, conf.errors().size());
	ASSERT_EQ("Config file error at key: opamp.timeout_ms", conf.errors()[0]);
}

TEST(yaml_configuration_test, first_file_wins)
{
	test_helpers::scoped_temp_directory dir;
	const std::string override_file = dir.write_file("opamp.yaml", OVERRIDE_YAML);
	const std::string default_file = dir.write_file("opamp.default.yaml", DEFAULT_YAML);

	yaml_configuration conf({override_file, default_file});
	std::string value;

	ASSERT_TRUE(conf.errors().empty());
	ASSERT_TRUE(conf.warnings().empty());
	ASSERT_EQ(0, conf.get_scalar_depth<std::string>("opamp", "endpoint", value));
	ASSERT_EQ("wss://opamp.example.com/v1/opamp", value);
	ASSERT_EQ(1, conf.get_scalar_depth<std::string>("log", "console_priority", value));
	ASSERT_EQ("error", value);
	ASSERT_EQ("debug", conf.get_scalar<std::string>("log", "file_priority", ""));
}

TEST(yaml_configuration_test, missing_file_is_a_warning)
{
	test_helpers::scoped_temp_directory dir;
	const std::string default_file = dir.write_file("opamp.default.yaml", DEFAULT_YAML);

	yaml_configuration conf({dir.path("absent.yaml"), default_file});

	ASSERT_TRUE(conf.errors().empty());
	ASSERT_EQ(1u, conf.warnings().size());
	ASSERT_EQ("Config file: " + dir.path("absent.yaml") + " does not exist", conf.warnings()[0]);
	ASSERT_EQ(30000u, conf.get_scalar<uint32_t>("opamp", "timeout_ms", 0));
}

TEST(yaml_configuration_test, malformed_file_is_an_error)
{
	test_helpers::scoped_temp_directory dir;
	const std::string bad_file = dir.write_file("bad.yaml", "opamp: {endpoint: [");

	yaml_configuration conf({bad_file});

	ASSERT_EQ(1u, conf.errors().size());
	ASSERT_NE(std::string::npos, conf.errors()[0].find(bad_file));
	ASSERT_TRUE(conf.get_roots().empty());
}

TEST(yaml_configuration_test, merged_map_prefers_higher_priority)
{
	test_helpers::scoped_temp_directory dir;
	const std::string override_file = dir.write_file("opamp.yaml", OVERRIDE_YAML);
	const std::string default_file = dir.write_file("opamp.default.yaml", DEFAULT_YAML);

	yaml_configuration conf({override_file, default_file});
	auto headers = conf.get_merged_map<std::string>("opamp", "headers");

	ASSERT_EQ(2u, headers.size());
	ASSERT_EQ("blue", headers["x-tenant"]);
	ASSERT_EQ("eu", headers["x-region"]);
	ASSERT_TRUE(conf.get_merged_map<std::string>("opamp", "absent").empty());
}
