/**
 * @file
 *
 * Unit tests for yaml_config_store.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "scoped_temp_directory.h"
#include "yaml_config_store.h"

#include <gtest.h>
#include <yaml-cpp/yaml.h>

using namespace opamp;
using test_helpers::scoped_temp_directory;

namespace
{

remote_config yaml_config(const std::string& body, const std::string& hash = "abc123")
{
	remote_config ret;
	ret.files["remote.yaml"].body = body;
	ret.files["remote.yaml"].content_type = "text/yaml";
	ret.hash = hash;
	return ret;
}

}  // namespace

TEST(yaml_config_store_test, remote_config_merges_over_base)
{
	scoped_temp_directory dir;
	const std::string base = dir.write_file("base.yaml",
	                                        "log:\n"
	                                        "  file_priority: info\n"
	                                        "  console_priority: error\n"
	                                        "collector: 10.0.0.1\n");
	yaml_config_store store(base, dir.path("effective.yaml"));
	const std::string initial_hash = store.current_effective_config().hash;

	const apply_result result = store.apply(yaml_config("log:\n  file_priority: debug\n"));
	ASSERT_EQ(apply_result::status::APPLIED, result.result);

	const YAML::Node written = YAML::Load(dir.read_file("effective.yaml"));
	ASSERT_EQ("debug", written["log"]["file_priority"].as<std::string>());
	ASSERT_EQ("error", written["log"]["console_priority"].as<std::string>());
	ASSERT_EQ("10.0.0.1", written["collector"].as<std::string>());

	const effective_config effective = store.current_effective_config();
	ASSERT_NE(initial_hash, effective.hash);
	ASSERT_EQ(1u, effective.files.size());
	const config_file& file = effective.files.at(yaml_config_store::EFFECTIVE_FILE_NAME);
	ASSERT_EQ(yaml_config_store::CONTENT_TYPE, file.content_type);
	ASSERT_EQ(dir.read_file("effective.yaml"), file.body);
}

TEST(yaml_config_store_test, missing_base_file)
{
	scoped_temp_directory dir;
	yaml_config_store store(dir.path("nope.yaml"), "");

	ASSERT_EQ(apply_result::status::APPLIED,
	          store.apply(yaml_config("opamp:\n  poll_interval: 5\n")).result);

	const YAML::Node effective =
		YAML::Load(store.current_effective_config().files.at("effective.yaml").body);
	ASSERT_EQ(5, effective["opamp"]["poll_interval"].as<int>());
}

TEST(yaml_config_store_test, same_content_keeps_hash)
{
	scoped_temp_directory dir;
	yaml_config_store store("", dir.path("effective.yaml"));

	store.apply(yaml_config("a: 1\n"));
	const std::string hash = store.current_effective_config().hash;

	ASSERT_EQ(apply_result::status::APPLIED, store.apply(yaml_config("a: 1\n", "other")).result);
	ASSERT_EQ(hash, store.current_effective_config().hash);
}

TEST(yaml_config_store_test, non_yaml_content_type_is_rejected)
{
	yaml_config_store store("", "");
	const std::string hash = store.current_effective_config().hash;

	remote_config config = yaml_config("{\"a\": 1}");
	config.files["remote.yaml"].content_type = "application/json";

	const apply_result result = store.apply(config);
	ASSERT_EQ(apply_result::status::FAILED, result.result);
	ASSERT_NE(std::string::npos, result.reason.find("unsupported content type"));
	ASSERT_EQ(hash, store.current_effective_config().hash);
}

TEST(yaml_config_store_test, non_mapping_is_rejected)
{
	yaml_config_store store("", "");

	const apply_result result = store.apply(yaml_config("- a\n- b\n"));
	ASSERT_EQ(apply_result::status::FAILED, result.result);
	ASSERT_NE(std::string::npos, result.reason.find("mapping"));
}

TEST(yaml_config_store_test, malformed_yaml_is_rejected)
{
	yaml_config_store store("", "");

	ASSERT_EQ(apply_result::status::FAILED, store.apply(yaml_config("a: [1, 2\n")).result);
}

TEST(yaml_config_store_test, unwritable_effective_file)
{
	scoped_temp_directory dir;
	yaml_config_store store("", dir.path("missing/effective.yaml"));

	const apply_result result = store.apply(yaml_config("a: 1\n"));
	ASSERT_EQ(apply_result::status::FAILED, result.result);
	ASSERT_FALSE(result.reason.empty());
}
