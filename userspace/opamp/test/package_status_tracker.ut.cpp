/**
 * @file
 *
 * Unit tests for package_status_tracker.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "package_status_tracker.h"

#include <gtest.h>

using namespace opamp;

namespace
{

packages_available offer(const std::vector<std::string>& names)
{
	packages_available ret;
	ret.all_packages_hash = "all-hash";
	for (const auto& name : names)
	{
		package_available pkg;
		pkg.name = name;
		pkg.version = "1.2.3";
		pkg.hash = name + "-hash";
		ret.packages.push_back(pkg);
	}
	return ret;
}

package_status status(const std::string& name, package_state state)
{
	package_status ret;
	ret.name = name;
	ret.state = state;
	return ret;
}

}  // namespace

TEST(package_status_tracker_test, install_lifecycle)
{
	package_status_tracker tracker;
	tracker.on_offered(offer({"collector"}));

	for (const package_state next : {package_state::DOWNLOADING,
	                                 package_state::DOWNLOADED,
	                                 package_state::INSTALLING,
	                                 package_state::INSTALLED})
	{
		ASSERT_TRUE(tracker.update(status("collector", next)))
			<< package_status_tracker::to_string(next);
	}

	package_status out;
	ASSERT_TRUE(tracker.get("collector", out));
	ASSERT_EQ(package_state::INSTALLED, out.state);
}

TEST(package_status_tracker_test, illegal_transitions_are_ignored)
{
	package_status_tracker tracker;
	tracker.on_offered(offer({"collector"}));

	ASSERT_FALSE(tracker.update(status("collector", package_state::INSTALLING)));

	package_status out;
	ASSERT_TRUE(tracker.get("collector", out));
	ASSERT_EQ(package_state::OFFERED, out.state);

	ASSERT_TRUE(tracker.update(status("collector", package_state::FAILED)));
	ASSERT_FALSE(tracker.update(status("collector", package_state::DOWNLOADING)));
}

TEST(package_status_tracker_test, transition_table)
{
	using ps = package_state;

	ASSERT_TRUE(package_status_tracker::is_valid_transition(ps::OFFERED, ps::OFFERED));
	ASSERT_TRUE(package_status_tracker::is_valid_transition(ps::OFFERED, ps::INSTALLED));
	ASSERT_TRUE(package_status_tracker::is_valid_transition(ps::DOWNLOADING, ps::FAILED));
	ASSERT_FALSE(package_status_tracker::is_valid_transition(ps::DOWNLOADING, ps::INSTALLED));
	ASSERT_FALSE(package_status_tracker::is_valid_transition(ps::INSTALLED, ps::DOWNLOADING));
	ASSERT_FALSE(package_status_tracker::is_valid_transition(ps::FAILED, ps::OFFERED));
}

TEST(package_status_tracker_test, unknown_package_only_when_installed)
{
	package_status_tracker tracker;

	ASSERT_FALSE(tracker.update(status("sidecar", package_state::DOWNLOADING)));
	ASSERT_EQ(0u, tracker.size());

	ASSERT_TRUE(tracker.update(status("sidecar", package_state::INSTALLED)));
	ASSERT_EQ(1u, tracker.size());
}

TEST(package_status_tracker_test, new_offer_forgets_missing_packages)
{
	package_status_tracker tracker;
	tracker.on_offered(offer({"a", "b"}));
	tracker.update(status("a", package_state::DOWNLOADING));

	tracker.on_offered(offer({"a"}));

	ASSERT_EQ(1u, tracker.size());
	package_status out;
	ASSERT_FALSE(tracker.get("b", out));
	ASSERT_TRUE(tracker.get("a", out));
	ASSERT_EQ(package_state::OFFERED, out.state);
}

TEST(package_status_tracker_test, wire_report)
{
	package_status_tracker tracker;
	tracker.on_offered(offer({"collector"}));

	package_status s = status("collector", package_state::DOWNLOADING);
	s.agent_has_version = "1.0.0";
	tracker.update(s);

	opampproto::PackageStatuses wire;
	tracker.to_proto(wire);

	ASSERT_EQ("all-hash", wire.server_provided_all_packages_hash());
	ASSERT_EQ(1, wire.packages_size());
	const opampproto::PackageStatus& ps = wire.packages().at("collector");
	ASSERT_EQ("collector", ps.name());
	ASSERT_EQ("1.0.0", ps.agent_has_version());
	ASSERT_EQ("1.2.3", ps.server_offered_version());
	ASSERT_EQ("collector-hash", ps.server_offered_hash());
	ASSERT_EQ(opampproto::PackageStatusEnum_Downloading, ps.status());
}

TEST(package_status_tracker_test, wire_states)
{
	ASSERT_EQ(opampproto::PackageStatusEnum_InstallPending,
	          package_status_tracker::to_wire(package_state::OFFERED));
	ASSERT_EQ(opampproto::PackageStatusEnum_InstallPending,
	          package_status_tracker::to_wire(package_state::DOWNLOADED));
	ASSERT_EQ(opampproto::PackageStatusEnum_Installing,
	          package_status_tracker::to_wire(package_state::INSTALLING));
	ASSERT_EQ(opampproto::PackageStatusEnum_Installed,
	          package_status_tracker::to_wire(package_state::INSTALLED));
	ASSERT_EQ(opampproto::PackageStatusEnum_InstallFailed,
	          package_status_tracker::to_wire(package_state::FAILED));
}

TEST(package_status_tracker_test, offer_from_wire)
{
	opampproto::PackagesAvailable wire;
	wire.set_all_packages_hash("all-hash");

	opampproto::PackageAvailable& pkg = (*wire.mutable_packages())["plugin"];
	pkg.set_type(opampproto::PackageType_Addon);
	pkg.set_version("2.0");
	pkg.set_hash("h");
	pkg.mutable_file()->set_download_url("https://example.com/plugin.tgz");
	opampproto::Header* header = pkg.mutable_file()->mutable_headers()->add_headers();
	header->set_key("Authorization");
	header->set_value("Bearer x");

	const packages_available out = package_status_tracker::from_proto(wire);

	ASSERT_EQ("all-hash", out.all_packages_hash);
	ASSERT_EQ(1u, out.packages.size());
	const package_available& p = out.packages[0];
	ASSERT_EQ("plugin", p.name);
	ASSERT_TRUE(p.addon);
	ASSERT_EQ("2.0", p.version);
	ASSERT_EQ("https://example.com/plugin.tgz", p.download_url);
	ASSERT_EQ("Bearer x", p.download_headers.at("Authorization"));
}
