/**
 * @file
 *
 * Interface to package_status_tracker.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "collaborators.h"
#include "opamp.pb.h"

#include <map>
#include <string>

namespace opamp
{

/**
 * Keeps the local installation progress of every package the server has
 * offered and renders it as PackageStatuses.
 *
 * Legal progress is OFFERED -> DOWNLOADING -> DOWNLOADED -> INSTALLING ->
 * INSTALLED, with FAILED reachable from any non-final state. A new offer
 * puts a package back to OFFERED.
 *
 * Not thread safe; the session guards it.
 */
class package_status_tracker
{
public:
	/**
	 * Record a new offer from the server. Packages missing from the offer
	 * are forgotten.
	 */
	void on_offered(const packages_available& offer);

	/**
	 * Apply a status reported by the package manager.
	 *
	 * @return false if the transition is illegal; the status is ignored
	 */
	bool update(const package_status& status);

	bool get(const std::string& name, package_status& out) const;

	size_t size() const { return m_packages.size(); }

	void to_proto(opampproto::PackageStatuses& out) const;

	static bool is_valid_transition(package_state from, package_state to);

	static opampproto::PackageStatusEnum to_wire(package_state state);

	static const char* to_string(package_state state);

	/**
	 * Convert a wire offer to the value handed to the package manager.
	 */
	static packages_available from_proto(const opampproto::PackagesAvailable& offer);

private:
	struct entry
	{
		package_status status;
		std::string offered_version;
		std::string offered_hash;
	};

	std::map<std::string, entry> m_packages;
	std::string m_all_packages_hash;
};

} // namespace opamp
