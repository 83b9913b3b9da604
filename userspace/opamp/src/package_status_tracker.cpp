/**
 * @file
 *
 * Implementation of package_status_tracker.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "package_status_tracker.h"
#include "common_logger.h"

COMMON_LOGGER();

namespace opamp
{

void package_status_tracker::on_offered(const packages_available& offer)
{
	std::map<std::string, entry> next;

	for (const auto& pkg : offer.packages)
	{
		entry e;
		auto it = m_packages.find(pkg.name);
		if (it != m_packages.end())
		{
			e = it->second;
		}

		e.status.name = pkg.name;
		e.status.state = package_state::OFFERED;
		e.status.error.clear();
		e.offered_version = pkg.version;
		e.offered_hash = pkg.hash;
		next[pkg.name] = e;
	}

	m_packages.swap(next);
	m_all_packages_hash = offer.all_packages_hash;
}

bool package_status_tracker::update(const package_status& status)
{
	auto it = m_packages.find(status.name);
	if (it == m_packages.end())
	{
		// Packages installed outside of an offer can still be reported
		if (status.state != package_state::INSTALLED)
		{
			LOG_WARNING("Rejecting status %s for package %s which was never offered",
			            to_string(status.state),
			            status.name.c_str());
			return false;
		}
		m_packages[status.name].status = status;
		return true;
	}

	const package_state from = it->second.status.state;
	if (!is_valid_transition(from, status.state))
	{
		LOG_WARNING("Rejecting illegal package transition %s -> %s for %s",
		            to_string(from),
		            to_string(status.state),
		            status.name.c_str());
		return false;
	}

	LOG_DEBUG("Package %s: %s -> %s",
	          status.name.c_str(),
	          to_string(from),
	          to_string(status.state));
	it->second.status = status;
	return true;
}

bool package_status_tracker::get(const std::string& name, package_status& out) const
{
	auto it = m_packages.find(name);
	if (it == m_packages.end())
	{
		return false;
	}
	out = it->second.status;
	return true;
}

void package_status_tracker::to_proto(opampproto::PackageStatuses& out) const
{
	out.Clear();
	out.set_server_provided_all_packages_hash(m_all_packages_hash);

	for (const auto& kv : m_packages)
	{
		const entry& e = kv.second;
		opampproto::PackageStatus& ps = (*out.mutable_packages())[kv.first];

		ps.set_name(kv.first);
		ps.set_agent_has_version(e.status.agent_has_version);
		ps.set_agent_has_hash(e.status.agent_has_hash);
		ps.set_server_offered_version(e.offered_version);
		ps.set_server_offered_hash(e.offered_hash);
		ps.set_status(to_wire(e.status.state));
		ps.set_error_message(e.status.error);
	}
}

bool package_status_tracker::is_valid_transition(const package_state from,
                                                 const package_state to)
{
	if (from == to)
	{
		return true;
	}

	switch (from)
	{
	case package_state::OFFERED:
		return to == package_state::DOWNLOADING ||
		       to == package_state::INSTALLED ||
		       to == package_state::FAILED;
	case package_state::DOWNLOADING:
		return to == package_state::DOWNLOADED || to == package_state::FAILED;
	case package_state::DOWNLOADED:
		return to == package_state::INSTALLING || to == package_state::FAILED;
	case package_state::INSTALLING:
		return to == package_state::INSTALLED || to == package_state::FAILED;
	case package_state::INSTALLED:
	case package_state::FAILED:
		return false;
	}
	return false;
}

opampproto::PackageStatusEnum package_status_tracker::to_wire(const package_state state)
{
	switch (state)
	{
	case package_state::OFFERED:
	case package_state::DOWNLOADED:
		return opampproto::PackageStatusEnum_InstallPending;
	case package_state::DOWNLOADING:
		return opampproto::PackageStatusEnum_Downloading;
	case package_state::INSTALLING:
		return opampproto::PackageStatusEnum_Installing;
	case package_state::INSTALLED:
		return opampproto::PackageStatusEnum_Installed;
	case package_state::FAILED:
		return opampproto::PackageStatusEnum_InstallFailed;
	}
	return opampproto::PackageStatusEnum_InstallFailed;
}

const char* package_status_tracker::to_string(const package_state state)
{
	switch (state)
	{
	case package_state::OFFERED:
		return "OFFERED";
	case package_state::DOWNLOADING:
		return "DOWNLOADING";
	case package_state::DOWNLOADED:
		return "DOWNLOADED";
	case package_state::INSTALLING:
		return "INSTALLING";
	case package_state::INSTALLED:
		return "INSTALLED";
	case package_state::FAILED:
		return "FAILED";
	}
	return "UNKNOWN";
}

packages_available package_status_tracker::from_proto(const opampproto::PackagesAvailable& offer)
{
	packages_available ret;
	ret.all_packages_hash = offer.all_packages_hash();

	for (const auto& kv : offer.packages())
	{
		const opampproto::PackageAvailable& in = kv.second;
		package_available pkg;

		pkg.name = kv.first;
		pkg.addon = in.type() == opampproto::PackageType_Addon;
		pkg.version = in.version();
		pkg.hash = in.hash();
		if (in.has_file())
		{
			pkg.download_url = in.file().download_url();
			pkg.content_hash = in.file().content_hash();
			pkg.signature = in.file().signature();
			for (const auto& header : in.file().headers().headers())
			{
				pkg.download_headers[header.key()] = header.value();
			}
		}
		ret.packages.push_back(pkg);
	}
	return ret;
}

} // namespace opamp
