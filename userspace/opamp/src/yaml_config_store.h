/**
 * @file
 *
 * Interface to yaml_config_store.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "collaborators.h"

#include <Poco/SHA1Engine.h>

#include <mutex>
#include <string>

namespace opamp
{

/**
 * A config_store for agents configured with yaml. Every remote config
 * file is a yaml mapping; the files are merged, in name order, over the
 * base file and the result is written to the effective file.
 */
class yaml_config_store : public config_store
{
public:
	// Name of the single file reported as effective config
	static const char* const EFFECTIVE_FILE_NAME;
	static const char* const CONTENT_TYPE;

	/**
	 * @param base_file      yaml file the remote config is merged over;
	 *                       may be missing
	 * @param effective_file where the merged result is written; empty
	 *                       keeps it in memory only
	 */
	yaml_config_store(const std::string& base_file, const std::string& effective_file);

	apply_result apply(const remote_config& config) override;

	effective_config current_effective_config() override;

private:
	bool build(const config_map& remote, std::string& body, std::string& errstr) const;
	bool write(const std::string& body, std::string& errstr) const;
	std::string digest(const std::string& body);

	const std::string m_base_file;
	const std::string m_effective_file;

	std::mutex m_lock;
	Poco::SHA1Engine m_sha1_engine;
	std::string m_body;
	std::string m_hash;
};

} // namespace opamp
