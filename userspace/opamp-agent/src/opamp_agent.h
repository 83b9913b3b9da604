/**
 * @file
 *
 * Interface to opamp_agent_app.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <Poco/Util/ServerApplication.h>

#include <string>
#include <vector>

namespace opamp_agent
{

/**
 * The opamp-agent process: loads the yaml configuration, sets up
 * logging and runs an opamp_client backed by a yaml_config_store until
 * it is asked to terminate.
 */
class opamp_agent_app : public Poco::Util::ServerApplication
{
public:
	opamp_agent_app();
	~opamp_agent_app();

protected:
	void initialize(Application& self) override;
	void uninitialize() override;
	void defineOptions(Poco::Util::OptionSet& options) override;
	void handleOption(const std::string& name, const std::string& value) override;
	int main(const std::vector<std::string>& args) override;

private:
	bool load_configuration();
	void initialize_logging();
	int run_client();

	std::string m_config_file;
	std::string m_base_config_file;
	std::string m_effective_config_file;
	bool m_help_requested;
};

}  // namespace opamp_agent
