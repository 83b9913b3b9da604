/**
 * @file
 *
 * Implementation of scoped_configuration.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "scoped_configuration.h"

#include <configuration_manager.h>

namespace test_helpers
{

scoped_configuration::scoped_configuration(const std::string& yaml)
    : m_yaml(yaml)
{
	configuration_manager::instance().init_config(m_yaml);
}

scoped_configuration::~scoped_configuration()
{
	// No key is defined in an empty document, so every unit falls back
	// to its default.
	yaml_configuration defaults("{}");
	configuration_manager::instance().init_config(defaults);
}

bool scoped_configuration::loaded() const
{
	return m_yaml.errors().empty();
}

}  // namespace test_helpers
