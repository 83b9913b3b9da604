/**
 * @file
 *
 * Implementation of configuration_manager.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "configuration_manager.h"
#include "type_config.h"
#include <cstdio>
#include <map>

namespace
{

configuration_manager* s_instance = nullptr;

} // end namespace


configuration_manager& configuration_manager::instance()
{
	if(s_instance == nullptr)
	{
		s_instance = new configuration_manager();
	}

	return *s_instance;
}

void configuration_manager::init_config(const yaml_configuration& raw_config)
{
	for (const auto& config : m_config_map)
	{
		config.second->init(raw_config);
	}

	for(const auto& config : m_config_map)
	{
		config.second->post_init();
	}
}

void configuration_manager::print_config(const log_delegate& logger) const
{
	for (const auto& config : m_config_map)
	{
		if(!config.second->hidden())
		{
			logger(config.second->to_string());
		}
	}
}

bool configuration_manager::register_config(configuration_unit* config)
{
	// Registration happens during static initialization, before any
	// logger exists, so problems go to stderr.
	if (config == nullptr || config->get_key_string().empty())
	{
		fprintf(stderr, "configuration_manager: rejecting unnamed config\n");
		return false;
	}

	if (m_config_map.find(config->get_key_string()) != m_config_map.end())
	{
		fprintf(stderr,
		        "configuration_manager: duplicate config %s\n",
		        config->get_key_string().c_str());
		return false;
	}

	m_config_map.emplace(config->get_key_string(), config);
	return true;
}

void configuration_manager::deregister_config(configuration_unit* config)
{
	if (config == nullptr || config->get_key_string().empty())
	{
		return;
	}

	auto itr = m_config_map.find(config->get_key_string());
	if (itr != m_config_map.end() && itr->second == config)
	{
		m_config_map.erase(itr);
	}
}

bool configuration_manager::is_registered(const configuration_unit* config) const
{
	auto itr = m_config_map.find(config->get_key_string());
	return itr != m_config_map.end() && itr->second == config;
}

configuration_unit* configuration_manager::find_unit(const std::string& name) const
{
	config_map_t::const_iterator itr = m_config_map.find(name);

	if(itr == m_config_map.end())
	{
		return nullptr;
	}

	return itr->second;
}

std::string configuration_manager::to_yaml() const
{
	std::string yaml;
	yaml.reserve(1024);

	const std::string *previous_key = nullptr;
	const std::string *previous_subkey = nullptr;
	const std::string *previous_subsubkey = nullptr;

	for(const auto& value : m_config_map)
	{
		const configuration_unit &config = *value.second;

		if(!previous_key || config.get_key() != *previous_key)
		{
			yaml += "\n" + config.get_key() + ":";
			previous_key = &config.get_key();
			previous_subkey = nullptr;
			previous_subsubkey = nullptr;
		}

		if(!config.get_subkey().empty())
		{
			if(!previous_subkey || config.get_subkey() != *previous_subkey)
			{
				yaml += "\n  " + config.get_subkey() + ":";
				previous_subkey = &config.get_subkey();
				previous_subsubkey = nullptr;
			}
		}

		if(!config.get_subsubkey().empty())
		{
			if(!previous_subsubkey || config.get_subsubkey() != *previous_subsubkey)
			{
				previous_subsubkey = &config.get_subsubkey();
				yaml += "\n    " + config.get_subsubkey() + ":";
			}
		}

		yaml += " " + config.value_to_string();
	}

	yaml += "\n";
	return yaml;
}
