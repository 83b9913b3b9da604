/**
 * @file
 *
 * Interface to scoped_config.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <configuration_manager.h>

#include <stdexcept>
#include <string>

namespace test_helpers
{

/**
 * Manages lifetime of a single configuration value. The value
 * is set back when this object is destroyed
 *
 * Note that this only works for configs that use the
 * configuration_manager.
 */
template <typename config_type>
class scoped_config
{
public:
	scoped_config(const std::string& key, const config_type& value):
		m_key(key),
		m_old(lookup(key)->get_value())
	{
		lookup(key)->get() = value;
	}

	~scoped_config()
	{
		lookup(m_key)->get() = m_old;
	}

private:
	static type_config<config_type>* lookup(const std::string& key)
	{
		type_config<config_type>* config =
			configuration_manager::instance().get_mutable_config<config_type>(key);

		if(config == nullptr)
		{
			throw std::invalid_argument("No config registered for " + key);
		}

		return config;
	}

	const std::string m_key;
	const config_type m_old;
};

}
