/**
 * @file
 *
 * Interface to configuration_manager.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "type_config.h"
#include <functional>
#include <map>
#include <string>

class yaml_configuration;
class configuration_unit;

/**
 * Manages all the individual configuration units.  Each configuration_unit
 * registers with the configuration manager upon construction and
 * deregisters with it on destruction.  Once registered, calls to
 * init_config or print_config will ensure that configuration_unit is
 * accounted for.
 */
class configuration_manager
{
public:
	/*
	 * The print_config function enables clients to provide a logging
	 * function to invoke.  This is the type of that logging function.
	 */
	using log_delegate = std::function<void(const std::string&)>;

	/**
	 * Return the singleton instance of the configuration_manager.
	 */
	static configuration_manager& instance();

	/**
	 * Initializes each configuration_unit registered, then runs every
	 * post_init delegate.
	 *
	 * @param raw_config the yaml_configuration containing all the data
	 */
	void init_config(const yaml_configuration& raw_config);

	/**
	 * Prints each configuration_unit registered and not hidden.
	 */
	void print_config(const log_delegate& logger) const;

	/**
	 * Registers a configuration_unit to be inited/printed at the
	 * appropriate time.
	 *
	 * Config should be non-null and contain a non-zero length and unique
	 * keystring. Duplicate registrations are rejected.
	 *
	 * NOTE: NOT thread safe
	 *
	 * @return true if the unit was registered
	 */
	bool register_config(configuration_unit* config);

	/**
	 * Deregisters the given configuration_unit.
	 */
	void deregister_config(configuration_unit* config);

	/**
	 * Returns true if the given config is registered, false otherwise.
	 */
	bool is_registered(const configuration_unit* config) const;

	/**
	 * Get the config object with the given name.  If there is no config
	 * with the given name, or if the config with the given name isn't
	 * of the given config_type, then this will return nullptr.
	 *
	 * @tparam config_type The underlying type of the configuration's value
	 *
	 * @param[in] name The name (key string) for the configuration.
	 */
	template<typename config_type>
	const type_config<config_type>* get_config(const std::string& name) const;

	/**
	 * Non-const variant of get_config(). Only use this if you need to
	 * change the config.
	 */
	template<typename config_type>
	type_config<config_type>* get_mutable_config(const std::string& name);

	/**
	 * Generate a yaml from the registered configuration.
	 */
	std::string to_yaml() const;

private:
	using config_map_t = std::map<std::string, configuration_unit*>;

	// Prevent clients from creating copies, deleting, assigning, etc.
	configuration_manager() = default;
	~configuration_manager() = default;
	configuration_manager(const configuration_manager& rhs) = delete;
	configuration_manager(const configuration_manager&& rhs) = delete;
	configuration_manager& operator=(const configuration_manager& rhs) = delete;
	configuration_manager& operator=(const configuration_manager&& rhs) = delete;

	configuration_unit* find_unit(const std::string& name) const;

	config_map_t m_config_map;
};

#include "configuration_manager.hpp"
