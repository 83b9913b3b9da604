/**
 * @file
 *
 * Interface to type_config.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

class yaml_configuration;

/**
 * A named, typed configuration value that lives next to the code using it.
 * Each unit registers itself with the configuration_manager, which fills
 * every unit in from the YAML configuration in one pass:
 *
 * type_config<uint32_t> c_timeout_ms(30000,
 *                                    "Handshake timeout",
 *                                    "opamp",
 *                                    "timeout_ms");
 *
 * type_config<uint32_t>::ptr c_queue_bound =
 *      type_config_builder<uint32_t>(64, "Critical queue bound", "opamp", "queue_bound")
 *          .min(1).build();
 *
 * ...
 * c_timeout_ms.get_value();
 *
 * Units must be created during static initialization; registration takes
 * no lock.
 */
class configuration_unit
{
public:
	/**
	 * Up to three levels of YAML keys; unused levels are "". The unit
	 * is registered with the configuration_manager here.
	 */
	configuration_unit(const std::string& key,
			   const std::string& subkey,
			   const std::string& subsubkey,
			   const std::string& description);
	virtual ~configuration_unit();

	/**
	 * @return "<key string>: <value>"
	 */
	std::string to_string() const;

	virtual std::string value_to_string() const = 0;

	/**
	 * Read the value from raw_config, falling back to the default.
	 */
	virtual void init(const yaml_configuration& raw_config) = 0;

	/**
	 * The dotted name: key, key.subkey or key.subkey.subsubkey. This is
	 * the name the configuration_manager knows the unit by.
	 */
	const std::string& get_key_string() const;

	const std::string& get_key() const;
	const std::string& get_subkey() const;
	const std::string& get_subsubkey() const;
	const std::string& get_description() const;

	/**
	 * Hidden units (secrets) are left out of print_config().
	 */
	void hidden(bool value);
	bool hidden() const;

	/**
	 * Runs once every unit has been through init().
	 */
	virtual void post_init() = 0;

protected:
	// Scalars go through std::to_string()
	template<typename value_type>
	static std::string get_value_string(const value_type& value)
	{
		return std::to_string(value);
	}

	/**
	 * Sequences render as "[a, b, c]".
	 */
	template<typename value_type>
	static std::string get_value_string(const std::vector<value_type>& values)
	{
		std::stringstream out;
		const char* separator = "";

		out << "[";
		for (const auto& value : values)
		{
			out << separator << get_value_string<value_type>(value);
			separator = ", ";
		}
		out << "]";

		return out.str();
	}

	/**
	 * Maps render as "{k1: v1, k2: v2}" in key order.
	 */
	template<typename key_type, typename value_type>
	static std::string get_value_string(const std::map<key_type, value_type>& value_map)
	{
		std::stringstream out;
		bool first = true;

		out << "{";
		for (const auto& entry : value_map)
		{
			if (!first)
			{
				out << ", ";
			}
			first = false;
			out << get_value_string<key_type>(entry.first) << ": "
			    << get_value_string<value_type>(entry.second);
		}
		out << "}";

		return out.str();
	}

private:
	const std::string m_key;
	const std::string m_subkey;
	const std::string m_subsubkey;
	const std::string m_description;
	std::string m_keystring;
	bool m_hidden;
};

template<>
inline std::string configuration_unit::get_value_string<bool>(const bool& value)
{
	return value ? "true" : "false";
}

template<>
inline std::string configuration_unit::get_value_string<std::string>(const std::string& value)
{
	return value;
}


/**
 * configuration_unit holding one value of data_type. Any type yaml-cpp can
 * convert (scalars, sequences, string maps) works.
 */
template<typename data_type>
class type_config : public configuration_unit
{
	static_assert(!std::is_same<data_type, uint8_t>::value,
	              "data_type = uint8_t is not supported");
	static_assert(!std::is_same<data_type, int8_t>::value,
	              "data_type = int8_t is not supported");
public:
	using ptr = std::shared_ptr<const type_config<data_type>>;
	using mutable_ptr = std::shared_ptr<type_config<data_type>>;

	// Holds the default until init() runs
	type_config(const data_type& default_value,
		    const std::string& description,
		    const std::string& key,
		    const std::string& subkey = "",
		    const std::string& subsubkey = "");

public: // stuff for configuration_unit
	std::string value_to_string() const override;
	void init(const yaml_configuration& raw_config) override;

	void post_init() override;

public: // other stuff
	void set(const data_type& value);
	const data_type& get_value() const;

	/**
	 * Writable access to the value, used by post_init delegates and by
	 * test_helpers::scoped_config.
	 */
	data_type& get();

	/**
	 * Returns the value configured in the yaml (or the default), before
	 * any post_init() adjustment.
	 */
	const data_type& configured() const;

	/**
	 * Sets a new default value, for configs whose default is determined
	 * at runtime.
	 */
	void set_default(const data_type& value);

	// Bounds applied by init()
	void min(const data_type& value);
	void max(const data_type& value);

	/**
	 * Delegate run from post_init(), when every other unit already holds
	 * its configured value. Use it for values derived from other units.
	 */
	using post_init_delegate = std::function<void(type_config<data_type> &)>;
	void post_init(const post_init_delegate& value);

private:
	data_type m_default;
	data_type m_data;
	data_type m_configured;

	std::unique_ptr<data_type> m_min;
	std::unique_ptr<data_type> m_max;
	post_init_delegate m_post_init;
};

/**
 * Fluent construction of a type_config with optional bounds, visibility and
 * a post_init delegate.
 */
template<typename data_type>
class type_config_builder
{
public:
	type_config_builder(const data_type& default_value,
			    const std::string& description,
			    const std::string& key,
			    const std::string& subkey = "",
			    const std::string& subsubkey = "") :
	   m_type_config(new type_config<data_type>(default_value, description, key, subkey, subsubkey))
	{}

	type_config_builder& max(const data_type& value)
	{
		m_type_config->max(value);
		return *this;
	}

	type_config_builder& min(const data_type& value)
	{
		m_type_config->min(value);
		return *this;
	}

	type_config_builder& hidden()
	{
		m_type_config->hidden(true);
		return *this;
	}

	type_config_builder& post_init(const typename type_config<data_type>::post_init_delegate& value)
	{
		m_type_config->post_init(value);
		return *this;
	}

	typename type_config<data_type>::ptr build()
	{
		return m_type_config;
	}

	// Only for units whose value is adjusted after static init
	typename type_config<data_type>::mutable_ptr build_mutable()
	{
		return m_type_config;
	}

private:
	typename type_config<data_type>::mutable_ptr m_type_config;
};
#include "type_config.hpp"
