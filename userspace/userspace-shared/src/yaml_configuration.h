/**
 * @file
 *
 * Interface to yaml_configuration, a prioritized stack of YAML documents.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once
#include "Poco/File.h"
#include "Poco/Exception.h"
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <yaml-cpp/yaml.h>
#pragma GCC diagnostic pop

#include <initializer_list>
#include <iterator>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * Raised when a required key is missing.
 */
class yaml_configuration_exception : public std::runtime_error
{
public:
	yaml_configuration_exception(const std::string& what) :
	   std::runtime_error(what)
	{
	}
};

/**
 * A list of YAML roots, highest priority first. Lookups return the value
 * from the first root which defines the key.
 *
 * WARNING: avoid assignment operator on YAML::Node object
 * they modifies underlying tree even on const YAML::Node objects
 */
class yaml_configuration
{
public:
	// Parse failures are recorded in errors() rather than thrown
	yaml_configuration(const std::string& str)
	{
		try
		{
			if(!add_root(YAML::Load(str)))
			{
				add_error("Cannot read config file, reason: not valid format");
			}
		}
		catch (const YAML::ParserException& ex)
		{
			m_errors.emplace_back(std::string("Cannot read config file, reason: ") + ex.what());
		}
	}

	yaml_configuration(const std::initializer_list<std::string>& file_paths)
	{
		load_files(std::vector<std::string>(file_paths));
	}

	yaml_configuration(const std::vector<std::string>& file_paths)
	{
		load_files(file_paths);
	}

	/**
	* Get a scalar value from config, like:
	* endpoint: "http://127.0.0.1:4320/v1/opamp"
	* Throws if value is not found.
	*/
	template<typename T>
	T get_scalar(const std::string& key) const
	{
		T value;
		if(get_scalar_depth(key, value) < 0)
		{
			throw yaml_configuration_exception("Entry not found: " + key);
		}
		return value;
	}

	/**
	* Look up key and store its value.
	*
	* @return the index of the root that defined the key, -1 if none did
	*/
	template<typename T>
	int get_scalar_depth(const std::string& key, T &value) const
	{
		for(auto itr = m_roots.begin(); itr != m_roots.end(); ++itr)
		{
			try
			{
				auto node = (*itr)[key];
				if (node.IsDefined())
				{
					value = node.as<T>();
					return std::distance(m_roots.begin(), itr);
				}
			}
			catch (const YAML::BadConversion& ex)
			{
				m_errors.emplace_back(std::string("Config file error at key: ") + key);
			}
		}

		return -1;
	}

	template<typename T>
	T get_scalar(const std::string& key, const T &default_value) const
	{
		T value;
		if(get_scalar_depth(key, value) < 0)
		{
			return default_value;
		}

		return value;
	}

	/**
	* Two level variant of get_scalar_depth, for:
	* opamp:
	*   endpoint: "ws://127.0.0.1:4320/v1/opamp"
	*/
	template<typename T>
	int get_scalar_depth(const std::string& key, const std::string& subkey, T& value) const
	{
		for(auto itr = m_roots.begin(); itr != m_roots.end(); ++itr)
		{
			try
			{
				auto node = (*itr)[key][subkey];
				if (node.IsDefined())
				{
					value = node.as<T>();
					return std::distance(m_roots.begin(), itr);
				}
			}
			catch (const YAML::BadConversion& ex)
			{
				m_errors.emplace_back(std::string("Config file error at key: ") + key + "." + subkey);
			}
		}

		return -1;
	}

	template<typename T>
	T get_scalar(const std::string& key, const std::string& subkey, const T& default_value) const
	{
		T value;
		if (get_scalar_depth(key, subkey, value) < 0)
		{
			return default_value;
		}

		return value;
	}

	/**
	* Three level variant of get_scalar_depth.
	*/
	template<typename T>
	int get_scalar_depth(const std::string& key,
			     const std::string& subkey,
			     const std::string& subsubkey,
			     T& value) const
	{
		for(auto itr = m_roots.begin(); itr != m_roots.end(); ++itr)
		{
			try
			{
				auto node = (*itr)[key][subkey][subsubkey];
				if (node.IsDefined())
				{
					value = node.as<T>();
					return std::distance(m_roots.begin(), itr);
				}
			}
			catch (const YAML::BadConversion& ex)
			{
				m_errors.emplace_back(std::string("Config file error at key: ") +
						      key + "." + subkey + "." + subsubkey);
			}
		}

		return -1;
	}

	/**
	* Get data from a map of scalars, merged between all the roots with
	* higher priority roots winning, example:
	*
	* opamp:
	*   headers:
	*     x-tenant: blue
	*
	* get_merged_map<std::string>("opamp", "headers")
	*/
	template<typename T>
	std::unordered_map<std::string, T> get_merged_map(const std::string& key,
							  const std::string& subkey) const
	{
		std::unordered_map<std::string, T> ret;
		for(auto it = m_roots.rbegin(); it != m_roots.rend(); ++it)
		{
			const YAML::Node node = (*it)[key][subkey];
			if(!node.IsDefined() || !node.IsMap())
			{
				continue;
			}

			for(const auto& item : node)
			{
				try
				{
					ret[item.first.as<std::string>()] = item.second.as<T>();
				}
				catch (const YAML::BadConversion& ex)
				{
					m_errors.emplace_back(std::string("Config file error at key ") +
							      key + "." + subkey);
				}
			}
		}
		return ret;
	}

	inline const std::vector<std::string>& errors() const
	{
		return m_errors;
	}

	inline const std::vector<std::string>& warnings() const
	{
		return m_warnings;
	}

	void add_warning(const std::string& warning)
	{
		m_warnings.emplace_back(warning);
	}

	void add_error(const std::string& err)
	{
		m_errors.emplace_back(err);
	}

	// Raw access for callers that need whole subtrees
	const std::vector<YAML::Node>& get_roots() const
	{
		return m_roots;
	}

private:
	void load_files(const std::vector<std::string>& file_paths)
	{
		// Runs before logging is configured; problems are collected instead
		for (const auto& path : file_paths)
		{
			try
			{
				Poco::File conf_file(path);
				if(conf_file.exists())
				{
					if(!add_root(YAML::LoadFile(path)))
					{
						add_error(std::string("Cannot read config file: ") + path + " reason: not valid format");
					}
				}
				else
				{
					m_warnings.emplace_back(std::string("Config file: ") + path + " does not exist");
				}
			}
			catch(const YAML::BadFile& ex)
			{
				m_errors.emplace_back(std::string("YAML::BadFile:Cannot read config file: ") + path + " reason: " + ex.what());
			}
			catch(const YAML::ParserException& ex)
			{
				m_errors.emplace_back(std::string("YAML::ParserException:Cannot read config file: ") + path + " reason: " + ex.what());
			}
			catch (const Poco::Exception& ex)
			{
				m_errors.emplace_back(std::string("Cannot read config file: ") + path + " reason: " + ex.displayText());
			}
		}
	}

	bool add_root(YAML::Node&& root)
	{
		if (root.IsMap())
		{
			m_roots.emplace_back(root);
			return true;
		}
		else
		{
			return false;
		}
	}

	std::vector<YAML::Node> m_roots;
	mutable std::vector<std::string> m_errors;
	mutable std::vector<std::string> m_warnings;
};
