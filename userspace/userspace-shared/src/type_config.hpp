/**
 * @file
 *
 * Implementation of type_config.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "yaml_configuration.h"

template<typename data_type>
type_config<data_type>::type_config(const data_type& default_value,
				    const std::string& description,
				    const std::string& key,
				    const std::string& subkey,
				    const std::string& subsubkey)
        : configuration_unit(key, subkey, subsubkey, description),
          m_default(default_value),
          m_data(default_value),
	  m_configured(default_value)
{
}

template<typename data_type>
void type_config<data_type>::init(const yaml_configuration& raw_config)
{
	data_type value = m_default;
	int depth;

	if (get_subkey().empty())
	{
		depth = raw_config.get_scalar_depth<data_type>(get_key(), value);
	}
	else if (get_subsubkey().empty())
	{
		depth = raw_config.get_scalar_depth<data_type>(get_key(),
							       get_subkey(),
							       value);
	}
	else
	{
		depth = raw_config.get_scalar_depth<data_type>(get_key(),
							       get_subkey(),
							       get_subsubkey(),
							       value);
	}

	m_data = (depth < 0) ? m_default : value;

	if (m_min && m_data < *m_min)
	{
		m_data = *m_min;
	}
	else if (m_max && m_data > *m_max)
	{
		m_data = *m_max;
	}

	m_configured = m_data;
}

template<typename data_type>
const data_type& type_config<data_type>::get_value() const
{
	return m_data;
}

template<typename data_type>
data_type& type_config<data_type>::get()
{
	return m_data;
}

template<typename data_type>
void type_config<data_type>::set(const data_type& value)
{
	m_data = value;
}

template<typename data_type>
const data_type& type_config<data_type>::configured() const
{
	return m_configured;
}

template<typename data_type>
std::string type_config<data_type>::value_to_string() const
{
	return get_value_string(m_data);
}

template<typename data_type>
void type_config<data_type>::set_default(const data_type& value)
{
	m_default = value;
	m_data = value;
	m_configured = value;
}

template<typename data_type>
void type_config<data_type>::min(const data_type& value)
{
	m_min.reset(new data_type(value));
}

template<typename data_type>
void type_config<data_type>::max(const data_type& value)
{
	m_max.reset(new data_type(value));
}

template<typename data_type>
void type_config<data_type>::post_init(const post_init_delegate& value)
{
	m_post_init = value;
}

template<typename data_type>
void type_config<data_type>::post_init()
{
	if(m_post_init)
	{
		m_post_init(*this);
	}
}
