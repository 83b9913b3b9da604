/**
 * @file
 *
 * Implementation of configuration_manager%'s template methods.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */

template<typename config_type>
const type_config<config_type>* configuration_manager::get_config(
		const std::string& name) const
{
	return dynamic_cast<const type_config<config_type>*>(find_unit(name));
}

template<typename config_type>
type_config<config_type>* configuration_manager::get_mutable_config(
   const std::string& name)
{
	return dynamic_cast<type_config<config_type>*>(find_unit(name));
}
