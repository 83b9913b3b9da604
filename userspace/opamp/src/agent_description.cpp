/**
 * @file
 *
 * Implementation of agent_description.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "agent_description.h"
#include "common_logger.h"

#include <Poco/Environment.h>
#include <Poco/Exception.h>

COMMON_LOGGER();

namespace
{

void add_attribute(google::protobuf::RepeatedPtrField<opampproto::KeyValue>* attributes,
                   const std::string& key,
                   const std::string& value)
{
	opampproto::KeyValue* kv = attributes->Add();
	kv->set_key(key);
	kv->mutable_value()->set_string_value(value);
}

std::string host_name()
{
	try
	{
		return Poco::Environment::nodeName();
	}
	catch (const Poco::Exception& ex)
	{
		LOG_WARNING("Unable to determine host name: %s", ex.displayText().c_str());
		return "";
	}
}

} // namespace

namespace opamp
{
namespace agent_description
{

opampproto::AgentDescription build(const std::string& service_name,
                                   const std::string& service_version,
                                   const instance_uid& uid,
                                   const std::map<std::string, std::string>& extra)
{
	opampproto::AgentDescription ret;

	add_attribute(ret.mutable_identifying_attributes(), "service.name", service_name);
	if (!service_version.empty())
	{
		add_attribute(ret.mutable_identifying_attributes(),
		              "service.version",
		              service_version);
	}
	add_attribute(ret.mutable_identifying_attributes(),
	              "service.instance.id",
	              uid.to_string());

	add_attribute(ret.mutable_non_identifying_attributes(),
	              "os.type",
	              Poco::Environment::osName());
	add_attribute(ret.mutable_non_identifying_attributes(),
	              "os.version",
	              Poco::Environment::osVersion());
	add_attribute(ret.mutable_non_identifying_attributes(), "host.name", host_name());

	for (const auto& attr : extra)
	{
		add_attribute(ret.mutable_non_identifying_attributes(), attr.first, attr.second);
	}

	return ret;
}

std::string find_attribute(const opampproto::AgentDescription& description,
                           const std::string& key)
{
	for (const auto& kv : description.identifying_attributes())
	{
		if (kv.key() == key)
		{
			return kv.value().string_value();
		}
	}
	for (const auto& kv : description.non_identifying_attributes())
	{
		if (kv.key() == key)
		{
			return kv.value().string_value();
		}
	}
	return "";
}

} // namespace agent_description
} // namespace opamp
