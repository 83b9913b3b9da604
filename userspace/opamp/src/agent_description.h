/**
 * @file
 *
 * Builds the AgentDescription sent to the server.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "instance_uid.h"
#include "opamp.pb.h"

#include <map>
#include <string>

namespace opamp
{
namespace agent_description
{

/**
 * Identifying attributes are service.name, service.version and
 * service.instance.id. Non identifying attributes are os.type,
 * os.version and host.name, followed by the given extras.
 */
opampproto::AgentDescription build(const std::string& service_name,
                                   const std::string& service_version,
                                   const instance_uid& uid,
                                   const std::map<std::string, std::string>& extra);

/**
 * @return the string value of the attribute, or an empty string
 */
std::string find_attribute(const opampproto::AgentDescription& description,
                           const std::string& key);

} // namespace agent_description
} // namespace opamp
