/**
 * @file
 *
 * Implementation of instance_uid.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "instance_uid.h"

#include <Poco/UUID.h>
#include <Poco/UUIDGenerator.h>

namespace
{

std::string uuid_to_bytes(const Poco::UUID& uuid)
{
	char buffer[opamp::instance_uid::SIZE];
	uuid.copyTo(buffer);
	return std::string(buffer, sizeof(buffer));
}

} // end namespace

namespace opamp
{

instance_uid::instance_uid() :
	m_bytes(SIZE, '\0')
{
}

instance_uid instance_uid::generate()
{
	return instance_uid(uuid_to_bytes(Poco::UUIDGenerator::defaultGenerator().create()));
}

bool instance_uid::from_string(const std::string& text, instance_uid& out)
{
	Poco::UUID uuid;

	if (!uuid.tryParse(text))
	{
		return false;
	}

	out = instance_uid(uuid_to_bytes(uuid));
	return true;
}

bool instance_uid::from_bytes(const std::string& bytes, instance_uid& out)
{
	if (bytes.size() != SIZE)
	{
		return false;
	}

	out = instance_uid(bytes);
	return true;
}

std::string instance_uid::to_string() const
{
	Poco::UUID uuid;
	uuid.copyFrom(m_bytes.data());
	return uuid.toString();
}

bool instance_uid::is_nil() const
{
	return m_bytes == std::string(SIZE, '\0');
}

} // namespace opamp
