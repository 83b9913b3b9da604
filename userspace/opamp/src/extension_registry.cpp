/**
 * @file
 *
 * Implementation of extension_registry.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "extension_registry.h"
#include "common_logger.h"

COMMON_LOGGER();

namespace opamp
{

bool extension_registry::register_handler(const std::string& capability, handler h)
{
	if (capability.empty() || !h)
	{
		LOG_WARNING("Ignoring invalid custom capability registration");
		return false;
	}

	std::lock_guard<std::mutex> lock(m_lock);
	if (m_handlers.find(capability) != m_handlers.end())
	{
		LOG_INFO("Replacing handler for custom capability %s", capability.c_str());
	}
	m_handlers[capability] = std::move(h);
	return true;
}

bool extension_registry::unregister_handler(const std::string& capability)
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_handlers.erase(capability) > 0;
}

bool extension_registry::dispatch(const custom_message& msg) const
{
	handler h;
	{
		std::lock_guard<std::mutex> lock(m_lock);
		auto it = m_handlers.find(msg.capability);
		if (it == m_handlers.end())
		{
			LOG_INFO("Ignoring message for unknown custom capability %s (type %s)",
			         msg.capability.c_str(),
			         msg.type.c_str());
			return false;
		}
		h = it->second;
	}

	try
	{
		h(msg);
	}
	catch (const std::exception& ex)
	{
		LOG_ERROR("Handler for custom capability %s failed on type %s: %s",
		          msg.capability.c_str(),
		          msg.type.c_str(),
		          ex.what());
		return false;
	}
	return true;
}

bool extension_registry::has(const std::string& capability) const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_handlers.find(capability) != m_handlers.end();
}

std::vector<std::string> extension_registry::capabilities() const
{
	std::vector<std::string> ret;
	std::lock_guard<std::mutex> lock(m_lock);
	ret.reserve(m_handlers.size());
	for (const auto& entry : m_handlers)
	{
		ret.push_back(entry.first);
	}
	return ret;
}

} // namespace opamp
