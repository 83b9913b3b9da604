/**
 * @file
 *
 * Interface to extension_registry.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "collaborators.h"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace opamp
{

/**
 * Routes custom messages to handlers keyed by capability name. The set
 * of registered capabilities is what the agent advertises in
 * CustomCapabilities.
 */
class extension_registry
{
public:
	using handler = std::function<void(const custom_message&)>;

	/**
	 * Register a handler for the capability, replacing any previous one.
	 *
	 * @return false if the name is empty or the handler is empty
	 */
	bool register_handler(const std::string& capability, handler h);

	/**
	 * @return true if a handler was removed
	 */
	bool unregister_handler(const std::string& capability);

	/**
	 * Invoke the handler for msg.capability. The handler runs without
	 * the registry lock held.
	 *
	 * @return false if no handler is registered for the capability or the
	 *         handler threw
	 */
	bool dispatch(const custom_message& msg) const;

	bool has(const std::string& capability) const;

	/**
	 * The registered capability names in sorted order.
	 */
	std::vector<std::string> capabilities() const;

private:
	mutable std::mutex m_lock;
	std::map<std::string, handler> m_handlers;
};

} // namespace opamp
