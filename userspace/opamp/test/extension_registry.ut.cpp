/**
 * @file
 *
 * Unit tests for extension_registry.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "extension_registry.h"

#include <gtest.h>

#include <stdexcept>

using namespace opamp;

TEST(extension_registry_test, dispatch_to_registered_handler)
{
	extension_registry registry;
	std::string seen;

	ASSERT_TRUE(registry.register_handler("io.test.echo", [&seen](const custom_message& msg)
	{
		seen = msg.type + ":" + msg.data;
	}));

	custom_message msg;
	msg.capability = "io.test.echo";
	msg.type = "ping";
	msg.data = "42";
	ASSERT_TRUE(registry.dispatch(msg));
	ASSERT_EQ("ping:42", seen);
}

TEST(extension_registry_test, unknown_capability_is_not_dispatched)
{
	extension_registry registry;
	custom_message msg;
	msg.capability = "io.test.missing";

	ASSERT_FALSE(registry.dispatch(msg));
}

TEST(extension_registry_test, invalid_registrations)
{
	extension_registry registry;

	ASSERT_FALSE(registry.register_handler("", [](const custom_message&) {}));
	ASSERT_FALSE(registry.register_handler("io.test.echo", extension_registry::handler()));
	ASSERT_TRUE(registry.capabilities().empty());
}

TEST(extension_registry_test, replace_and_unregister)
{
	extension_registry registry;
	int which = 0;

	registry.register_handler("io.test.echo", [&which](const custom_message&) { which = 1; });
	registry.register_handler("io.test.echo", [&which](const custom_message&) { which = 2; });

	custom_message msg;
	msg.capability = "io.test.echo";
	registry.dispatch(msg);
	ASSERT_EQ(2, which);

	ASSERT_TRUE(registry.unregister_handler("io.test.echo"));
	ASSERT_FALSE(registry.unregister_handler("io.test.echo"));
	ASSERT_FALSE(registry.has("io.test.echo"));
}

TEST(extension_registry_test, capabilities_are_sorted)
{
	extension_registry registry;
	registry.register_handler("io.test.zeta", [](const custom_message&) {});
	registry.register_handler("io.test.alpha", [](const custom_message&) {});

	const std::vector<std::string> expected = {"io.test.alpha", "io.test.zeta"};
	ASSERT_EQ(expected, registry.capabilities());
}

TEST(extension_registry_test, handler_may_reenter_registry)
{
	extension_registry registry;
	bool has_self = false;

	registry.register_handler("io.test.echo", [&registry, &has_self](const custom_message& msg)
	{
		has_self = registry.has(msg.capability);
	});

	custom_message msg;
	msg.capability = "io.test.echo";
	ASSERT_TRUE(registry.dispatch(msg));
	ASSERT_TRUE(has_self);
}

TEST(extension_registry_test, throwing_handler_is_contained)
{
	extension_registry registry;
	int calls = 0;

	registry.register_handler("io.test.echo", [&calls](const custom_message& msg)
	{
		++calls;
		if (msg.type == "bad")
		{
			throw std::runtime_error("handler failed");
		}
	});

	custom_message msg;
	msg.capability = "io.test.echo";
	msg.type = "bad";
	bool handled = true;
	ASSERT_NO_THROW(handled = registry.dispatch(msg));
	ASSERT_FALSE(handled);

	// Still registered and usable
	msg.type = "good";
	ASSERT_TRUE(registry.dispatch(msg));
	ASSERT_EQ(2, calls);
}
