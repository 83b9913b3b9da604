/**
 * @file
 *
 * Unit tests for outbound_queue.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "outbound_queue.h"

#include <gtest.h>

using namespace opamp;
using field = outbound_queue::field;
using disposition = outbound_queue::disposition;

namespace
{

opampproto::AgentToServer custom(const std::string& data)
{
	opampproto::AgentToServer msg;
	msg.mutable_custom_message()->set_capability("io.test.echo");
	msg.mutable_custom_message()->set_data(data);
	return msg;
}

const outbound_queue::gate SEND_ALL = [](field) { return disposition::SEND; };

}  // namespace

TEST(outbound_queue_test, full_queue_drops_oldest)
{
	outbound_queue queue(2);

	ASSERT_EQ(0u, queue.push_critical(custom("m1")));
	ASSERT_EQ(0u, queue.push_critical(custom("m2")));
	ASSERT_EQ(1u, queue.push_critical(custom("m3")));
	ASSERT_EQ(1u, queue.dropped_total());
	ASSERT_EQ(2u, queue.critical_size());

	opampproto::AgentToServer out;
	ASSERT_TRUE(queue.take(SEND_ALL, out));
	ASSERT_EQ("m2", out.custom_message().data());

	out.Clear();
	ASSERT_TRUE(queue.take(SEND_ALL, out));
	ASSERT_EQ("m3", out.custom_message().data());

	out.Clear();
	ASSERT_FALSE(queue.take(SEND_ALL, out));
	ASSERT_TRUE(queue.empty());
}

TEST(outbound_queue_test, zero_bound_keeps_one)
{
	outbound_queue queue(0);

	queue.push_critical(custom("m1"));
	ASSERT_EQ(1u, queue.push_critical(custom("m2")));
	ASSERT_EQ(1u, queue.critical_size());
}

TEST(outbound_queue_test, status_fields_coalesce)
{
	outbound_queue queue(4);
	opampproto::ComponentHealth health;

	health.set_status("starting");
	queue.set_health(health);
	health.set_status("running");
	queue.set_health(health);

	opampproto::AgentToServer out;
	ASSERT_TRUE(queue.take(SEND_ALL, out));
	ASSERT_EQ("running", out.health().status());
	ASSERT_TRUE(queue.empty());
}

TEST(outbound_queue_test, held_fields_stay_pending)
{
	outbound_queue queue(4);
	opampproto::RemoteConfigStatus status;
	status.set_last_remote_config_hash("abc123");
	queue.set_remote_config_status(status);
	queue.set_agent_description(opampproto::AgentDescription());

	opampproto::AgentToServer out;
	ASSERT_TRUE(queue.take([](field f)
	{
		return f == field::AGENT_DESCRIPTION ? disposition::SEND : disposition::HOLD;
	}, out));
	ASSERT_TRUE(out.has_agent_description());
	ASSERT_FALSE(out.has_remote_config_status());
	ASSERT_FALSE(queue.empty());

	out.Clear();
	ASSERT_TRUE(queue.take(SEND_ALL, out));
	ASSERT_EQ("abc123", out.remote_config_status().last_remote_config_hash());
}

TEST(outbound_queue_test, dropped_fields_are_discarded)
{
	outbound_queue queue(4);
	queue.set_package_statuses(opampproto::PackageStatuses());

	opampproto::AgentToServer out;
	ASSERT_FALSE(queue.take([](field) { return disposition::DROP; }, out));
	ASSERT_FALSE(out.has_package_statuses());
	ASSERT_TRUE(queue.empty());
}

TEST(outbound_queue_test, held_custom_message_blocks_the_ones_behind)
{
	outbound_queue queue(4);
	queue.push_critical(custom("m1"));
	queue.push_critical(custom("m2"));

	opampproto::AgentToServer out;
	ASSERT_FALSE(queue.take([](field f)
	{
		return f == field::CUSTOM_MESSAGE ? disposition::HOLD : disposition::SEND;
	}, out));
	ASSERT_EQ(2u, queue.critical_size());
}

TEST(outbound_queue_test, one_critical_message_per_envelope)
{
	outbound_queue queue(4);
	queue.push_critical(custom("m1"));
	queue.push_critical(custom("m2"));
	queue.set_health(opampproto::ComponentHealth());

	opampproto::AgentToServer out;
	ASSERT_TRUE(queue.take(SEND_ALL, out));
	ASSERT_EQ("m1", out.custom_message().data());
	ASSERT_TRUE(out.has_health());
	ASSERT_EQ(1u, queue.critical_size());
}

TEST(outbound_queue_test, clear)
{
	outbound_queue queue(4);
	queue.push_critical(custom("m1"));
	queue.set_health(opampproto::ComponentHealth());

	queue.clear();
	ASSERT_TRUE(queue.empty());
}

TEST(outbound_queue_test, each_coalesced_field_follows_the_gate)
{
	outbound_queue queue(4);
	queue.set_agent_description(opampproto::AgentDescription());
	queue.set_health(opampproto::ComponentHealth());
	queue.set_effective_config(opampproto::EffectiveConfig());
	queue.set_remote_config_status(opampproto::RemoteConfigStatus());
	queue.set_package_statuses(opampproto::PackageStatuses());
	queue.set_connection_settings_status(opampproto::ConnectionSettingsStatus());
	queue.set_custom_capabilities(opampproto::CustomCapabilities());

	const outbound_queue::gate g = [](const field f)
	{
		switch (f)
		{
		case field::HEALTH:
		case field::PACKAGE_STATUSES:
			return disposition::HOLD;
		case field::EFFECTIVE_CONFIG:
		case field::CUSTOM_CAPABILITIES:
			return disposition::DROP;
		default:
			return disposition::SEND;
		}
	};

	opampproto::AgentToServer out;
	ASSERT_TRUE(queue.take(g, out));
	ASSERT_TRUE(out.has_agent_description());
	ASSERT_TRUE(out.has_remote_config_status());
	ASSERT_TRUE(out.has_connection_settings_status());
	ASSERT_FALSE(out.has_health());
	ASSERT_FALSE(out.has_package_statuses());
	ASSERT_FALSE(out.has_effective_config());
	ASSERT_FALSE(out.has_custom_capabilities());

	// Only the held fields remain
	opampproto::AgentToServer rest;
	ASSERT_TRUE(queue.take(SEND_ALL, rest));
	ASSERT_TRUE(rest.has_health());
	ASSERT_TRUE(rest.has_package_statuses());
	ASSERT_FALSE(rest.has_effective_config());
	ASSERT_FALSE(rest.has_custom_capabilities());
	ASSERT_FALSE(rest.has_agent_description());
	ASSERT_TRUE(queue.empty());
}
