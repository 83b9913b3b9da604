/**
 * @file
 *
 * Unit tests for the session state machine.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "session_state_machine.h"

#include <gtest.h>

using namespace opamp;
using st = session_state_machine::state;
using ev = session_state_machine::event;

TEST(session_state_machine_test, happy_path)
{
	auto fsm = build_session_fsm(nullptr);

	ASSERT_EQ(st::IDLE, fsm->get_state());
	ASSERT_TRUE(fsm->send_event(ev::START));
	ASSERT_EQ(st::CONNECTING, fsm->get_state());
	ASSERT_TRUE(fsm->send_event(ev::HANDSHAKE_COMPLETE));
	ASSERT_EQ(st::CONNECTED, fsm->get_state());
	ASSERT_TRUE(fsm->send_event(ev::SHUTDOWN));
	ASSERT_EQ(st::CLOSED, fsm->get_state());
}

TEST(session_state_machine_test, degrade_and_recover)
{
	auto fsm = build_session_fsm(nullptr, st::CONNECTED);

	ASSERT_TRUE(fsm->send_event(ev::DEGRADE));
	ASSERT_EQ(st::DEGRADED, fsm->get_state());
	ASSERT_TRUE(fsm->send_event(ev::DEGRADE));
	ASSERT_EQ(st::DEGRADED, fsm->get_state());
	ASSERT_TRUE(fsm->send_event(ev::FULL_STATE_APPLIED));
	ASSERT_EQ(st::CONNECTED, fsm->get_state());
}

TEST(session_state_machine_test, disconnect_goes_back_to_connecting)
{
	for (const st from : {st::CONNECTING, st::CONNECTED, st::DEGRADED})
	{
		auto fsm = build_session_fsm(nullptr, from);

		ASSERT_TRUE(fsm->send_event(ev::DISCONNECTED)) << session_state_machine::to_string(from);
		ASSERT_EQ(st::CONNECTING, fsm->get_state());
	}
}

TEST(session_state_machine_test, fatal_closes_from_any_live_state)
{
	for (const st from : {st::IDLE, st::CONNECTING, st::CONNECTED, st::DEGRADED})
	{
		auto fsm = build_session_fsm(nullptr, from);

		ASSERT_TRUE(fsm->send_event(ev::FATAL));
		ASSERT_EQ(st::CLOSED, fsm->get_state());
	}
}

TEST(session_state_machine_test, invalid_events_are_rejected)
{
	auto fsm = build_session_fsm(nullptr);

	ASSERT_FALSE(fsm->send_event(ev::HANDSHAKE_COMPLETE));
	ASSERT_FALSE(fsm->send_event(ev::DEGRADE));
	ASSERT_EQ(st::IDLE, fsm->get_state());

	fsm->send_event(ev::START);
	ASSERT_FALSE(fsm->send_event(ev::DEGRADE));
	ASSERT_FALSE(fsm->send_event(ev::FULL_STATE_APPLIED));
	ASSERT_EQ(st::CONNECTING, fsm->get_state());
}

TEST(session_state_machine_test, closed_is_final)
{
	auto fsm = build_session_fsm(nullptr, st::CLOSED);

	for (const ev e : {ev::START, ev::HANDSHAKE_COMPLETE, ev::DEGRADE, ev::FULL_STATE_APPLIED,
	                   ev::DISCONNECTED, ev::SHUTDOWN, ev::FATAL})
	{
		ASSERT_FALSE(fsm->send_event(e)) << session_state_machine::to_string(e);
		ASSERT_EQ(st::CLOSED, fsm->get_state());
	}
}

TEST(session_state_machine_test, none_state_rejects_everything)
{
	session_state_machine fsm(nullptr, st::NONE);

	ASSERT_FALSE(fsm.send_event(ev::START));
	ASSERT_EQ(st::NONE, fsm.get_state());
}
