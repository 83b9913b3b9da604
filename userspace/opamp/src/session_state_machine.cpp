/**
 * @file
 *
 * Implementation of the session state machine and its transition table.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "session_state_machine.h"

namespace opamp
{

using st = session_state_machine::state;
using ev = session_state_machine::event;

bool session_state_machine::send_event(const event e)
{
	if (m_state == state::NONE)
	{
		// Uninitialized or bogus FSM
		return false;
	}

	auto it = m_cb_table.find(m_state);
	if (it == m_cb_table.end())
	{
		return false;
	}

	auto inner = it->second.find(e);
	if (inner == it->second.end())
	{
		return false;
	}

	m_state = inner->second(m_session);
	return true;
}

const char* session_state_machine::to_string(const state s)
{
	switch (s)
	{
	case state::NONE:
		return "NONE";
	case state::IDLE:
		return "IDLE";
	case state::CONNECTING:
		return "CONNECTING";
	case state::CONNECTED:
		return "CONNECTED";
	case state::DEGRADED:
		return "DEGRADED";
	case state::CLOSED:
		return "CLOSED";
	}
	return "UNKNOWN";
}

const char* session_state_machine::to_string(const event e)
{
	switch (e)
	{
	case event::START:
		return "START";
	case event::HANDSHAKE_COMPLETE:
		return "HANDSHAKE_COMPLETE";
	case event::DEGRADE:
		return "DEGRADE";
	case event::FULL_STATE_APPLIED:
		return "FULL_STATE_APPLIED";
	case event::DISCONNECTED:
		return "DISCONNECTED";
	case event::SHUTDOWN:
		return "SHUTDOWN";
	case event::FATAL:
		return "FATAL";
	}
	return "UNKNOWN";
}

namespace
{

st start_received_in_idle(session*)
{
	return st::CONNECTING;
}

st handshake_complete_received_in_connecting(session*)
{
	return st::CONNECTED;
}

st degrade_received_in_connected(session*)
{
	return st::DEGRADED;
}

st degrade_received_in_degraded(session*)
{
	return st::DEGRADED;
}

st full_state_received_in_degraded(session*)
{
	return st::CONNECTED;
}

st full_state_received_in_connected(session*)
{
	return st::CONNECTED;
}

st disconnected_received_while_connected(session*)
{
	return st::CONNECTING;
}

st shutdown_received_in_any_state(session*)
{
	return st::CLOSED;
}

st fatal_received_in_any_state(session*)
{
	return st::CLOSED;
}

} // end namespace

std::unique_ptr<session_state_machine> build_session_fsm(session* const s,
                                                         const st initial)
{
	std::unique_ptr<session_state_machine> ret(new session_state_machine(s, initial));

	ret->register_event_callback(st::IDLE, ev::START, start_received_in_idle);

	ret->register_event_callback(st::CONNECTING,
	                             ev::HANDSHAKE_COMPLETE,
	                             handshake_complete_received_in_connecting);
	ret->register_event_callback(st::CONNECTING,
	                             ev::DISCONNECTED,
	                             disconnected_received_while_connected);

	ret->register_event_callback(st::CONNECTED, ev::DEGRADE, degrade_received_in_connected);
	ret->register_event_callback(st::CONNECTED,
	                             ev::FULL_STATE_APPLIED,
	                             full_state_received_in_connected);
	ret->register_event_callback(st::CONNECTED,
	                             ev::DISCONNECTED,
	                             disconnected_received_while_connected);

	ret->register_event_callback(st::DEGRADED, ev::DEGRADE, degrade_received_in_degraded);
	ret->register_event_callback(st::DEGRADED,
	                             ev::FULL_STATE_APPLIED,
	                             full_state_received_in_degraded);
	ret->register_event_callback(st::DEGRADED,
	                             ev::DISCONNECTED,
	                             disconnected_received_while_connected);

	for (const st s_any : {st::IDLE, st::CONNECTING, st::CONNECTED, st::DEGRADED})
	{
		ret->register_event_callback(s_any, ev::SHUTDOWN, shutdown_received_in_any_state);
		ret->register_event_callback(s_any, ev::FATAL, fatal_received_in_any_state);
	}

	return ret;
}

} // namespace opamp
