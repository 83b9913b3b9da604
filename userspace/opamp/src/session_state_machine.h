/**
 * @file
 *
 * Table driven state machine for the session connection state.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <functional>
#include <map>
#include <memory>

namespace opamp
{

class session;

class session_state_machine
{
public:
	enum class event
	{
		START,              // Client started
		HANDSHAKE_COMPLETE, // Reply with a valid server capability set
		DEGRADE,            // Gap, decode failure or ReportFullState
		FULL_STATE_APPLIED, // Message with the FullState marker applied
		DISCONNECTED,       // Transport lost the connection
		SHUTDOWN,           // Explicit shutdown
		FATAL,              // Unrecoverable configuration error
	};

	enum class state
	{
		NONE,
		IDLE,
		CONNECTING,
		CONNECTED,
		DEGRADED,
		CLOSED,
	};

	using callback = std::function<state(session*)>;

	session_state_machine(session* s = nullptr,
	                      state st = state::IDLE) :
	    m_state(st),
	    m_session(s)
	{}

	/**
	 * Sends an event into the state machine.
	 *
	 * @param[in]  ev  The event received
	 *
	 * @return false if the event is not valid in the current state
	 */
	bool send_event(event ev);

	state get_state() const { return m_state; }

	/**
	 * Registers a transition function for the state machine.
	 *
	 * @param st    The state to which the function applies
	 * @param ev    The event on which to trigger the transition function
	 * @param func  The function to call when the transition occurs
	 */
	void register_event_callback(state st, event ev, callback func)
	{
		m_cb_table[st].insert(std::make_pair(ev, func));
	}

	static const char* to_string(state st);
	static const char* to_string(event ev);

private:
	state m_state;
	std::map<state, std::map<event, callback>> m_cb_table;
	session* m_session;
};

/**
 * Build the state machine with the session transition table.
 */
std::unique_ptr<session_state_machine> build_session_fsm(
        session* s,
        session_state_machine::state initial = session_state_machine::state::IDLE);

} // namespace opamp
