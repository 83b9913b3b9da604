/**
 * @file
 *
 * A runnable that terminates based on a running_state.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "running_state.h"
#include "watchdog_runnable.h"

#include <functional>

namespace opamp
{

/**
 * A runnable that stops when its running_state is shut down, and shuts
 * the running_state down when it dies of a fatal error.
 */
class running_state_runnable : public watchdog_runnable
{
public:
	running_state_runnable(const std::string& name, running_state& state) :
		watchdog_runnable(name, std::bind(&running_state::is_terminated, &state)),
		m_running_state(state)
	{
	}

protected:
	void on_fatal_error() override
	{
		m_running_state.shut_down("Shutting down OpAMP client after fatal error in " +
		                          name());
	}

	running_state& m_running_state;
};

} // namespace opamp
