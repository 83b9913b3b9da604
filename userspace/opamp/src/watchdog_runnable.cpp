/**
 * @file
 *
 * Implementation of watchdog_runnable.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "watchdog_runnable.h"
#include "common_logger.h"
#include "watchdog_runnable_fatal_error.h"

COMMON_LOGGER();

namespace opamp
{

watchdog_runnable::watchdog_runnable(const std::string& name,
                                     const is_terminated_delegate& terminated_delegate) :
	m_name(name),
	m_is_terminated(terminated_delegate)
{
}

bool watchdog_runnable::heartbeat()
{
	return !(m_is_terminated && m_is_terminated());
}

void watchdog_runnable::run()
{
	try
	{
		LOG_INFO("%s starting", m_name.c_str());
		do_run();
	}
	catch (const watchdog_runnable_fatal_error& ex)
	{
		if (m_name == ex.where())
		{
			LOG_FATAL("Fatal error occurred in %s. Terminating gracefully. Detail: %s",
			          m_name.c_str(),
			          ex.what());
		}
		else
		{
			LOG_FATAL("Fatal error occurred in %s on %s. Terminating gracefully. Detail: %s",
			          ex.where(),
			          m_name.c_str(),
			          ex.what());
		}
		on_fatal_error();
	}
	catch (const std::exception& ex)
	{
		LOG_FATAL("Unexpected fatal error occurred in %s. Terminating gracefully. Detail: %s",
		          m_name.c_str(),
		          ex.what());
		on_fatal_error();
	}

	LOG_INFO("%s terminating", m_name.c_str());
}

} // namespace opamp
