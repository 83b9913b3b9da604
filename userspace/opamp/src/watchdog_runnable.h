/**
 * @file
 *
 * Interface to watchdog_runnable.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <Poco/Runnable.h>

#include <functional>
#include <string>

namespace opamp
{

/**
 * Implements the POCO Runnable class. do_run() polls heartbeat() to learn
 * when to stop.
 *
 * A watchdog_runnable_fatal_error (or any other exception) escaping
 * do_run() is logged and on_fatal_error() is called.
 */
class watchdog_runnable : public Poco::Runnable
{
public:
	using is_terminated_delegate = std::function<bool()>;

	watchdog_runnable(const std::string& name,
	                  const is_terminated_delegate& terminated_delegate);

	const std::string& name() const
	{
		return m_name;
	}

	/**
	 * Does whatever the runnable does. Must call heartbeat regularly.
	 */
	virtual void do_run() = 0;

	void run() override;

protected:
	/**
	 * @return whether to continue
	 */
	bool heartbeat();

	/**
	 * Called on the runnable's thread after a fatal error was logged.
	 */
	virtual void on_fatal_error() {}

private:
	const std::string m_name;
	is_terminated_delegate m_is_terminated;
};

} // namespace opamp
