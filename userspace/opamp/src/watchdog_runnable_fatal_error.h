/**
 * @file
 *
 * Exception that stops a watchdog_runnable.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <stdexcept>
#include <string>

// Shorthand macro to log and throw a fatal exception when executing on a
// watchdog runnable.
#define THROW_OPAMP_WR_FATAL_ERROR(__fmt, ...)                                 \
do {                                                                           \
	std::string c_err_ = s_log_sink.build(__fmt,                           \
					      ##__VA_ARGS__);                  \
	s_log_sink.log(Poco::Message::Priority::PRIO_ERROR,                    \
		       __LINE__,                                               \
		       "Throwing: " + c_err_);                                 \
	throw opamp::watchdog_runnable_fatal_error(c_err_.c_str(),             \
						   s_log_sink.tag());          \
} while(false)

namespace opamp
{

class watchdog_runnable_fatal_error : public std::runtime_error
{
public:
	watchdog_runnable_fatal_error(const std::string& what, const std::string& where) :
		std::runtime_error(what),
		m_where(where)
	{
	}

	const char* where() const
	{
		return m_where.c_str();
	}

private:
	const std::string m_where;
};

} // namespace opamp
