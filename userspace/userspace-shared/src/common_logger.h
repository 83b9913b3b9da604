/**
 * @file
 *
 * Interface to common_logger.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <Poco/Message.h>

#include <memory>
#include <stdarg.h>
#include <string>
#include <unordered_map>
#include <vector>

// define the logger destinations
enum log_destination { LOG_FILE, LOG_CONSOLE };

namespace Poco
{
class Logger;
}

class common_logger
{
public:
	/**
	 * Told the priority of every message that reaches a destination.
	 */
	class log_observer
	{
	public:
		using ptr = std::shared_ptr<log_observer>;

		virtual ~log_observer() = default;
		virtual void notify(Poco::Message::Priority priority) = 0;
	};

	/**
	 * Use this constructor if you don't care about per-component
	 * priorities. It is mostly used by unit tests. Either logger may be
	 * null.
	 */
	common_logger(Poco::Logger* file_log, Poco::Logger* console_log);

	/**
	 * Use this constructor if you care about file and console logging
	 * with per-component overrides of the form "component: priority".
	 */
	common_logger(Poco::Logger* file_log,
		      Poco::Logger* console_log,
		      Poco::Message::Priority file_sev,
		      Poco::Message::Priority console_sev,
		      const std::vector<std::string>& file_config_vector,
		      const std::vector<std::string>& console_config_vector);

	/**
	 * Replace the observer; nullptr installs a no-op one.
	 */
	void set_observer(log_observer::ptr observer);

	/**
	 * Write str if either destination's default priority admits sev.
	 */
	void log(const std::string& str, Poco::Message::Priority sev);

	/**
	 * Write str to each destination whose given priority admits sev. Used
	 * by log_sink with its component overrides.
	 */
	void log_check_component_priority(const std::string& str,
					  Poco::Message::Priority sev,
					  Poco::Message::Priority file_sev,
					  Poco::Message::Priority console_sev);
	void trace(const std::string& str);
	void debug(const std::string& str);
	void information(const std::string& str);
	void notice(const std::string& str);
	void warning(const std::string& str);
	void error(const std::string& str);
	void critical(const std::string& str);
	void fatal(const std::string& str);

	bool is_enabled(Poco::Message::Priority severity) const;
	bool is_enabled(Poco::Message::Priority severity,
			Poco::Message::Priority component_file_priority,
			Poco::Message::Priority component_console_priority) const;
	void init_log_component_priorities(const std::vector<std::string>& config_vector,
					   log_destination log_dest);
	Poco::Message::Priority get_component_priority(const std::string& component,
						       log_destination log_dest) const;

	/**
	 * Parse a priority name ("error", "info", ...).
	 *
	 * @return true if the name was recognized
	 */
	static bool parse_priority(const std::string& name, Poco::Message::Priority& priority);

#ifdef OPAMP_TEST
	void set_file_log_priority(const Poco::Message::Priority severity)
	{
		m_file_log_priority = severity;
	}
	void set_console_log_priority(const Poco::Message::Priority severity)
	{
		m_console_log_priority = severity;
	}
#endif

private:
	// The order of declaration and initialization here must match the
	// common_logger constructor
	Poco::Logger* const m_file_log;
	Poco::Logger* const m_console_log;
#ifdef OPAMP_TEST
	Poco::Message::Priority mutable m_file_log_priority;
	Poco::Message::Priority mutable m_console_log_priority;
#else
	Poco::Message::Priority const m_file_log_priority;
	Poco::Message::Priority const m_console_log_priority;
#endif
	std::unordered_map<std::string, Poco::Message::Priority> m_file_log_component_priorities;
	std::unordered_map<std::string, Poco::Message::Priority> m_console_log_component_priorities;
	std::shared_ptr<log_observer> m_observer;
};

/**
 * Holding area for messages logged before g_log exists.
 */
namespace common_logger_cache
{
/**
 * Keep a message until log_and_purge(). Bounded; overflow is reported
 * once when the cache is purged.
 */
void save(const std::string& component_tag,
	  const std::string& str,
	  Poco::Message::Priority sev);

/**
 * Emit and forget every cached message. No-op while g_log is null.
 */
void log_and_purge();
};

/**
 * Per translation unit logging front end. Instantiate through
 * COMMON_LOGGER() and write through the LOG_* macros.
 */
class log_sink
{
public:
	const static size_t DEFAULT_LOG_STR_LENGTH = 256;

	log_sink(const std::string& file, const std::string& component);

	void log(Poco::Message::Priority severity, int line, const char* fmt, ...) const
	    __attribute__((format(printf, 4, 5)));
	void log(Poco::Message::Priority severity, int line, const std::string& str) const;
	std::string build(const char* fmt, ...) const;
	const std::string& tag() const { return m_tag; };
	bool is_enabled(Poco::Message::Priority severity) const;

private:
	std::string::size_type generate_log(std::vector<char>& log_buffer,
	                                    int line,
	                                    const char* fmt,
	                                    va_list& args) const;
	std::string build(int line, const char* fmt, va_list& args) const;

	// "component:basename" or just "basename"
	const std::string m_tag;
	// File and console level overrides associated with the component,
	// looked up in g_log on first use and cached here.
	mutable Poco::Message::Priority m_component_file_priority;
	mutable Poco::Message::Priority m_component_console_priority;
};

extern std::unique_ptr<common_logger> g_log;

// Declare the file's log_sink. Messages are prefixed with the optional
// component, the file's base name and the line number.
#define COMMON_LOGGER(__optional_prefix) \
	static const log_sink s_log_sink(__FILE__, "" __optional_prefix)

#define LOG_AT_PRIO_(priority, ...)                                                              \
	do                                                                                       \
	{                                                                                        \
		s_log_sink.log((priority), __LINE__, __VA_ARGS__);                               \
	} while (false)

#define LOG_WILL_EMIT(priority) (s_log_sink.is_enabled(priority))

// clang-format off
// Logging entry points for code that declared COMMON_LOGGER().
#define LOG_TRACE(...)    LOG_AT_PRIO_(Poco::Message::Priority::PRIO_TRACE,       __VA_ARGS__)
#define LOG_DEBUG(...)    LOG_AT_PRIO_(Poco::Message::Priority::PRIO_DEBUG,       __VA_ARGS__)
#define LOG_INFO(...)     LOG_AT_PRIO_(Poco::Message::Priority::PRIO_INFORMATION, __VA_ARGS__)
#define LOG_NOTICE(...)   LOG_AT_PRIO_(Poco::Message::Priority::PRIO_NOTICE,      __VA_ARGS__)
#define LOG_WARNING(...)  LOG_AT_PRIO_(Poco::Message::Priority::PRIO_WARNING,     __VA_ARGS__)
#define LOG_ERROR(...)    LOG_AT_PRIO_(Poco::Message::Priority::PRIO_ERROR,       __VA_ARGS__)
#define LOG_CRITICAL(...) LOG_AT_PRIO_(Poco::Message::Priority::PRIO_CRITICAL,    __VA_ARGS__)
#define LOG_FATAL(...)    LOG_AT_PRIO_(Poco::Message::Priority::PRIO_FATAL,       __VA_ARGS__)
// clang-format on

// Format a message, log it at error priority and throw it as
// __exception_type(const char*).
#define LOGGED_THROW(__exception_type, __fmt, ...)                                            \
	do                                                                                        \
	{                                                                                         \
		std::string c_err_ = s_log_sink.build(__fmt, ##__VA_ARGS__);                          \
		s_log_sink.log(Poco::Message::Priority::PRIO_ERROR, __LINE__, "Throwing: " + c_err_); \
		throw __exception_type(c_err_.c_str());                                               \
	} while (false)
