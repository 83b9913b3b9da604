/**
 * @file
 *
 * Implementation of the common logger.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "common_logger.h"
#include <Poco/Logger.h>
#include <Poco/Path.h>

#include <cstdio>
#include <deque>
#include <map>
#include <mutex>
#include <sys/syscall.h>
#include <unistd.h>

/* global */ std::unique_ptr<common_logger> g_log;

namespace
{

// Installed when nobody observes the logger
class null_log_observer : public common_logger::log_observer
{
public:
	void notify(Poco::Message::Priority priority) override
	{ }
};

pid_t current_tid()
{
	static thread_local pid_t tid;

	if(tid == 0)
	{
		tid = syscall(SYS_gettid);
	}

	return tid;
}

using priority_map_t = std::map<std::string, Poco::Message::Priority>;
const priority_map_t s_priority_map = {
	{ "fatal",      Poco::Message::Priority::PRIO_FATAL},
	{ "critical",   Poco::Message::Priority::PRIO_CRITICAL},
	{ "error",      Poco::Message::Priority::PRIO_ERROR},
	{ "warning",    Poco::Message::Priority::PRIO_WARNING},
	{ "notice",     Poco::Message::Priority::PRIO_NOTICE},
	{ "info",       Poco::Message::Priority::PRIO_INFORMATION},
	{ "debug",      Poco::Message::Priority::PRIO_DEBUG},
	{ "trace",      Poco::Message::Priority::PRIO_TRACE},
};

} // end namespace

common_logger::common_logger(Poco::Logger* const file_log,
			     Poco::Logger* const console_log):
	m_file_log(file_log),
	m_console_log(console_log),
	m_file_log_priority((Poco::Message::Priority)-1),
	m_console_log_priority((Poco::Message::Priority)-1),
	m_observer(std::make_shared<null_log_observer>())
{ }

common_logger::common_logger(Poco::Logger* const file_log,
			     Poco::Logger* const console_log,
			     Poco::Message::Priority const file_sev,
			     Poco::Message::Priority const console_sev,
			     const std::vector<std::string>& file_config_vector,
			     const std::vector<std::string>& console_config_vector) :
	m_file_log(file_log),
	m_console_log(console_log),
	m_file_log_priority(file_sev),
	m_console_log_priority(console_sev),
	m_observer(std::make_shared<null_log_observer>())
{
	init_log_component_priorities(file_config_vector, log_destination::LOG_FILE);
	init_log_component_priorities(console_config_vector, log_destination::LOG_CONSOLE);
}

bool common_logger::parse_priority(const std::string& name, Poco::Message::Priority& priority)
{
	auto itr = s_priority_map.find(name);
	if(itr == s_priority_map.end())
	{
		return false;
	}

	priority = itr->second;
	return true;
}

void common_logger::init_log_component_priorities(const std::vector<std::string>& config_vector,
						  const log_destination log_dest)
{
	const std::string delimiter = ": ";
	for (const auto& component_level : config_vector)
	{
		size_t pos = component_level.find(delimiter);
		if (pos == std::string::npos)
		{
			// Called from the constructor, so g_log may not be this object
			log("common_logger: Unparseable string=" + component_level,
			    Poco::Message::Priority::PRIO_NOTICE);
			continue;
		}

		const std::string component = component_level.substr(0, pos);
		const std::string sev_string = component_level.substr(pos + delimiter.length());
		Poco::Message::Priority priority;

		if (!parse_priority(sev_string, priority))
		{
			log("common_logger: Unknown priority=" + sev_string + " in config=" +
			    component_level, Poco::Message::Priority::PRIO_NOTICE);
			continue;
		}

		if (log_dest == log_destination::LOG_FILE)
		{
			m_file_log_component_priorities[component] = priority;
		}
		else
		{
			m_console_log_component_priorities[component] = priority;
		}
	}
}

/**
 * log_check_component_priority is where the decision is made to log or not to
 * log the message to each destination.
 */
void common_logger::log_check_component_priority(const std::string& str,
						 const Poco::Message::Priority sev,
						 const Poco::Message::Priority file_sev,
						 const Poco::Message::Priority console_sev)
{
	Poco::Message m("common_logger", str, sev);

	m.setTid(current_tid());

	if (m_file_log != nullptr && file_sev >= sev)
	{
		m_file_log->log(m);
	}

	if (m_console_log != nullptr && console_sev >= sev)
	{
		m_console_log->log(m);
	}

	m_observer->notify(sev);
}

void common_logger::log(const std::string& str, const Poco::Message::Priority sev)
{
	if (is_enabled(sev))
	{
		log_check_component_priority(str, sev, m_file_log_priority, m_console_log_priority);
	}
}

void common_logger::set_observer(log_observer::ptr observer)
{
	if(observer != nullptr)
	{
		m_observer = observer;
	}
	else
	{
		m_observer = std::make_shared<null_log_observer>();
	}
}

void common_logger::trace(const std::string& str)
{
	log(str, Poco::Message::Priority::PRIO_TRACE);
}

void common_logger::debug(const std::string& str)
{
	log(str, Poco::Message::Priority::PRIO_DEBUG);
}

void common_logger::information(const std::string& str)
{
	log(str, Poco::Message::Priority::PRIO_INFORMATION);
}

void common_logger::notice(const std::string& str)
{
	log(str, Poco::Message::Priority::PRIO_NOTICE);
}

void common_logger::warning(const std::string& str)
{
	log(str, Poco::Message::Priority::PRIO_WARNING);
}

void common_logger::error(const std::string& str)
{
	log(str, Poco::Message::Priority::PRIO_ERROR);
}

void common_logger::critical(const std::string& str)
{
	log(str, Poco::Message::Priority::PRIO_CRITICAL);
}

void common_logger::fatal(const std::string& str)
{
	log(str, Poco::Message::Priority::PRIO_FATAL);
}

// Here severity is the priority of the log message. Returns true if at least
// one destination would accept it.
bool common_logger::is_enabled(const Poco::Message::Priority severity) const
{
	return (((m_file_log != nullptr) && (m_file_log_priority >= severity)) ||
		((m_console_log != nullptr) && (m_console_log_priority >= severity)));
}

bool common_logger::is_enabled(const Poco::Message::Priority severity,
			       const Poco::Message::Priority component_file_priority,
			       const Poco::Message::Priority component_console_priority) const
{
	return (((m_file_log != nullptr) && (component_file_priority >= severity)) ||
		((m_console_log != nullptr) && (component_console_priority >= severity)));
}

// Return the override for the component if one was configured, otherwise
// the default priority of the destination.
Poco::Message::Priority common_logger::get_component_priority(const std::string& component,
                                                              const log_destination log_dest) const
{
	const auto& overrides = (log_dest == log_destination::LOG_FILE)
	                        ? m_file_log_component_priorities
	                        : m_console_log_component_priorities;

	auto it = overrides.find(component);
	if (it != overrides.end())
	{
		return it->second;
	}

	return (log_dest == log_destination::LOG_FILE) ? m_file_log_priority
	                                               : m_console_log_priority;
}

log_sink::log_sink(const std::string& file,
                   const std::string& component) :
	m_tag(component +
	      (component.empty() ? "" : ":") +
	      Poco::Path(file).getBaseName()),
	m_component_file_priority(static_cast<Poco::Message::Priority>(-1)),
	m_component_console_priority(static_cast<Poco::Message::Priority>(-1))
{
}

// Component overrides are looked up once and cached in the sink
bool log_sink::is_enabled(const Poco::Message::Priority severity) const
{
	if (!g_log)
	{
		// Until the global logger exists, messages go to the cache
		return true;
	}

	if (m_component_file_priority == static_cast<Poco::Message::Priority>(-1))
	{
		m_component_file_priority = g_log->get_component_priority(tag(), log_destination::LOG_FILE);
	}
	if (m_component_console_priority == static_cast<Poco::Message::Priority>(-1))
	{
		m_component_console_priority = g_log->get_component_priority(tag(), log_destination::LOG_CONSOLE);
	}
	return g_log->is_enabled(severity, m_component_file_priority, m_component_console_priority);
}

/**
 * Attempts to write the log message described by the given line number,
 * format specifier, and variable argument list to log_buffer. The content of
 * log_buffer is only valid if the returned size fits in its capacity.
 *
 * @returns the total buffer size necessary to hold the fully-formatted log
 *          message.
 */
std::string::size_type log_sink::generate_log(std::vector<char>& log_buffer,
                                              const int line,
                                              const char* const fmt,
                                              va_list& args) const
{
	va_list mutable_args;

	va_copy(mutable_args, args);

	std::string::size_type prefix_length = 0;

	if(line)
	{
		prefix_length = std::snprintf(&log_buffer[0],
		                              log_buffer.size(),
		                              "%s:%d: ",
		                              m_tag.c_str(),
		                              line);
	}

	char *suffix_target = nullptr;
	std::string::size_type suffix_buffer_size = 0;
	if(prefix_length < log_buffer.size())
	{
		suffix_target = &log_buffer[prefix_length];
		suffix_buffer_size = log_buffer.size() - prefix_length;
	}

	const std::string::size_type suffix_length =
		std::vsnprintf(suffix_target,
		               suffix_buffer_size,
		               fmt,
		               mutable_args);

	va_end(mutable_args);

	// Plus the terminating NUL
	return prefix_length + suffix_length + 1;
}

std::string log_sink::build(const int line, const char* const fmt, va_list& args) const
{
	std::vector<char> log_buffer(DEFAULT_LOG_STR_LENGTH, '\0');

	const std::string::size_type log_length =
		generate_log(log_buffer, line, fmt, args);

	// Retry with a buffer of the right size if the first attempt was
	// truncated
	if(log_length > DEFAULT_LOG_STR_LENGTH)
	{
		log_buffer.resize(log_length);
		static_cast<void>(generate_log(log_buffer, line, fmt, args));
	}
	return std::string(&log_buffer[0]);
}

std::string log_sink::build(const char *const fmt, ...) const
{
	va_list args;

	va_start(args, fmt);
	std::string message = build(0 /*suffix only*/, fmt, args);
	va_end(args);
	return message;
}

void log_sink::log(const Poco::Message::Priority severity,
                   const int line,
                   const char* const fmt,
                   ...) const
{
	if (nullptr == g_log)
	{
		va_list args;
		va_start(args, fmt);
		std::string message = build(line, fmt, args);
		va_end(args);
		common_logger_cache::save(m_tag, message, severity);
	}
	else if (is_enabled(severity))
	{
		va_list args;
		va_start(args, fmt);
		std::string message = build(line, fmt, args);
		va_end(args);
		g_log->log_check_component_priority(message,
		                                    severity,
		                                    m_component_file_priority,
		                                    m_component_console_priority);
	}
}

void log_sink::log(const Poco::Message::Priority severity,
                   const int line,
                   const std::string& str) const
{
	log(severity, line, "%s", str.c_str());
}

namespace common_logger_cache
{

namespace {

struct cached_message {
	std::string component_tag;
	std::string message;
	Poco::Message::Priority sev;
};

const unsigned MAX_MESSAGES = 1000;

struct message_cache
{
	std::mutex lock;
	std::deque<cached_message> messages;
	bool overflowed = false;
};

message_cache& get_cache()
{
	// Function-local so that clients don't need to worry about static
	// initialization order.
	static message_cache cache;
	return cache;
}

} // namespace

void save(const std::string &component_tag,
	  const std::string &str,
	  Poco::Message::Priority sev)
{
	message_cache& cache = get_cache();
	std::lock_guard<std::mutex> guard(cache.lock);

	if (cache.messages.size() >= MAX_MESSAGES)
	{
		cache.overflowed = true;
		return;
	}
	cache.messages.push_back({component_tag, str, sev});
}

void log_and_purge()
{
	if (nullptr == g_log)
	{
		return;
	}

	std::deque<cached_message> messages;
	bool overflowed;
	{
		message_cache& cache = get_cache();
		std::lock_guard<std::mutex> guard(cache.lock);
		messages.swap(cache.messages);
		overflowed = cache.overflowed;
		cache.overflowed = false;
	}

	if (overflowed)
	{
		g_log->warning("The common logger cache reached max capacity.");
	}

	for (const auto& data : messages)
	{
		auto file_priority = g_log->get_component_priority(data.component_tag, log_destination::LOG_FILE);
		auto console_priority = g_log->get_component_priority(data.component_tag, log_destination::LOG_CONSOLE);
		g_log->log_check_component_priority(data.message, data.sev, file_priority, console_priority);
	}
}

}
