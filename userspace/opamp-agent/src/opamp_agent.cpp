/**
 * @file
 *
 * Implementation of opamp_agent_app.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "opamp_agent.h"
#include "process_health_reporter.h"
#include "client_config.h"
#include "common_logger.h"
#include "configuration_manager.h"
#include "opamp_client.h"
#include "type_config.h"
#include "yaml_config_store.h"
#include "yaml_configuration.h"

#include <Poco/AutoPtr.h>
#include <Poco/ConsoleChannel.h>
#include <Poco/FileChannel.h>
#include <Poco/Formatter.h>
#include <Poco/FormattingChannel.h>
#include <Poco/Logger.h>
#include <Poco/NullChannel.h>
#include <Poco/PatternFormatter.h>
#include <Poco/Thread.h>
#include <Poco/Util/HelpFormatter.h>
#include <Poco/Util/Option.h>
#include <Poco/Util/OptionSet.h>

#include <google/protobuf/stubs/common.h>

#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <signal.h>
#include <sys/stat.h>

using Poco::AutoPtr;
using Poco::Channel;
using Poco::Formatter;
using Poco::Logger;
using Poco::Message;
using Poco::Util::Option;

namespace
{
COMMON_LOGGER();

type_config<std::string> c_log_location("",
                                        "File to write logs to; empty disables file logging",
                                        "log",
                                        "location");

type_config<std::string> c_log_file_priority("info",
                                             "Minimum priority of messages written to the log file",
                                             "log",
                                             "file_priority");

type_config<std::string> c_log_console_priority("info",
                                                "Minimum priority of messages written to the console",
                                                "log",
                                                "console_priority");

type_config<std::vector<std::string>> c_log_file_component_overrides(
    {},
    "Component level overrides to global log level",
    "log",
    "file_priority_by_component");

type_config<std::vector<std::string>> c_log_console_component_overrides(
    {},
    "Component level overrides to global console log level",
    "log",
    "console_priority_by_component");

const char* const DEFAULT_CONFIG_FILE = "/opt/opamp-agent/etc/opamp-agent.yaml";
const char* const DEFAULT_EFFECTIVE_CONFIG_FILE = "/opt/opamp-agent/etc/effective.yaml";
const uint64_t MAIN_LOOP_SLEEP_MS = 100;

volatile sig_atomic_t s_terminate = 0;

void g_signal_callback(int sig)
{
	s_terminate = 1;
}

Message::Priority priority_or_default(const std::string& name, const Message::Priority fallback)
{
	Message::Priority priority;

	if (!common_logger::parse_priority(name, priority))
	{
		std::cerr << "Unknown log priority " << name << ", using default" << std::endl;
		return fallback;
	}
	return priority;
}

/**
 * Logs everything the server tells the agent about.
 */
class logging_listener : public opamp::session_listener
{
public:
	void on_state_change(const std::string& from, const std::string& to) override
	{
		LOG_INFO("OpAMP session %s -> %s", from.c_str(), to.c_str());
	}

	void on_backpressure(const uint32_t dropped) override
	{
		LOG_WARNING("Dropped %u custom message(s), server is not keeping up", dropped);
	}

	void on_server_error(const std::string& type, const std::string& message) override
	{
		LOG_ERROR("OpAMP server error %s: %s", type.c_str(), message.c_str());
	}

	void on_restart_requested() override
	{
		LOG_NOTICE("Server requested a restart, shutting down for the supervisor to restart us");
		s_terminate = 1;
	}

	void on_instance_uid_changed(const std::string& old_uid, const std::string& new_uid) override
	{
		LOG_NOTICE("Instance uid changed from %s to %s", old_uid.c_str(), new_uid.c_str());
	}
};

}  // namespace

namespace opamp_agent
{

opamp_agent_app::opamp_agent_app() :
	m_config_file(DEFAULT_CONFIG_FILE),
	m_effective_config_file(DEFAULT_EFFECTIVE_CONFIG_FILE),
	m_help_requested(false)
{
}

opamp_agent_app::~opamp_agent_app()
{
	google::protobuf::ShutdownProtobufLibrary();
}

void opamp_agent_app::initialize(Application& self)
{
	ServerApplication::initialize(self);
}

void opamp_agent_app::uninitialize()
{
	ServerApplication::uninitialize();
}

void opamp_agent_app::defineOptions(Poco::Util::OptionSet& options)
{
	ServerApplication::defineOptions(options);

	options.addOption(Option("help", "h", "display help information").repeatable(false));
	options.addOption(Option("config", "c", "yaml file with the agent configuration")
	                      .argument("path")
	                      .repeatable(false));
	options.addOption(Option("base-config", "b", "yaml file remote configuration is merged over")
	                      .argument("path")
	                      .repeatable(false));
	options.addOption(Option("effective-config", "e", "where the merged configuration is written")
	                      .argument("path")
	                      .repeatable(false));
}

void opamp_agent_app::handleOption(const std::string& name, const std::string& value)
{
	ServerApplication::handleOption(name, value);

	if (name == "help")
	{
		m_help_requested = true;
		stopOptionsProcessing();
	}
	else if (name == "config")
	{
		m_config_file = value;
	}
	else if (name == "base-config")
	{
		m_base_config_file = value;
	}
	else if (name == "effective-config")
	{
		m_effective_config_file = value;
	}
}

int opamp_agent_app::main(const std::vector<std::string>& args)
{
	if (m_help_requested)
	{
		Poco::Util::HelpFormatter help(options());
		help.setCommand(commandName());
		help.setUsage("OPTIONS");
		help.setHeader("OpAMP agent.");
		help.format(std::cout);
		return Application::EXIT_OK;
	}

	//
	// Make sure the agent never creates world-writable files
	//
	umask(0027);

	if (!load_configuration())
	{
		return Application::EXIT_CONFIG;
	}

	initialize_logging();

	sigset_t sigs;
	sigemptyset(&sigs);
	sigaddset(&sigs, SIGQUIT);
	sigaddset(&sigs, SIGTERM);
	sigaddset(&sigs, SIGPIPE);
	sigprocmask(SIG_UNBLOCK, &sigs, NULL);

	signal(SIGPIPE, SIG_IGN);

	struct sigaction sa;
	memset(&sa, 0, sizeof(sa));
	sigemptyset(&sa.sa_mask);
	sa.sa_handler = g_signal_callback;

	sigaction(SIGINT, &sa, NULL);
	sigaction(SIGQUIT, &sa, NULL);
	sigaction(SIGTERM, &sa, NULL);

	return run_client();
}

bool opamp_agent_app::load_configuration()
{
	// The base config, when given, is the fallback for anything the
	// agent config does not set
	std::vector<std::string> files{m_config_file};
	if (!m_base_config_file.empty())
	{
		files.push_back(m_base_config_file);
	}
	else
	{
		m_base_config_file = m_config_file;
	}

	yaml_configuration config(files);

	if (!config.errors().empty())
	{
		for (const auto& error : config.errors())
		{
			std::cerr << "Config error: " << error << std::endl;
		}
		return false;
	}

	try
	{
		configuration_manager::instance().init_config(config);
	}
	catch (const yaml_configuration_exception& ex)
	{
		std::cerr << "Failed to load configuration: " << ex.what() << std::endl;
		return false;
	}
	return true;
}

void opamp_agent_app::initialize_logging()
{
	AutoPtr<Formatter> formatter(new Poco::PatternFormatter("%Y-%m-%d %H:%M:%S.%i, %P.%I, %p, %t"));

	AutoPtr<Channel> file_channel;
	if (c_log_location.get_value().empty())
	{
		file_channel = new Poco::NullChannel();
	}
	else
	{
		AutoPtr<Poco::FileChannel> channel(new Poco::FileChannel(c_log_location.get_value()));
		channel->setProperty("rotation", "10M");
		channel->setProperty("purgeCount", "5");
		channel->setProperty("archive", "timestamp");
		file_channel = new Poco::FormattingChannel(formatter, channel);
	}
	Logger& loggerf = Logger::create("OpampLogF", file_channel, Message::PRIO_TRACE);

	AutoPtr<Channel> console_channel(new Poco::ConsoleChannel());
	AutoPtr<Channel> formatting_channel_console(new Poco::FormattingChannel(formatter, console_channel));
	Logger& loggerc = Logger::create("OpampLogC", formatting_channel_console, Message::PRIO_TRACE);

	g_log = std::unique_ptr<common_logger>(
	    new common_logger(&loggerf,
	                      &loggerc,
	                      priority_or_default(c_log_file_priority.get_value(), Message::PRIO_INFORMATION),
	                      priority_or_default(c_log_console_priority.get_value(), Message::PRIO_INFORMATION),
	                      c_log_file_component_overrides.get_value(),
	                      c_log_console_component_overrides.get_value()));

	LOG_INFO("opamp-agent starting, config %s", m_config_file.c_str());
	common_logger_cache::log_and_purge();

	configuration_manager::instance().print_config([](const std::string& line)
	{
		LOG_INFO("%s", line.c_str());
	});
}

int opamp_agent_app::run_client()
{
	const opamp::client_config config = opamp::client_config::from_configuration();

	opamp::session::collaborators collab;
	collab.config = std::make_shared<opamp::yaml_config_store>(m_base_config_file,
	                                                           m_effective_config_file);
	collab.health = std::make_shared<process_health_reporter>();
	collab.listener = std::make_shared<logging_listener>();

	opamp::opamp_client client(config, collab);
	client.start();

	while (!s_terminate && client.is_running())
	{
		Poco::Thread::sleep(MAIN_LOOP_SLEEP_MS);
	}

	client.stop();

	const std::string reason = client.stop_reason();
	LOG_INFO("opamp-agent exiting: %s", reason.c_str());

	return s_terminate ? Application::EXIT_OK : Application::EXIT_SOFTWARE;
}

}  // namespace opamp_agent
