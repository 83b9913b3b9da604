#include "common_logger.h"

#include <gtest.h>

#include <Poco/AutoPtr.h>
#include <Poco/Channel.h>
#include <Poco/ConsoleChannel.h>
#include <Poco/Formatter.h>
#include <Poco/FormattingChannel.h>
#include <Poco/Logger.h>
#include <Poco/Message.h>
#include <Poco/NullChannel.h>
#include <Poco/PatternFormatter.h>

#include <google/protobuf/stubs/common.h>

#include <string>

using namespace Poco;

namespace
{

class opamp_environment : public ::testing::Environment
{
public:
	opamp_environment(const bool log_to_console) :
		m_log_to_console(log_to_console)
	{
	}

private:
	void SetUp() override
	{
		AutoPtr<Formatter> formatter(new PatternFormatter("%Y-%m-%d %H:%M:%S.%i, %P.%I, %p, %t"));
		AutoPtr<Channel> null_channel(new NullChannel());
		Logger& loggerf = Logger::create("OpampTestLogF", null_channel, -1);

		Logger* loggerc = nullptr;
		if (m_log_to_console)
		{
			AutoPtr<Channel> console_channel(new ConsoleChannel());
			AutoPtr<Channel> formatting_channel_console(new FormattingChannel(formatter, console_channel));
			loggerc = &Logger::create("OpampTestLogC",
			                          formatting_channel_console,
			                          Message::Priority::PRIO_TRACE);
		}

		g_log = std::unique_ptr<common_logger>(new common_logger(&loggerf, loggerc));
		if (m_log_to_console)
		{
			g_log->set_console_log_priority(Message::Priority::PRIO_TRACE);
		}
	}

	void TearDown() override
	{
		google::protobuf::ShutdownProtobufLibrary();
	}

	const bool m_log_to_console;
};

}  // namespace

int main(int argc, char** argv)
{
	testing::InitGoogleTest(&argc, argv);
	bool log = false;

	for (int i = 1; i < argc; ++i)
	{
		const std::string opt = argv[i];
		if (opt == "-v" || opt == "--verbose")
		{
			log = true;
		}
	}

	::testing::AddGlobalTestEnvironment(new opamp_environment(log));
	return RUN_ALL_TESTS();
}
