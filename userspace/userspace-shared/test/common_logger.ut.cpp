/**
 * @file
 *
 * Unit tests for common_logger and log_sink.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "common_logger.h"

#include <gtest.h>

#include <Poco/AutoPtr.h>
#include <Poco/FormattingChannel.h>
#include <Poco/Logger.h>
#include <Poco/Message.h>
#include <Poco/PatternFormatter.h>
#include <Poco/StreamChannel.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

const std::string FILE_LOGGER_NAME = "common_logger_test_file";
const std::string CONSOLE_LOGGER_NAME = "common_logger_test_console";
const std::string SOURCE_FILE = "/src/opamp/fake_source.cpp";
const std::string COMPONENT = "test";
const std::string TAG = "test:fake_source";

class counting_observer : public common_logger::log_observer
{
public:
	void notify(const Poco::Message::Priority priority) override
	{
		m_priorities.push_back(priority);
	}

	std::vector<Poco::Message::Priority> m_priorities;
};

Poco::Logger& make_logger(const std::string& name, std::ostream& out)
{
	Poco::AutoPtr<Poco::Formatter> formatter(new Poco::PatternFormatter("%p: %t"));
	Poco::AutoPtr<Poco::Channel> stream_channel(new Poco::StreamChannel(out));
	Poco::AutoPtr<Poco::Channel> formatting_channel(
	    new Poco::FormattingChannel(formatter, stream_channel));

	return Poco::Logger::create(name, formatting_channel, Poco::Message::Priority::PRIO_TRACE);
}

class common_logger_test : public testing::Test
{
public:
	common_logger_test() : s_log_sink(SOURCE_FILE, COMPONENT) {}

	void SetUp() override
	{
		m_file_logger = &make_logger(FILE_LOGGER_NAME, m_file_out);
		m_console_logger = &make_logger(CONSOLE_LOGGER_NAME, m_console_out);
		m_old_log = std::move(g_log);
	}

	void TearDown() override
	{
		g_log = std::move(m_old_log);
		Poco::Logger::destroy(FILE_LOGGER_NAME);
		Poco::Logger::destroy(CONSOLE_LOGGER_NAME);
	}

protected:
	void install(const Poco::Message::Priority file_priority,
	             const Poco::Message::Priority console_priority,
	             const std::vector<std::string>& file_overrides = {},
	             const std::vector<std::string>& console_overrides = {})
	{
		g_log = std::unique_ptr<common_logger>(new common_logger(m_file_logger,
		                                                         m_console_logger,
		                                                         file_priority,
		                                                         console_priority,
		                                                         file_overrides,
		                                                         console_overrides));
	}

	std::stringstream m_file_out;
	std::stringstream m_console_out;
	Poco::Logger* m_file_logger = nullptr;
	Poco::Logger* m_console_logger = nullptr;

	// Named like the one COMMON_LOGGER() defines so the macros work here
	const log_sink s_log_sink;

private:
	std::unique_ptr<common_logger> m_old_log;
};

}  // namespace

TEST_F(common_logger_test, sink_prefixes_tag_and_line)
{
	install(Poco::Message::Priority::PRIO_TRACE, Poco::Message::Priority::PRIO_TRACE);

	s_log_sink.log(Poco::Message::Priority::PRIO_INFORMATION, 42, "sequence %d acknowledged", 7);

	const std::string expected = "Information: " + TAG + ":42: sequence 7 acknowledged\n";
	ASSERT_EQ(expected, m_file_out.str());
	ASSERT_EQ(expected, m_console_out.str());
}

TEST_F(common_logger_test, destinations_filter_independently)
{
	install(Poco::Message::Priority::PRIO_WARNING, Poco::Message::Priority::PRIO_DEBUG);

	s_log_sink.log(Poco::Message::Priority::PRIO_INFORMATION, 10, "reconnecting");
	s_log_sink.log(Poco::Message::Priority::PRIO_ERROR, 11, "handshake failed");

	ASSERT_EQ("Error: " + TAG + ":11: handshake failed\n", m_file_out.str());
	ASSERT_EQ("Information: " + TAG + ":10: reconnecting\n"
	          "Error: " + TAG + ":11: handshake failed\n",
	          m_console_out.str());
}

TEST_F(common_logger_test, trace_is_dropped_at_info)
{
	install(Poco::Message::Priority::PRIO_INFORMATION, Poco::Message::Priority::PRIO_INFORMATION);

	ASSERT_FALSE(s_log_sink.is_enabled(Poco::Message::Priority::PRIO_TRACE));
	s_log_sink.log(Poco::Message::Priority::PRIO_TRACE, 1, "poll tick");

	ASSERT_TRUE(m_file_out.str().empty());
	ASSERT_TRUE(m_console_out.str().empty());
}

TEST_F(common_logger_test, component_override_raises_verbosity)
{
	install(Poco::Message::Priority::PRIO_ERROR,
	        Poco::Message::Priority::PRIO_ERROR,
	        {TAG + ": debug"});

	ASSERT_TRUE(s_log_sink.is_enabled(Poco::Message::Priority::PRIO_DEBUG));
	s_log_sink.log(Poco::Message::Priority::PRIO_DEBUG, 5, "queue depth %u", 3u);

	ASSERT_EQ("Debug: " + TAG + ":5: queue depth 3\n", m_file_out.str());
	ASSERT_TRUE(m_console_out.str().empty());
}

TEST_F(common_logger_test, component_override_lowers_verbosity)
{
	install(Poco::Message::Priority::PRIO_TRACE,
	        Poco::Message::Priority::PRIO_TRACE,
	        {},
	        {TAG + ": critical"});

	s_log_sink.log(Poco::Message::Priority::PRIO_WARNING, 8, "slow server");

	ASSERT_EQ("Warning: " + TAG + ":8: slow server\n", m_file_out.str());
	ASSERT_TRUE(m_console_out.str().empty());
}

TEST_F(common_logger_test, bad_overrides_are_ignored)
{
	install(Poco::Message::Priority::PRIO_NOTICE,
	        Poco::Message::Priority::PRIO_NOTICE,
	        {"no_delimiter", TAG + ": loud"});

	ASSERT_EQ(Poco::Message::Priority::PRIO_NOTICE,
	          g_log->get_component_priority(TAG, log_destination::LOG_FILE));
	ASSERT_NE(std::string::npos, m_file_out.str().find("Unparseable string=no_delimiter"));
	ASSERT_NE(std::string::npos, m_file_out.str().find("Unknown priority=loud"));
}

TEST_F(common_logger_test, long_messages_are_not_truncated)
{
	install(Poco::Message::Priority::PRIO_TRACE, Poco::Message::Priority::PRIO_TRACE);
	const std::string payload(log_sink::DEFAULT_LOG_STR_LENGTH * 3, 'x');

	s_log_sink.log(Poco::Message::Priority::PRIO_NOTICE, 99, payload);

	ASSERT_EQ("Notice: " + TAG + ":99: " + payload + "\n", m_file_out.str());
}

TEST_F(common_logger_test, build_has_no_prefix)
{
	ASSERT_EQ("endpoint ws://localhost:4320", s_log_sink.build("endpoint %s:%d", "ws://localhost", 4320));
}

TEST_F(common_logger_test, logged_throw)
{
	install(Poco::Message::Priority::PRIO_TRACE, Poco::Message::Priority::PRIO_TRACE);

	try
	{
		LOGGED_THROW(std::runtime_error, "bad instance uid length %d", 3);
		FAIL() << "nothing thrown";
	}
	catch (const std::runtime_error& ex)
	{
		ASSERT_EQ(std::string("bad instance uid length 3"), ex.what());
	}

	ASSERT_NE(std::string::npos, m_file_out.str().find("Error: " + TAG));
	ASSERT_NE(std::string::npos, m_file_out.str().find("Throwing: bad instance uid length 3"));
}

TEST_F(common_logger_test, observer_sees_emitted_priorities)
{
	install(Poco::Message::Priority::PRIO_INFORMATION, Poco::Message::Priority::PRIO_INFORMATION);
	auto observer = std::make_shared<counting_observer>();
	g_log->set_observer(observer);

	g_log->debug("filtered");
	g_log->warning("degraded");
	g_log->error("closed");

	ASSERT_EQ((std::vector<Poco::Message::Priority> {Poco::Message::Priority::PRIO_WARNING,
	                                                 Poco::Message::Priority::PRIO_ERROR}),
	          observer->m_priorities);

	// Resetting falls back to a no-op observer
	g_log->set_observer(nullptr);
	g_log->error("again");
	ASSERT_EQ(2u, observer->m_priorities.size());
}

TEST_F(common_logger_test, messages_before_init_are_replayed)
{
	install(Poco::Message::Priority::PRIO_TRACE, Poco::Message::Priority::PRIO_TRACE);
	common_logger_cache::log_and_purge();
	m_file_out.str("");
	m_console_out.str("");

	std::unique_ptr<common_logger> installed = std::move(g_log);
	s_log_sink.log(Poco::Message::Priority::PRIO_INFORMATION, 3, "early %s", "bird");
	ASSERT_TRUE(m_file_out.str().empty());

	g_log = std::move(installed);
	common_logger_cache::log_and_purge();

	ASSERT_EQ("Information: " + TAG + ":3: early bird\n", m_file_out.str());

	// The cache is empty after a purge
	m_file_out.str("");
	common_logger_cache::log_and_purge();
	ASSERT_TRUE(m_file_out.str().empty());
}

TEST_F(common_logger_test, cache_overflow_is_reported)
{
	install(Poco::Message::Priority::PRIO_TRACE, Poco::Message::Priority::PRIO_TRACE);
	common_logger_cache::log_and_purge();
	m_file_out.str("");

	std::unique_ptr<common_logger> installed = std::move(g_log);
	for (int i = 0; i < 1100; ++i)
	{
		common_logger_cache::save(TAG, "message", Poco::Message::Priority::PRIO_INFORMATION);
	}
	g_log = std::move(installed);
	common_logger_cache::log_and_purge();

	ASSERT_EQ(0u, m_file_out.str().find("Warning: The common logger cache reached max capacity."));

	size_t lines = 0;
	for (const char c : m_file_out.str())
	{
		lines += (c == '\n') ? 1 : 0;
	}
	ASSERT_EQ(1001u, lines);
}

TEST(common_logger_standalone_test, parse_priority)
{
	Poco::Message::Priority priority = Poco::Message::Priority::PRIO_FATAL;

	ASSERT_TRUE(common_logger::parse_priority("info", priority));
	ASSERT_EQ(Poco::Message::Priority::PRIO_INFORMATION, priority);
	ASSERT_TRUE(common_logger::parse_priority("trace", priority));
	ASSERT_EQ(Poco::Message::Priority::PRIO_TRACE, priority);

	ASSERT_FALSE(common_logger::parse_priority("verbose", priority));
	ASSERT_EQ(Poco::Message::Priority::PRIO_TRACE, priority);
}

TEST(common_logger_standalone_test, no_destinations_nothing_enabled)
{
	common_logger logger(nullptr, nullptr);

	ASSERT_FALSE(logger.is_enabled(Poco::Message::Priority::PRIO_FATAL));
	logger.fatal("goes nowhere");
}
