#include "common_logger.h"

#include <gtest.h>

#include <Poco/AutoPtr.h>
#include <Poco/Channel.h>
#include <Poco/Logger.h>
#include <Poco/NullChannel.h>

namespace
{

class shared_environment : public ::testing::Environment
{
private:
	void SetUp() override
	{
		Poco::AutoPtr<Poco::Channel> null_channel(new Poco::NullChannel());
		Poco::Logger& loggerf = Poco::Logger::create("SharedTestLogF", null_channel, -1);

		g_log = std::unique_ptr<common_logger>(new common_logger(&loggerf, nullptr));
	}
};

}  // namespace

int main(int argc, char** argv)
{
	testing::InitGoogleTest(&argc, argv);
	::testing::AddGlobalTestEnvironment(new shared_environment());
	return RUN_ALL_TESTS();
}
