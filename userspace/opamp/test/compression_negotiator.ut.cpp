/**
 * @file
 *
 * Unit tests for compression_negotiator.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "compression_negotiator.h"
#include "protobuf_compression.h"
#include "opamp.pb.h"

#include <gtest.h>

using namespace opamp;

namespace
{

const std::vector<compression_method> BOTH = {compression_method::NONE, compression_method::GZIP};

}  // namespace

TEST(compression_negotiator_test, uncompressed_until_negotiated)
{
	compression_negotiator negotiator(BOTH);

	ASSERT_FALSE(negotiator.negotiated());
	ASSERT_EQ(compression_method::NONE, negotiator.selected());
	ASSERT_EQ(compression_method::NONE, negotiator.compressor()->get_compression_method());
}

TEST(compression_negotiator_test, gzip_when_both_sides_support_it)
{
	compression_negotiator negotiator(BOTH);
	const uint64_t server = opampproto::ServerCapabilities_AcceptsGzipCompression;

	const compression_method chosen =
		negotiator.negotiate(feature_set{feature::GZIP_COMPRESSION}, server);

	ASSERT_EQ(compression_method::GZIP, chosen);
	ASSERT_EQ(compression_method::GZIP, negotiator.compressor()->get_compression_method());
}

TEST(compression_negotiator_test, none_when_server_lacks_gzip)
{
	compression_negotiator negotiator(BOTH);

	// Local {RemoteConfig, gzip} against server {RemoteConfig, Packages}
	const feature_set effective = capabilities::negotiate(
		feature_set{feature::REMOTE_CONFIG, feature::GZIP_COMPRESSION},
		opampproto::ServerCapabilities_OffersRemoteConfig |
		        opampproto::ServerCapabilities_OffersPackages);

	ASSERT_EQ(compression_method::NONE,
	          negotiator.negotiate(effective,
	                               opampproto::ServerCapabilities_OffersRemoteConfig |
	                                       opampproto::ServerCapabilities_OffersPackages));
}

TEST(compression_negotiator_test, zstd_only_server_gets_uncompressed)
{
	compression_negotiator negotiator(BOTH);

	ASSERT_EQ(compression_method::NONE,
	          negotiator.negotiate(feature_set(),
	                               opampproto::ServerCapabilities_AcceptsZstdCompression));
}

TEST(compression_negotiator_test, decision_sticks_until_reset)
{
	compression_negotiator negotiator(BOTH);

	negotiator.negotiate(feature_set{feature::GZIP_COMPRESSION},
	                     opampproto::ServerCapabilities_AcceptsGzipCompression);

	// A later change of heart on the same connection is ignored
	ASSERT_EQ(compression_method::GZIP, negotiator.negotiate(feature_set(), 0));

	negotiator.reset();
	ASSERT_FALSE(negotiator.negotiated());
	ASSERT_EQ(compression_method::NONE, negotiator.selected());
	ASSERT_EQ(compression_method::NONE, negotiator.negotiate(feature_set(), 0));
}

TEST(compression_negotiator_test, agent_without_gzip)
{
	compression_negotiator negotiator({compression_method::NONE});

	ASSERT_FALSE(negotiator.supports(compression_method::GZIP));
	ASSERT_EQ(compression_method::NONE,
	          negotiator.negotiate(feature_set{feature::GZIP_COMPRESSION},
	                               opampproto::ServerCapabilities_AcceptsGzipCompression));
}
