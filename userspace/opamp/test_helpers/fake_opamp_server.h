/**
 * @file
 *
 * Interface to fake_opamp_server -- an OpAMP HTTP endpoint on localhost
 * for tests which exercise the real Poco channels.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "fake_opamp_peer.h"

#include <Poco/Net/HTTPServer.h>

#include <cstdint>
#include <string>

namespace test_helpers
{

/**
 * Starts an HTTP server on an ephemeral localhost port on construction
 * and stops it on destruction. HEAD opens a new connection on the peer;
 * POST delivers the body to it and answers with the oldest queued reply.
 */
class fake_opamp_server
{
public:
	static const char* const PATH;

	explicit fake_opamp_server(const fake_opamp_peer::ptr& peer);
	~fake_opamp_server();

	uint16_t port() const;

	/**
	 * @return http://127.0.0.1:<port>/v1/opamp
	 */
	std::string url() const;

private:
	Poco::Net::HTTPServer m_srv;
};

}  // namespace test_helpers
