/**
 * @file
 *
 * Where and how the transports reach the server.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <Poco/Net/Context.h>
#include <Poco/URI.h>

#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace Poco
{
namespace Net
{
class HTTPClientSession;
class HTTPRequest;
} // namespace Net
} // namespace Poco

namespace opamp
{

struct tls_settings
{
	bool verify_certificate = true;
	std::string ca_cert_file;
	std::string client_cert_file;
	std::string client_key_file;
};

struct endpoint_settings
{
	// http(s):// selects polling, ws(s):// selects streaming
	std::string url;
	std::map<std::string, std::string> headers;
	// Sent as "Authorization: Secret-Key <api_key>" when non-empty
	std::string api_key;
	uint64_t timeout_ms = 10000;
	tls_settings tls;

	bool operator==(const endpoint_settings& rhs) const;
	bool operator!=(const endpoint_settings& rhs) const { return !(*this == rhs); }
};

namespace endpoint
{

/**
 * @return true if the scheme of the url is one of the secure ones
 */
bool is_secure(const Poco::URI& uri);

/**
 * Build the client SSL context for the given settings. Problems loading
 * the CA are logged; verification will then fail at handshake time.
 */
Poco::Net::Context::Ptr build_ssl_context(const tls_settings& tls);

/**
 * Create a plain or TLS HTTP session for the uri.
 *
 * @throws Poco::Exception if the uri cannot be used
 */
std::unique_ptr<Poco::Net::HTTPClientSession> create_session(const Poco::URI& uri,
                                                             const endpoint_settings& settings);

/**
 * Add the api key and the extra headers to a request.
 */
void decorate_request(Poco::Net::HTTPRequest& request, const endpoint_settings& settings);

/**
 * The path and query of the uri, "/" if empty.
 */
std::string request_target(const Poco::URI& uri);

} // namespace endpoint
} // namespace opamp
