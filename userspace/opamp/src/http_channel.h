/**
 * @file
 *
 * The request/response endpoint below the polling transport.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "endpoint_settings.h"
#include "protocol.h"

#include <Poco/URI.h>

#include <memory>
#include <mutex>
#include <string>

namespace Poco
{
namespace Net
{
class HTTPClientSession;
} // namespace Net
} // namespace Poco

namespace opamp
{

struct http_response
{
	int status = 0;
	std::string content_encoding;
	std::string body;
};

/**
 * Issues HTTP requests against the server endpoint. Implementations map
 * network failures to transport_error and never retry.
 */
class http_channel
{
public:
	virtual ~http_channel() = default;

	/**
	 * Issue a HEAD request against the endpoint.
	 *
	 * @param[out] status the HTTP status, valid when NONE is returned
	 */
	virtual transport_error head(int& status) = 0;

	/**
	 * POST one protobuf body.
	 *
	 * @param body             the encoded envelope
	 * @param content_encoding value for Content-Encoding, empty for none
	 * @param[out] response    valid when NONE is returned
	 */
	virtual transport_error post(const std::string& body,
	                             const std::string& content_encoding,
	                             http_response& response) = 0;

	/**
	 * Abort any in-flight request and drop the connection.
	 */
	virtual void close() = 0;
};

/**
 * http_channel on top of Poco's HTTP(S) client session.
 */
class poco_http_channel : public http_channel
{
public:
	/**
	 * @throws Poco::SyntaxException if the url is malformed
	 */
	poco_http_channel(const endpoint_settings& settings);

	transport_error head(int& status) override;
	transport_error post(const std::string& body,
	                     const std::string& content_encoding,
	                     http_response& response) override;
	void close() override;

private:
	std::shared_ptr<Poco::Net::HTTPClientSession> session();
	void drop_session();

	const endpoint_settings m_settings;
	const Poco::URI m_uri;
	std::mutex m_session_lock;
	std::shared_ptr<Poco::Net::HTTPClientSession> m_session;
};

} // namespace opamp
