/**
 * @file
 *
 * The duplex endpoint below the streaming transport.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "endpoint_settings.h"
#include "protocol.h"

#include <Poco/URI.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace Poco
{
namespace Net
{
class HTTPClientSession;
class WebSocket;
} // namespace Net
} // namespace Poco

namespace opamp
{

/**
 * A message oriented duplex connection. send_frame and receive_frame may
 * be called concurrently from different threads.
 */
class stream_channel
{
public:
	virtual ~stream_channel() = default;

	virtual transport_error open() = 0;

	virtual transport_error send_frame(const std::string& data) = 0;

	/**
	 * Wait up to timeout for one message. A timeout with nothing received
	 * returns NONE with received set to false.
	 */
	virtual transport_error receive_frame(std::string& data,
	                                      bool& received,
	                                      std::chrono::milliseconds timeout) = 0;

	/**
	 * Close the connection, unblocking a pending receive_frame.
	 */
	virtual void close() = 0;
};

/**
 * stream_channel on top of Poco's WebSocket client, binary frames only.
 */
class poco_websocket_channel : public stream_channel
{
public:
	/**
	 * @throws Poco::SyntaxException if the url is malformed
	 */
	poco_websocket_channel(const endpoint_settings& settings);
	~poco_websocket_channel();

	transport_error open() override;
	transport_error send_frame(const std::string& data) override;
	transport_error receive_frame(std::string& data,
	                              bool& received,
	                              std::chrono::milliseconds timeout) override;
	void close() override;

private:
	std::shared_ptr<Poco::Net::WebSocket> socket();
	transport_error send_raw(Poco::Net::WebSocket& ws,
	                         const char* data,
	                         size_t len,
	                         int flags);

	const endpoint_settings m_settings;
	const Poco::URI m_uri;
	std::mutex m_socket_lock;
	// Serializes writers; the receive side may answer pings
	std::mutex m_send_lock;
	std::unique_ptr<Poco::Net::HTTPClientSession> m_session;
	std::shared_ptr<Poco::Net::WebSocket> m_ws;
};

} // namespace opamp
