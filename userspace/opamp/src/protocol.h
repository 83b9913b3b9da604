/**
 * @file
 *
 * Wire level helpers shared by both transports: frame representation,
 * content encoding markers and protobuf decoding.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <google/protobuf/message_lite.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/io/gzip_stream.h>
#include <google/protobuf/io/coded_stream.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace opamp
{

class protobuf_compressor;

enum class compression_method
{
	NONE,
	GZIP
};

/**
 * Result of every transport operation. The transport never retries
 * internally; callers decide what to do with the error.
 */
enum class transport_error
{
	NONE,
	DISCONNECTED,
	TIMEOUT,
	PROTOCOL_VIOLATION
};

/**
 * One serialized envelope plus the marker describing how the payload
 * is encoded. The marker travels as the HTTP Content-Encoding header
 * or as the WebSocket header varint.
 */
struct wire_frame
{
	std::string payload;
	compression_method encoding = compression_method::NONE;
};

class protocol_error : public std::runtime_error
{
public:
	protocol_error(const std::string& message):
		std::runtime_error(message)
	{ }
};

namespace protocol
{

const char* const CONTENT_TYPE = "application/x-protobuf";

// Values of the header varint that prefixes every WebSocket message
const uint64_t WS_HEADER_NONE = 0;
const uint64_t WS_HEADER_GZIP = 1;

// Upper bound on an inbound envelope once decompressed
const uint32_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;

const char* to_string(compression_method method);
const char* to_string(transport_error err);

/**
 * @return the value of the Content-Encoding header for the given method,
 *         or an empty string for NONE
 */
std::string content_encoding(compression_method method);

/**
 * Map a Content-Encoding header value to a compression method. An empty
 * value or "identity" is NONE.
 *
 * @throws protocol_error if the encoding is not supported
 */
compression_method parse_content_encoding(const std::string& value);

/**
 * Serialize and encode the message with the given compressor.
 *
 * @return false if serialization failed; frame is left untouched
 */
bool message_to_frame(const google::protobuf::MessageLite& message,
                      protobuf_compressor& compressor,
                      wire_frame& frame);

/**
 * Prefix the frame payload with the WebSocket header varint.
 */
std::string ws_encode(const wire_frame& frame);

/**
 * Split a WebSocket message into header varint and payload.
 *
 * @throws protocol_error if the header is truncated or unknown
 */
wire_frame ws_decode(const std::string& message);

/**
 * @throws protocol_error if the given buffer cannot be converted into
 *         the given message.
 */
template<class T>
void buffer_to_protobuf(const uint8_t* buf,
                        uint32_t size,
                        T* message,
                        compression_method compression);

/**
 * @throws protocol_error if the frame cannot be converted into the given
 *         message.
 */
template<class T>
void frame_to_protobuf(const wire_frame& frame, T* message);

} // namespace protocol
} // namespace opamp

#include "protocol.hpp"
