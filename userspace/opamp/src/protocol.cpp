/**
 * @file
 *
 * Implementation of the wire level helpers.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "protocol.h"
#include "protobuf_compression.h"
#include "common_logger.h"

#include <google/protobuf/io/coded_stream.h>

#include <cinttypes>

COMMON_LOGGER();

namespace opamp
{
namespace protocol
{

const char* to_string(const compression_method method)
{
	switch (method)
	{
	case compression_method::NONE:
		return "none";
	case compression_method::GZIP:
		return "gzip";
	}
	return "unknown";
}

const char* to_string(const transport_error err)
{
	switch (err)
	{
	case transport_error::NONE:
		return "NONE";
	case transport_error::DISCONNECTED:
		return "DISCONNECTED";
	case transport_error::TIMEOUT:
		return "TIMEOUT";
	case transport_error::PROTOCOL_VIOLATION:
		return "PROTOCOL_VIOLATION";
	}
	return "UNKNOWN";
}

std::string content_encoding(const compression_method method)
{
	return method == compression_method::GZIP ? "gzip" : "";
}

compression_method parse_content_encoding(const std::string& value)
{
	if (value.empty() || value == "identity")
	{
		return compression_method::NONE;
	}

	if (value == "gzip" || value == "x-gzip")
	{
		return compression_method::GZIP;
	}

	LOGGED_THROW(protocol_error, "Unsupported content encoding: %s", value.c_str());
}

bool message_to_frame(const google::protobuf::MessageLite& message,
                      protobuf_compressor& compressor,
                      wire_frame& frame)
{
	std::string buffer;
	google::protobuf::io::StringOutputStream string_output(&buffer);

	if (!compressor.compress(message, string_output))
	{
		LOG_ERROR("Unable to serialize %s", message.GetTypeName().c_str());
		return false;
	}

	frame.payload = std::move(buffer);
	frame.encoding = compressor.get_compression_method();
	return true;
}

std::string ws_encode(const wire_frame& frame)
{
	const uint64_t header = frame.encoding == compression_method::GZIP
	                            ? WS_HEADER_GZIP
	                            : WS_HEADER_NONE;

	std::string out;
	out.reserve(frame.payload.size() + 1);
	{
		google::protobuf::io::StringOutputStream string_output(&out);
		google::protobuf::io::CodedOutputStream coded(&string_output);
		coded.WriteVarint64(header);
	}
	out.append(frame.payload);
	return out;
}

wire_frame ws_decode(const std::string& message)
{
	google::protobuf::io::CodedInputStream coded(
	        reinterpret_cast<const uint8_t*>(message.data()),
	        static_cast<int>(message.size()));
	uint64_t header = 0;

	if (!coded.ReadVarint64(&header))
	{
		throw protocol_error("Truncated WebSocket message header");
	}

	wire_frame frame;
	switch (header)
	{
	case WS_HEADER_NONE:
		frame.encoding = compression_method::NONE;
		break;
	case WS_HEADER_GZIP:
		frame.encoding = compression_method::GZIP;
		break;
	default:
		LOGGED_THROW(protocol_error, "Unknown WebSocket message header %" PRIu64, header);
	}

	frame.payload = message.substr(coded.CurrentPosition());
	return frame;
}

} // namespace protocol
} // namespace opamp
