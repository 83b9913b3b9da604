/**
 * @file
 *
 * Implementation of the protobuf compressors.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "protobuf_compression.h"
#include "common_logger.h"

COMMON_LOGGER();

namespace opamp
{

bool null_protobuf_compressor::compress(const google::protobuf::MessageLite& message,
                                        google::protobuf::io::StringOutputStream& string_output)
{
	bool res = message.SerializeToZeroCopyStream(&string_output);
	if (!res)
	{
		LOG_ERROR("Error serializing uncompressed protobuf");
	}

	return res;
}

gzip_protobuf_compressor::gzip_protobuf_compressor(int compression_level)
    : protobuf_compressor(compression_method::GZIP)
{
	if (compression_level > Z_BEST_COMPRESSION)
	{
		LOG_WARNING("Invalid gzip compression level: %d", compression_level);
		compression_level = Z_BEST_COMPRESSION;
	}
	else if (compression_level < Z_DEFAULT_COMPRESSION)
	{
		LOG_WARNING("Invalid gzip compression level: %d", compression_level);
		compression_level = Z_DEFAULT_COMPRESSION;
	}
	m_compression_level = compression_level;
}

bool gzip_protobuf_compressor::compress(const google::protobuf::MessageLite& message,
                                        google::protobuf::io::StringOutputStream& string_output)
{
	google::protobuf::io::GzipOutputStream::Options opts;

	opts.format = google::protobuf::io::GzipOutputStream::GZIP;
	opts.compression_level = m_compression_level;

	google::protobuf::io::GzipOutputStream gzip_output(&string_output, opts);

	bool res = message.SerializeToZeroCopyStream(&gzip_output);
	if (!res)
	{
		LOG_ERROR("Error gzip serializing protobuf");
		return res;
	}

	res = gzip_output.Close();
	if (!res)
	{
		LOG_ERROR("Error closing GzipOutputStream: %s",
		          gzip_output.ZlibErrorMessage() ? gzip_output.ZlibErrorMessage() : "");
	}

	return res;
}

std::shared_ptr<protobuf_compressor> protobuf_compressor_factory::get(
    const compression_method method)
{
	switch (method)
	{
	case compression_method::NONE:
		return null_protobuf_compressor::get();
	case compression_method::GZIP:
		return gzip_protobuf_compressor::get(Z_DEFAULT_COMPRESSION);
	}
	return nullptr;
}

} // namespace opamp
