/**
 * @file
 *
 * Interface to the protobuf compressors.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "protocol.h"
#include "zlib.h"

#include <memory>

namespace opamp
{

class protobuf_compressor
{
public:
	protobuf_compressor(compression_method method)
	    : m_compression_method(method)
	{
	}
	virtual ~protobuf_compressor() = default;

	virtual bool compress(const google::protobuf::MessageLite& message,
	                      google::protobuf::io::StringOutputStream& string_output) = 0;

	compression_method get_compression_method() const { return m_compression_method; }

private:
	compression_method m_compression_method;
};

/**
 * Does no compression, just serializes the protobuf to the output stream
 */
class null_protobuf_compressor : public protobuf_compressor
{
public:
	null_protobuf_compressor() : protobuf_compressor(compression_method::NONE) {}

	bool compress(const google::protobuf::MessageLite& message,
	              google::protobuf::io::StringOutputStream& string_output) override;

	static std::shared_ptr<protobuf_compressor> get()
	{
		return std::make_shared<null_protobuf_compressor>();
	}
};

/**
 * Gzips the given protobuf and writes it to the given output stream.
 */
class gzip_protobuf_compressor : public protobuf_compressor
{
public:
	gzip_protobuf_compressor(int compression_level);

	bool compress(const google::protobuf::MessageLite& message,
	              google::protobuf::io::StringOutputStream& string_output) override;

	int get_compression_level() const { return m_compression_level; }

	static std::shared_ptr<protobuf_compressor> get(int compression_level)
	{
		return std::make_shared<gzip_protobuf_compressor>(compression_level);
	}

private:
	int m_compression_level;
};

/**
 * Builds the correct protobuf compressor given the compression method.
 */
class protobuf_compressor_factory
{
public:
	static std::shared_ptr<protobuf_compressor> get(compression_method method);
};

} // namespace opamp
