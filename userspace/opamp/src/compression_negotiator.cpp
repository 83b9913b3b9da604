/**
 * @file
 *
 * Implementation of compression_negotiator.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "compression_negotiator.h"
#include "protobuf_compression.h"
#include "common_logger.h"
#include "opamp.pb.h"

#include <algorithm>

COMMON_LOGGER();

namespace opamp
{

compression_negotiator::compression_negotiator(const std::vector<compression_method>& supported) :
	m_supported(supported),
	m_selected(compression_method::NONE),
	m_negotiated(false),
	m_compressor(protobuf_compressor_factory::get(compression_method::NONE))
{
}

void compression_negotiator::reset()
{
	m_negotiated = false;
	if (m_selected != compression_method::NONE)
	{
		m_selected = compression_method::NONE;
		m_compressor = protobuf_compressor_factory::get(compression_method::NONE);
	}
}

bool compression_negotiator::supports(const compression_method method) const
{
	return std::find(m_supported.begin(), m_supported.end(), method) != m_supported.end();
}

compression_method compression_negotiator::negotiate(const feature_set& effective,
                                                     const uint64_t server_caps)
{
	if (m_negotiated)
	{
		return m_selected;
	}

	compression_method choice = compression_method::NONE;

	if (supports(compression_method::GZIP) && effective.has(feature::GZIP_COMPRESSION))
	{
		choice = compression_method::GZIP;
	}
	else if ((server_caps & opampproto::ServerCapabilities_AcceptsZstdCompression) &&
	         !(server_caps & opampproto::ServerCapabilities_AcceptsGzipCompression))
	{
		LOG_WARNING("Server only accepts zstd compression which this agent "
		            "cannot produce, sending uncompressed");
	}

	m_negotiated = true;
	if (choice != m_selected)
	{
		m_selected = choice;
		m_compressor = protobuf_compressor_factory::get(choice);
	}

	LOG_INFO("Negotiated %s compression", protocol::to_string(m_selected));
	return m_selected;
}

std::shared_ptr<protobuf_compressor> compression_negotiator::compressor() const
{
	return m_compressor;
}

} // namespace opamp
