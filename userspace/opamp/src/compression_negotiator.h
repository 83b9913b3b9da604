/**
 * @file
 *
 * Interface to compression_negotiator.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "capabilities.h"
#include "protocol.h"

#include <memory>
#include <vector>

namespace opamp
{

class protobuf_compressor;

/**
 * Picks the compression applied to outbound envelopes of one connection.
 *
 * Until negotiate() runs on a connection every envelope goes out
 * uncompressed. Once negotiated, the choice holds until reset() is called
 * for the next connection.
 */
class compression_negotiator
{
public:
	/**
	 * @param supported the methods this agent can encode, in any order
	 */
	compression_negotiator(const std::vector<compression_method>& supported);

	/**
	 * Forget the previous decision. Called when a new connection is made.
	 */
	void reset();

	/**
	 * Select the strongest method both sides support. Calling this again
	 * on the same connection returns the earlier decision unchanged.
	 *
	 * @param effective   the negotiated feature set
	 * @param server_caps the raw ServerCapabilities bits
	 */
	compression_method negotiate(const feature_set& effective, uint64_t server_caps);

	compression_method selected() const { return m_selected; }

	bool negotiated() const { return m_negotiated; }

	bool supports(compression_method method) const;

	/**
	 * @return the compressor for the currently selected method
	 */
	std::shared_ptr<protobuf_compressor> compressor() const;

private:
	const std::vector<compression_method> m_supported;
	compression_method m_selected;
	bool m_negotiated;
	std::shared_ptr<protobuf_compressor> m_compressor;
};

} // namespace opamp
