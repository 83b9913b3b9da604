/**
 * @file
 *
 * Implementation of sequencer.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "sequencer.h"
#include "common_logger.h"

#include <cinttypes>

COMMON_LOGGER();

namespace opamp
{

sequencer::sequencer(const bool require_sequencing) :
	m_last_sent(0),
	m_last_received(0),
	m_have_baseline(false),
	m_require_sequencing(require_sequencing),
	m_epoch(0)
{
}

uint64_t sequencer::next_outbound()
{
	return ++m_last_sent;
}

sequencer::verdict sequencer::validate_inbound(const uint64_t seq)
{
	if (seq == 0)
	{
		if (m_require_sequencing)
		{
			LOG_WARNING("Discarding unsequenced server message");
			return verdict::DUPLICATE_DISCARD;
		}
		return verdict::ACCEPT;
	}

	if (!m_have_baseline)
	{
		m_have_baseline = true;
		m_last_received = seq;
		return verdict::ACCEPT;
	}

	if (seq <= m_last_received)
	{
		LOG_DEBUG("Duplicate server message %" PRIu64 " (last accepted %" PRIu64 ")",
		          seq,
		          m_last_received);
		return verdict::DUPLICATE_DISCARD;
	}

	const uint64_t expected = m_last_received + 1;
	m_last_received = seq;

	if (seq != expected)
	{
		LOG_WARNING("Sequence gap: expected %" PRIu64 ", received %" PRIu64, expected, seq);
		return verdict::GAP_DETECTED;
	}

	return verdict::ACCEPT;
}

bool sequencer::is_restart(const uint64_t seq) const
{
	if (seq == 0 || !m_have_baseline || seq >= m_last_received)
	{
		return false;
	}

	// A fresh server stamps its first reply with 1
	return seq == 1 || m_last_received - seq > RESTART_WINDOW;
}

void sequencer::rebaseline_inbound(const uint64_t seq)
{
	LOG_INFO("Inbound sequence rebased from %" PRIu64 " to %" PRIu64, m_last_received, seq);
	m_last_received = seq;
	m_have_baseline = true;
}

void sequencer::reset()
{
	m_last_sent = 0;
	m_last_received = 0;
	m_have_baseline = false;
	++m_epoch;
}

const char* sequencer::to_string(const verdict v)
{
	switch (v)
	{
	case verdict::ACCEPT:
		return "ACCEPT";
	case verdict::DUPLICATE_DISCARD:
		return "DUPLICATE_DISCARD";
	case verdict::GAP_DETECTED:
		return "GAP_DETECTED";
	}
	return "UNKNOWN";
}

} // namespace opamp
