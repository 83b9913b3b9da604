/**
 * @file
 *
 * Interface to sequencer.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <atomic>
#include <cstdint>

namespace opamp
{

/**
 * Tracks the per-direction sequence numbers of one session.
 *
 * Outbound numbers start at 1 and increase by one per envelope. Inbound
 * numbers must increase; the first value after construction or reset()
 * establishes the baseline.
 */
class sequencer
{
public:
	/**
	 * How far below the last accepted number a duplicate must fall to be
	 * taken as a restarted server rather than a retransmission.
	 */
	static const uint64_t RESTART_WINDOW = 64;

	enum class verdict
	{
		ACCEPT,
		DUPLICATE_DISCARD,
		GAP_DETECTED
	};

	/**
	 * @param require_sequencing if false, inbound value 0 is accepted as
	 *        coming from a server that does not stamp its messages
	 */
	explicit sequencer(bool require_sequencing = false);

	/**
	 * Increment and return the outbound counter.
	 */
	uint64_t next_outbound();

	/**
	 * Check an inbound sequence number against the last accepted one.
	 * A gap moves the baseline to seq, so it is only reported once.
	 */
	verdict validate_inbound(uint64_t seq);

	/**
	 * @return whether seq, already judged a duplicate, is low enough to
	 *         mean the server restarted its own numbering
	 */
	bool is_restart(uint64_t seq) const;

	/**
	 * Make seq the last accepted inbound number.
	 */
	void rebaseline_inbound(uint64_t seq);

	/**
	 * Restart both directions. Bumps the epoch so holders of envelopes
	 * stamped earlier know to restamp them.
	 */
	void reset();

	uint64_t last_sent() const { return m_last_sent; }
	uint64_t last_received() const { return m_last_received; }
	uint64_t epoch() const { return m_epoch; }

	void require_sequencing(bool value) { m_require_sequencing = value; }

	static const char* to_string(verdict v);

private:
	std::atomic<uint64_t> m_last_sent;
	uint64_t m_last_received;
	bool m_have_baseline;
	bool m_require_sequencing;
	uint64_t m_epoch;
};

} // namespace opamp
