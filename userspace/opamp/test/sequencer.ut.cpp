/**
 * @file
 *
 * Unit tests for sequencer.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "sequencer.h"

#include <gtest.h>

using namespace opamp;

TEST(sequencer_test, outbound_starts_at_one)
{
	sequencer seq;

	ASSERT_EQ(1u, seq.next_outbound());
	ASSERT_EQ(2u, seq.next_outbound());
	ASSERT_EQ(3u, seq.next_outbound());
	ASSERT_EQ(3u, seq.last_sent());
}

TEST(sequencer_test, first_inbound_sets_baseline)
{
	sequencer seq;

	ASSERT_EQ(sequencer::verdict::ACCEPT, seq.validate_inbound(17));
	ASSERT_EQ(sequencer::verdict::ACCEPT, seq.validate_inbound(18));
	ASSERT_EQ(18u, seq.last_received());
}

TEST(sequencer_test, duplicates_are_discarded)
{
	sequencer seq;

	ASSERT_EQ(sequencer::verdict::ACCEPT, seq.validate_inbound(1));
	ASSERT_EQ(sequencer::verdict::ACCEPT, seq.validate_inbound(2));
	ASSERT_EQ(sequencer::verdict::DUPLICATE_DISCARD, seq.validate_inbound(2));
	ASSERT_EQ(sequencer::verdict::DUPLICATE_DISCARD, seq.validate_inbound(1));
	ASSERT_EQ(2u, seq.last_received());
}

TEST(sequencer_test, gap_is_reported_once)
{
	sequencer seq;

	ASSERT_EQ(sequencer::verdict::ACCEPT, seq.validate_inbound(1));
	ASSERT_EQ(sequencer::verdict::ACCEPT, seq.validate_inbound(2));
	ASSERT_EQ(sequencer::verdict::GAP_DETECTED, seq.validate_inbound(4));
	ASSERT_EQ(4u, seq.last_received());
	ASSERT_EQ(sequencer::verdict::ACCEPT, seq.validate_inbound(5));
}

TEST(sequencer_test, unsequenced_messages)
{
	sequencer lenient(false);
	sequencer strict(true);

	ASSERT_EQ(sequencer::verdict::ACCEPT, lenient.validate_inbound(0));
	ASSERT_EQ(sequencer::verdict::DUPLICATE_DISCARD, strict.validate_inbound(0));

	// Unsequenced messages do not establish a baseline
	ASSERT_EQ(sequencer::verdict::ACCEPT, lenient.validate_inbound(9));
	ASSERT_EQ(9u, lenient.last_received());
}

TEST(sequencer_test, reset_restarts_both_directions)
{
	sequencer seq;

	seq.next_outbound();
	seq.next_outbound();
	seq.validate_inbound(10);
	const uint64_t epoch = seq.epoch();

	seq.reset();

	ASSERT_EQ(epoch + 1, seq.epoch());
	ASSERT_EQ(0u, seq.last_sent());
	ASSERT_EQ(1u, seq.next_outbound());
	// Lower than before the reset, but it is a new baseline
	ASSERT_EQ(sequencer::verdict::ACCEPT, seq.validate_inbound(3));
}

TEST(sequencer_test, restart_detection)
{
	sequencer seq;

	ASSERT_FALSE(seq.is_restart(1));

	seq.validate_inbound(100);
	ASSERT_TRUE(seq.is_restart(1));
	ASSERT_TRUE(seq.is_restart(20));
	// Close behind the last accepted number is a retransmission
	ASSERT_FALSE(seq.is_restart(99));
	ASSERT_FALSE(seq.is_restart(100));
	ASSERT_FALSE(seq.is_restart(0));
}

TEST(sequencer_test, rebaseline_keeps_outbound)
{
	sequencer seq;

	seq.next_outbound();
	for (uint64_t i = 1; i <= 5; ++i)
	{
		seq.validate_inbound(i);
	}
	const uint64_t epoch = seq.epoch();

	ASSERT_EQ(sequencer::verdict::DUPLICATE_DISCARD, seq.validate_inbound(1));
	seq.rebaseline_inbound(1);

	ASSERT_EQ(1u, seq.last_received());
	ASSERT_EQ(1u, seq.last_sent());
	ASSERT_EQ(epoch, seq.epoch());
	ASSERT_EQ(sequencer::verdict::ACCEPT, seq.validate_inbound(2));
}
