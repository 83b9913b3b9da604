/**
 * @file
 *
 * Interface to receive_task.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "running_state_runnable.h"
#include "session.h"
#include "transport_holder.h"

#include <chrono>

namespace opamp
{

/**
 * Reads inbound envelopes from the current connection and hands them to
 * the session in receipt order.
 */
class receive_task : public running_state_runnable
{
public:
	receive_task(running_state& state,
	             session& s,
	             transport_holder& holder,
	             std::chrono::milliseconds receive_timeout);

	void do_run() override;

private:
	void dispatch(const wire_frame& frame, uint64_t generation);

	session& m_session;
	transport_holder& m_holder;
	const std::chrono::milliseconds m_receive_timeout;
};

} // namespace opamp
