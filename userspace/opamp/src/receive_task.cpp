/**
 * @file
 *
 * Implementation of receive_task.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "receive_task.h"
#include "common_logger.h"
#include "protocol.h"

#include <cinttypes>

COMMON_LOGGER();

namespace opamp
{

receive_task::receive_task(running_state& state,
                           session& s,
                           transport_holder& holder,
                           const std::chrono::milliseconds receive_timeout) :
	running_state_runnable("opamp_receive", state),
	m_session(s),
	m_holder(holder),
	m_receive_timeout(receive_timeout)
{
}

void receive_task::do_run()
{
	std::shared_ptr<transport> current;
	uint64_t generation = 0;
	// Never read again from this or an older connection
	uint64_t finished = 0;

	while (heartbeat())
	{
		if (!current &&
		    !m_holder.wait_for(m_receive_timeout, finished, current, generation))
		{
			continue;
		}

		wire_frame frame;
		bool received = false;
		const transport_error err = current->poll_receive(frame, received, m_receive_timeout);

		switch (err)
		{
		case transport_error::NONE:
			if (received)
			{
				dispatch(frame, generation);
			}
			break;
		case transport_error::TIMEOUT:
			break;
		case transport_error::PROTOCOL_VIOLATION:
			LOG_WARNING("Malformed message on connection %" PRIu64, generation);
			m_session.on_decode_failure(generation);
			break;
		case transport_error::DISCONNECTED:
			if (!m_running_state.is_terminated())
			{
				m_session.on_disconnected(generation);
			}
			finished = generation;
			current.reset();
			break;
		}
	}
}

void receive_task::dispatch(const wire_frame& frame, const uint64_t generation)
{
	opampproto::ServerToAgent msg;

	try
	{
		protocol::frame_to_protobuf(frame, &msg);
	}
	catch (const protocol_error& ex)
	{
		LOG_WARNING("Unable to decode server message: %s", ex.what());
		m_session.on_decode_failure(generation);
		return;
	}

	LOG_DEBUG("Received envelope %" PRIu64 " on connection %" PRIu64,
	          static_cast<uint64_t>(msg.sequence_num()),
	          generation);
	m_session.handle_inbound(msg, generation);
}

} // namespace opamp
