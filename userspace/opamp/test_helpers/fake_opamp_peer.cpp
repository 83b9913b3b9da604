/**
 * @file
 *
 * Implementation of fake_opamp_peer.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "fake_opamp_peer.h"
#include "protobuf_compression.h"

#include <algorithm>
#include <stdexcept>

using namespace opamp;

namespace test_helpers
{

fake_opamp_peer::fake_opamp_peer() :
	m_connection(0),
	m_connected(false),
	m_reachable(true),
	m_fail_sends(false),
	m_attempts(0),
	m_connections(0),
	m_sequence(0)
{
}

void fake_opamp_peer::set_responder(const responder& r)
{
	std::lock_guard<std::mutex> lock(m_lock);
	m_responder = r;
}

void fake_opamp_peer::reply(const opampproto::ServerToAgent& msg, const compression_method encoding)
{
	wire_frame frame;
	std::shared_ptr<protobuf_compressor> compressor = protobuf_compressor_factory::get(encoding);

	if (!protocol::message_to_frame(msg, *compressor, frame))
	{
		throw std::runtime_error("fake_opamp_peer: unable to serialize reply");
	}
	reply_raw(frame);
}

void fake_opamp_peer::reply_raw(const wire_frame& frame)
{
	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_replies.push_back(frame);
	}
	m_cv.notify_all();
}

void fake_opamp_peer::drop_connection()
{
	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_connected = false;
		m_replies.clear();
	}
	m_cv.notify_all();
}

void fake_opamp_peer::set_reachable(const bool reachable)
{
	std::lock_guard<std::mutex> lock(m_lock);
	m_reachable = reachable;
}

void fake_opamp_peer::set_fail_sends(const bool fail)
{
	std::lock_guard<std::mutex> lock(m_lock);
	m_fail_sends = fail;
}

uint64_t fake_opamp_peer::accept_connection()
{
	std::lock_guard<std::mutex> lock(m_lock);

	++m_attempts;
	if (!m_reachable)
	{
		return 0;
	}

	++m_connection;
	++m_connections;
	m_connected = true;
	m_replies.clear();
	return m_connection;
}

transport_error fake_opamp_peer::deliver(const uint64_t connection, const wire_frame& frame)
{
	opampproto::AgentToServer msg;
	responder r;

	{
		std::lock_guard<std::mutex> lock(m_lock);

		if (!m_connected || connection != m_connection || m_fail_sends)
		{
			return transport_error::DISCONNECTED;
		}
	}

	try
	{
		protocol::frame_to_protobuf(frame, &msg);
	}
	catch (const protocol_error&)
	{
		return transport_error::PROTOCOL_VIOLATION;
	}

	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_received.push_back(msg);
		m_encodings.push_back(frame.encoding);
		r = m_responder;
	}
	m_cv.notify_all();

	if (r)
	{
		r(msg, *this);
	}
	return transport_error::NONE;
}

fake_opamp_peer::receive_result fake_opamp_peer::next_reply(const uint64_t connection,
                                                            wire_frame& frame,
                                                            const std::chrono::milliseconds timeout,
                                                            const std::function<bool()>& aborted)
{
	std::unique_lock<std::mutex> lock(m_lock);

	m_cv.wait_for(lock, timeout, [this, connection, &aborted]()
	{
		return aborted() ||
		       !m_connected ||
		       connection != m_connection ||
		       !m_replies.empty();
	});

	if (aborted() || !m_connected || connection != m_connection)
	{
		return receive_result::DISCONNECTED;
	}

	if (m_replies.empty())
	{
		return receive_result::TIMEOUT;
	}

	frame = m_replies.front();
	m_replies.pop_front();
	return receive_result::FRAME;
}

bool fake_opamp_peer::pop_reply(const uint64_t connection, wire_frame& frame)
{
	std::lock_guard<std::mutex> lock(m_lock);

	if (!m_connected || connection != m_connection || m_replies.empty())
	{
		return false;
	}

	frame = m_replies.front();
	m_replies.pop_front();
	return true;
}

bool fake_opamp_peer::connection_alive(const uint64_t connection) const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_connected && connection == m_connection;
}

void fake_opamp_peer::wake()
{
	// Taking the lock orders the wake after any state change made by the
	// caller
	{
		std::lock_guard<std::mutex> lock(m_lock);
	}
	m_cv.notify_all();
}

std::vector<opampproto::AgentToServer> fake_opamp_peer::received() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_received;
}

std::vector<compression_method> fake_opamp_peer::received_encodings() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_encodings;
}

size_t fake_opamp_peer::received_count() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_received.size();
}

bool fake_opamp_peer::wait_for_received(const size_t count,
                                        const std::chrono::milliseconds timeout) const
{
	std::unique_lock<std::mutex> lock(m_lock);

	return m_cv.wait_for(lock, timeout, [this, count]()
	{
		return m_received.size() >= count;
	});
}

bool fake_opamp_peer::wait_for(const std::function<bool(const opampproto::AgentToServer&)>& pred,
                               const std::chrono::milliseconds timeout,
                               opampproto::AgentToServer* const match) const
{
	std::unique_lock<std::mutex> lock(m_lock);

	auto found = m_received.end();
	m_cv.wait_for(lock, timeout, [this, &pred, &found]()
	{
		found = std::find_if(m_received.begin(), m_received.end(), pred);
		return found != m_received.end();
	});

	if (found == m_received.end())
	{
		return false;
	}

	if (match)
	{
		*match = *found;
	}
	return true;
}

uint32_t fake_opamp_peer::connection_attempts() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_attempts;
}

uint32_t fake_opamp_peer::connections() const
{
	std::lock_guard<std::mutex> lock(m_lock);
	return m_connections;
}

uint64_t fake_opamp_peer::next_sequence()
{
	std::lock_guard<std::mutex> lock(m_lock);
	return ++m_sequence;
}

fake_opamp_peer::responder fake_opamp_peer::echo_capabilities(const uint64_t server_caps)
{
	return [server_caps](const opampproto::AgentToServer& msg, fake_opamp_peer& peer)
	{
		opampproto::ServerToAgent reply;

		reply.set_instance_uid(msg.instance_uid());
		reply.set_capabilities(server_caps);
		reply.set_sequence_num(peer.next_sequence());
		peer.reply(reply);
	};
}

}  // namespace test_helpers
