/**
 * @file
 *
 * Implementation of send_task.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "send_task.h"
#include "common_logger.h"
#include "protobuf_compression.h"
#include "protocol.h"
#include "watchdog_runnable_fatal_error.h"

#include <algorithm>
#include <cinttypes>

COMMON_LOGGER();

namespace opamp
{

send_task::send_task(running_state& state,
                     session& s,
                     transport_holder& holder,
                     const client_config& config,
                     const transport_factory& factory,
                     const reconnect_backoff::random_source& random) :
	running_state_runnable("opamp_send", state),
	m_session(s),
	m_holder(holder),
	m_config(config),
	m_factory(factory ? factory : transport_factory(&send_task::create_transport)),
	m_backoff(config.backoff, random),
	m_endpoint(config.endpoint),
	m_generation(0),
	m_have_in_flight(false)
{
}

std::shared_ptr<transport> send_task::create_transport(const endpoint_settings& settings)
{
	return std::shared_ptr<transport>(transport::create(settings));
}

void send_task::do_run()
{
	m_session.start();

	while (heartbeat())
	{
		if (m_transport && m_session.connection_lost(m_generation))
		{
			disconnect("connection lost");
		}

		if (!m_transport && !connect())
		{
			continue;
		}

		opampproto::AgentToServer envelope;

		if (m_have_in_flight)
		{
			envelope = m_in_flight;
			m_session.restamp(envelope);
		}
		else
		{
			poll_health();

			const clock::time_point now = clock::now();
			if (now < m_next_heartbeat || !heartbeat_enabled())
			{
				const auto remaining =
					std::chrono::duration_cast<std::chrono::milliseconds>(m_next_heartbeat - now);
				const auto wait = heartbeat_enabled()
				                  ? std::min(remaining, m_config.receive_timeout)
				                  : m_config.receive_timeout;
				m_session.wait_for_outbound(m_generation, wait);
			}

			if (m_session.connection_lost(m_generation) || m_session.stop_requested())
			{
				continue;
			}

			const bool due = heartbeat_enabled() && clock::now() >= m_next_heartbeat;
			if (!m_session.build_envelope(envelope, due))
			{
				continue;
			}
		}

		if (!send(envelope, m_session.outbound_compressor()))
		{
			m_in_flight = envelope;
			m_have_in_flight = true;
			disconnect("send failed");
			continue;
		}

		m_have_in_flight = false;
		m_next_heartbeat = clock::now() + m_session.poll_interval();
	}

	final_flush();
}

bool send_task::connect()
{
	std::chrono::milliseconds advised(0);
	if (m_session.take_server_advised_delay(advised))
	{
		m_backoff.set_server_advised(advised);
	}

	const std::chrono::milliseconds delay = m_backoff.next_delay();
	if (delay.count() > 0)
	{
		LOG_INFO("Connecting in %" PRId64 " ms", static_cast<int64_t>(delay.count()));
		if (m_running_state.wait_for(delay))
		{
			return false;
		}
	}

	endpoint_settings moved;
	if (m_session.take_endpoint_change(moved))
	{
		m_endpoint = moved;
	}

	std::shared_ptr<transport> t = m_factory(m_endpoint);
	if (!t)
	{
		LOG_ERROR("Unable to create a transport for %s", m_endpoint.url.c_str());
		return false;
	}

	const transport_error err = t->connect();
	if (err != transport_error::NONE)
	{
		LOG_WARNING("Unable to connect to %s: %s",
		            m_endpoint.url.c_str(),
		            protocol::to_string(err));
		t->close();
		return false;
	}

	m_generation = m_session.begin_connection(t->get_kind());
	m_transport = t;
	m_holder.set(t, m_generation);

	// The first exchange of a connection is never compressed
	opampproto::AgentToServer hello;
	m_session.build_hello(hello);
	if (!send(hello, null_protobuf_compressor::get()))
	{
		disconnect("handshake send failed");
		return false;
	}

	const session::state s =
		m_session.wait_for_handshake(m_generation,
		                             std::chrono::milliseconds(m_endpoint.timeout_ms));

	if (s == session::state::CLOSED)
	{
		std::string reason;
		m_holder.clear(m_generation);
		m_transport.reset();
		if (m_session.fatal_error(reason))
		{
			THROW_OPAMP_WR_FATAL_ERROR("%s", reason.c_str());
		}
		return false;
	}

	if (s != session::state::CONNECTED && s != session::state::DEGRADED)
	{
		disconnect(m_session.stop_requested() ? "stopping" : "no handshake reply");
		return false;
	}

	m_backoff.on_connected();
	m_next_heartbeat = clock::now() + m_session.poll_interval();
	// The handshake's full report already carries the current health
	m_next_health_poll = m_next_heartbeat;
	return true;
}

bool send_task::send(const opampproto::AgentToServer& msg,
                     const std::shared_ptr<protobuf_compressor>& compressor)
{
	wire_frame frame;

	if (!protocol::message_to_frame(msg, *compressor, frame))
	{
		LOG_ERROR("Unable to serialize envelope %" PRIu64 ", dropping it",
		          static_cast<uint64_t>(msg.sequence_num()));
		return true;
	}

	const transport_error err = m_transport->send(frame);
	if (err != transport_error::NONE)
	{
		LOG_WARNING("Failed to send envelope %" PRIu64 ": %s",
		            static_cast<uint64_t>(msg.sequence_num()),
		            protocol::to_string(err));
		return false;
	}

	LOG_DEBUG("Sent envelope %" PRIu64 " (%zu bytes, %s)",
	          static_cast<uint64_t>(msg.sequence_num()),
	          frame.payload.size(),
	          protocol::to_string(frame.encoding));
	return true;
}

void send_task::disconnect(const char* const why)
{
	LOG_INFO("Closing connection %" PRIu64 ": %s", m_generation, why);

	m_session.on_disconnected(m_generation);
	m_backoff.on_disconnected();
	m_holder.clear(m_generation);
	m_transport.reset();
}

void send_task::final_flush()
{
	if (m_transport && !m_session.connection_lost(m_generation))
	{
		const session::state s = m_session.get_state();

		if (s == session::state::CONNECTED || s == session::state::DEGRADED)
		{
			const std::shared_ptr<protobuf_compressor> compressor =
				m_session.outbound_compressor();

			const clock::time_point deadline = clock::now() + m_config.shutdown_grace;

			if (m_have_in_flight)
			{
				m_session.restamp(m_in_flight);
				m_have_in_flight = !send(m_in_flight, compressor);
			}

			uint32_t flushed = 0;
			opampproto::AgentToServer pending;
			while (!m_have_in_flight && clock::now() < deadline &&
			       m_session.build_envelope(pending, false))
			{
				if (!send(pending, compressor))
				{
					m_in_flight = pending;
					m_have_in_flight = true;
					break;
				}
				++flushed;
			}

			if (m_session.has_outbound())
			{
				LOG_WARNING("Final flush left queued messages unsent");
			}
			else if (flushed > 0)
			{
				LOG_DEBUG("Flushed %u queued envelopes before disconnecting", flushed);
			}

			opampproto::AgentToServer bye;
			m_session.build_disconnect(bye);
			if (m_have_in_flight || !send(bye, compressor))
			{
				LOG_WARNING("Final flush failed");
			}
			else
			{
				LOG_INFO("Sent AgentDisconnect");
			}
		}
	}

	m_session.shutdown();

	if (m_transport)
	{
		m_holder.clear(m_generation);
		m_transport.reset();
	}
}

void send_task::poll_health()
{
	const clock::time_point now = clock::now();

	if (now < m_next_health_poll)
	{
		return;
	}
	m_next_health_poll = now + m_session.poll_interval();

	if (m_session.poll_health())
	{
		LOG_DEBUG("Agent health changed, queued for the next envelope");
	}
}

bool send_task::heartbeat_enabled() const
{
	return (m_transport && m_transport->get_kind() == transport::kind::POLLING) ||
	       m_session.effective_features().has(feature::HEARTBEAT);
}

} // namespace opamp
