/**
 * @file
 *
 * Recording implementations of the collaborator interfaces.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "collaborators.h"

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace test_helpers
{

/**
 * Applies whatever it is given unless told to fail; the effective
 * config is the last applied one.
 */
class fake_config_store : public opamp::config_store
{
public:
	fake_config_store() : m_fail(false), m_fail_reads(false)
	{
		m_effective.hash = "initial";
		m_effective.files["agent.yaml"] = opamp::config_file{"a: 1\n", "text/yaml"};
	}

	opamp::apply_result apply(const opamp::remote_config& config) override
	{
		std::lock_guard<std::mutex> lock(m_lock);

		m_applied.push_back(config);
		if (m_fail)
		{
			return opamp::apply_result::failed("rejected by test");
		}
		m_effective.files = config.files;
		m_effective.hash = config.hash;
		return opamp::apply_result::applied();
	}

	opamp::effective_config current_effective_config() override
	{
		std::lock_guard<std::mutex> lock(m_lock);
		if (m_fail_reads)
		{
			throw std::runtime_error("effective config unreadable");
		}
		return m_effective;
	}

	void set_fail(const bool fail)
	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_fail = fail;
	}

	void set_fail_reads(const bool fail)
	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_fail_reads = fail;
	}

	std::vector<opamp::remote_config> applied() const
	{
		std::lock_guard<std::mutex> lock(m_lock);
		return m_applied;
	}

private:
	mutable std::mutex m_lock;
	bool m_fail;
	bool m_fail_reads;
	opamp::effective_config m_effective;
	std::vector<opamp::remote_config> m_applied;
};

/**
 * Reports "running" until told otherwise.
 */
class fake_health_reporter : public opamp::health_reporter
{
public:
	fake_health_reporter() : m_healthy(true), m_status("running"), m_fail(false), m_calls(0) {}

	opamp::agent_health current_health() override
	{
		std::lock_guard<std::mutex> lock(m_lock);

		++m_calls;
		if (m_fail)
		{
			throw std::runtime_error("health unavailable");
		}

		opamp::agent_health health;
		health.healthy = m_healthy;
		health.start_time_unix_nano = 1000;
		health.status_time_unix_nano = 2000 + m_calls;
		health.status = m_status;
		return health;
	}

	void set_status(const bool healthy, const std::string& status)
	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_healthy = healthy;
		m_status = status;
	}

	void set_fail(const bool fail)
	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_fail = fail;
	}

	uint32_t calls() const
	{
		std::lock_guard<std::mutex> lock(m_lock);
		return m_calls;
	}

private:
	mutable std::mutex m_lock;
	bool m_healthy;
	std::string m_status;
	bool m_fail;
	uint32_t m_calls;
};

class fake_certificate_manager : public opamp::certificate_manager
{
public:
	explicit fake_certificate_manager(const bool accept = true) : m_accept(accept) {}

	opamp::certificate_result on_certificate_offered(const opamp::certificate_offer& offer) override
	{
		std::lock_guard<std::mutex> lock(m_lock);
		opamp::certificate_result result;

		m_offers.push_back(offer);
		result.accepted = m_accept;
		if (m_accept)
		{
			result.certificate = offer.certificate.cert;
		}
		else
		{
			result.error = "certificate rejected by test";
		}
		return result;
	}

	std::vector<opamp::certificate_offer> offers() const
	{
		std::lock_guard<std::mutex> lock(m_lock);
		return m_offers;
	}

private:
	const bool m_accept;
	mutable std::mutex m_lock;
	std::vector<opamp::certificate_offer> m_offers;
};

class fake_package_manager : public opamp::package_manager
{
public:
	fake_package_manager() : m_fail(false) {}

	void on_packages_available(const opamp::packages_available& offer) override
	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_offers.push_back(offer);
		if (m_fail)
		{
			throw std::runtime_error("no space for packages");
		}
	}

	void set_fail(const bool fail)
	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_fail = fail;
	}

	std::vector<opamp::packages_available> offers() const
	{
		std::lock_guard<std::mutex> lock(m_lock);
		return m_offers;
	}

private:
	mutable std::mutex m_lock;
	bool m_fail;
	std::vector<opamp::packages_available> m_offers;
};

/**
 * Keeps every event it is told about.
 */
class recording_listener : public opamp::session_listener
{
public:
	using transition = std::pair<std::string, std::string>;

	void on_state_change(const std::string& from, const std::string& to) override
	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_transitions.emplace_back(from, to);
	}

	void on_backpressure(const uint32_t dropped) override
	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_backpressure.push_back(dropped);
	}

	void on_server_error(const std::string& type, const std::string& message) override
	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_errors.push_back(type + ": " + message);
	}

	void on_restart_requested() override
	{
		std::lock_guard<std::mutex> lock(m_lock);
		++m_restarts;
	}

	void on_instance_uid_changed(const std::string& old_uid, const std::string& new_uid) override
	{
		std::lock_guard<std::mutex> lock(m_lock);
		m_uid_changes.emplace_back(old_uid, new_uid);
	}

	std::vector<transition> transitions() const
	{
		std::lock_guard<std::mutex> lock(m_lock);
		return m_transitions;
	}

	bool saw_transition(const std::string& from, const std::string& to) const
	{
		std::lock_guard<std::mutex> lock(m_lock);
		for (const auto& t : m_transitions)
		{
			if (t.first == from && t.second == to)
			{
				return true;
			}
		}
		return false;
	}

	std::vector<uint32_t> backpressure() const
	{
		std::lock_guard<std::mutex> lock(m_lock);
		return m_backpressure;
	}

	std::vector<std::string> errors() const
	{
		std::lock_guard<std::mutex> lock(m_lock);
		return m_errors;
	}

	uint32_t restarts() const
	{
		std::lock_guard<std::mutex> lock(m_lock);
		return m_restarts;
	}

	std::vector<transition> uid_changes() const
	{
		std::lock_guard<std::mutex> lock(m_lock);
		return m_uid_changes;
	}

private:
	mutable std::mutex m_lock;
	std::vector<transition> m_transitions;
	std::vector<uint32_t> m_backpressure;
	std::vector<std::string> m_errors;
	uint32_t m_restarts = 0;
	std::vector<transition> m_uid_changes;
};

}  // namespace test_helpers
