/**
 * @file
 *
 * Value types exchanged with the agent process and the interfaces the
 * engine calls into.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace opamp
{

struct config_file
{
	std::string body;
	std::string content_type;

	bool operator==(const config_file& rhs) const
	{
		return body == rhs.body && content_type == rhs.content_type;
	}
};

using config_map = std::map<std::string, config_file>;

/**
 * Configuration pushed by the server.
 */
struct remote_config
{
	config_map files;
	std::string hash;
};

struct apply_result
{
	enum class status
	{
		APPLIED,
		FAILED
	};

	status result = status::APPLIED;
	std::string reason;

	static apply_result applied() { return apply_result(); }
	static apply_result failed(const std::string& why)
	{
		apply_result r;
		r.result = status::FAILED;
		r.reason = why;
		return r;
	}
};

/**
 * The configuration the agent is actually running with.
 */
struct effective_config
{
	config_map files;
	std::string hash;
};

struct agent_health
{
	bool healthy = true;
	uint64_t start_time_unix_nano = 0;
	uint64_t status_time_unix_nano = 0;
	std::string status;
	std::string last_error;
};

struct tls_certificate
{
	std::string cert;
	std::string private_key;
	std::string ca_cert;
};

struct certificate_offer
{
	std::string settings_hash;
	tls_certificate certificate;
};

struct certificate_result
{
	bool accepted = false;
	// The certificate now in use, reported back to the server
	std::string certificate;
	std::string error;
};

struct package_available
{
	std::string name;
	bool addon = false;
	std::string version;
	std::string hash;
	std::string download_url;
	std::string content_hash;
	std::string signature;
	std::map<std::string, std::string> download_headers;
};

struct packages_available
{
	std::vector<package_available> packages;
	std::string all_packages_hash;
};

/**
 * Local installation progress of one package.
 */
enum class package_state
{
	OFFERED,
	DOWNLOADING,
	DOWNLOADED,
	INSTALLING,
	INSTALLED,
	FAILED
};

struct package_status
{
	std::string name;
	package_state state = package_state::OFFERED;
	std::string agent_has_version;
	std::string agent_has_hash;
	std::string error;
};

struct custom_message
{
	std::string capability;
	std::string type;
	std::string data;
};

/**
 * Applies remote configuration and reports the effective one.
 */
class config_store
{
public:
	using ptr = std::shared_ptr<config_store>;

	virtual ~config_store() = default;

	virtual apply_result apply(const remote_config& config) = 0;

	virtual effective_config current_effective_config() = 0;
};

class health_reporter
{
public:
	using ptr = std::shared_ptr<health_reporter>;

	virtual ~health_reporter() = default;

	virtual agent_health current_health() = 0;
};

class certificate_manager
{
public:
	using ptr = std::shared_ptr<certificate_manager>;

	virtual ~certificate_manager() = default;

	virtual certificate_result on_certificate_offered(const certificate_offer& offer) = 0;
};

/**
 * Receives package offers. Progress is reported back asynchronously
 * through opamp_client::report_package_status().
 */
class package_manager
{
public:
	using ptr = std::shared_ptr<package_manager>;

	virtual ~package_manager() = default;

	virtual void on_packages_available(const packages_available& offer) = 0;
};

/**
 * Optional observer of session events. These are invoked on engine
 * threads; implementations must not call back into the client from
 * on_state_change or on_backpressure.
 */
class session_listener
{
public:
	using ptr = std::shared_ptr<session_listener>;

	virtual ~session_listener() = default;

	virtual void on_state_change(const std::string& from, const std::string& to) {}

	/**
	 * @param dropped number of critical messages dropped by this event
	 */
	virtual void on_backpressure(uint32_t dropped) {}

	virtual void on_server_error(const std::string& type, const std::string& message) {}

	virtual void on_restart_requested() {}

	virtual void on_instance_uid_changed(const std::string& old_uid,
	                                     const std::string& new_uid) {}
};

} // namespace opamp
