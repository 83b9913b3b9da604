/**
 * @file
 *
 * Implementation of client_config and the opamp configuration keys.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "client_config.h"
#include "common_logger.h"
#include "type_config.h"

COMMON_LOGGER();

namespace
{

type_config<std::string> c_endpoint(
        "ws://127.0.0.1:4320/v1/opamp",
        "URL of the OpAMP server. http(s) polls, ws(s) keeps a WebSocket open.",
        "opamp",
        "endpoint");

type_config<std::string>::ptr c_api_key =
	type_config_builder<std::string>("",
	                                 "Key sent in the Authorization header.",
	                                 "opamp",
	                                 "api_key")
		.hidden()
		.build();

type_config<std::map<std::string, std::string>> c_headers(
        {},
        "Extra HTTP headers sent with every request.",
        "opamp",
        "headers");

type_config<uint64_t>::ptr c_timeout_ms =
	type_config_builder<uint64_t>(10000,
	                              "Timeout for network operations, in milliseconds.",
	                              "opamp",
	                              "timeout_ms")
		.min(100)
		.build();

type_config<bool> c_ssl_verify_certificate(
        true,
        "Verify the server certificate on https and wss connections.",
        "opamp",
        "tls",
        "verify_certificate");

type_config<std::string> c_ssl_ca_cert_file(
        "",
        "CA bundle used to verify the server certificate.",
        "opamp",
        "tls",
        "ca_cert_file");

type_config<std::string> c_ssl_client_cert_file(
        "",
        "Client certificate presented to the server.",
        "opamp",
        "tls",
        "client_cert_file");

type_config<std::string> c_ssl_client_key_file(
        "",
        "Private key of the client certificate.",
        "opamp",
        "tls",
        "client_key_file");

type_config<uint32_t>::ptr c_poll_interval_s =
	type_config_builder<uint32_t>(30,
	                              "Seconds between polls, or between heartbeats when streaming.",
	                              "opamp",
	                              "poll_interval")
		.min(1)
		.build();

type_config<uint32_t>::ptr c_receive_timeout_ms =
	type_config_builder<uint32_t>(1000,
	                              "Longest single wait for an inbound message, in milliseconds.",
	                              "opamp",
	                              "receive_timeout_ms")
		.min(10)
		.build();

type_config<uint32_t> c_backoff_base_ms(
        1000,
        "First reconnect delay, in milliseconds.",
        "opamp",
        "backoff",
        "base_ms");

type_config<uint32_t> c_backoff_max_ms(
        300000,
        "The ceiling for the exponential reconnect backoff, in milliseconds.",
        "opamp",
        "backoff",
        "max_ms");

type_config<double> c_backoff_multiplier(
        2.0,
        "Growth factor of the reconnect delay.",
        "opamp",
        "backoff",
        "multiplier");

type_config<double> c_backoff_jitter(
        0.2,
        "Random fraction added to every reconnect delay.",
        "opamp",
        "backoff",
        "jitter");

type_config<uint32_t> c_backoff_stability_ms(
        60000,
        "A connection that stays up this long restarts the backoff from base.",
        "opamp",
        "backoff",
        "stability_threshold_ms");

type_config<uint32_t>::ptr c_queue_bound =
	type_config_builder<uint32_t>(64,
	                              "Number of critical messages kept while disconnected.",
	                              "opamp",
	                              "queue_bound")
		.min(1)
		.build();

type_config<std::string> c_resumption(
        "auto",
        "Sequence counters on reconnect: auto, reset or resume.",
        "opamp",
        "resumption");

type_config<std::vector<std::string>> c_compression(
        {"gzip"},
        "Compression methods the agent may use.",
        "opamp",
        "compression");

type_config<std::vector<std::string>> c_features(
        {},
        "Features the agent offers. Empty offers every known feature.",
        "opamp",
        "features");

type_config<std::vector<std::string>> c_required_features(
        {},
        "Features the server must offer, otherwise the client stops.",
        "opamp",
        "required_features");

type_config<bool> c_require_sequencing(
        false,
        "Discard server messages that carry no sequence number.",
        "opamp",
        "require_sequencing");

type_config<uint32_t> c_shutdown_grace_ms(
        5000,
        "Time allowed for the final flush on shutdown, in milliseconds.",
        "opamp",
        "shutdown_grace_ms");

type_config<std::string> c_service_name(
        "opamp-agent",
        "service.name reported in the agent description.",
        "opamp",
        "service_name");

type_config<std::string> c_service_version(
        "",
        "service.version reported in the agent description.",
        "opamp",
        "service_version");

type_config<std::map<std::string, std::string>> c_attributes(
        {},
        "Extra non identifying attributes of the agent description.",
        "opamp",
        "attributes");

type_config<std::string> c_instance_uid(
        "",
        "Fixed instance uid. Empty generates a new one on every start.",
        "opamp",
        "instance_uid");

} // namespace

namespace opamp
{

client_config client_config::from_configuration()
{
	client_config ret;

	ret.endpoint.url = c_endpoint.get_value();
	ret.endpoint.api_key = c_api_key->get_value();
	ret.endpoint.headers = c_headers.get_value();
	ret.endpoint.timeout_ms = c_timeout_ms->get_value();
	ret.endpoint.tls.verify_certificate = c_ssl_verify_certificate.get_value();
	ret.endpoint.tls.ca_cert_file = c_ssl_ca_cert_file.get_value();
	ret.endpoint.tls.client_cert_file = c_ssl_client_cert_file.get_value();
	ret.endpoint.tls.client_key_file = c_ssl_client_key_file.get_value();

	ret.poll_interval = std::chrono::seconds(c_poll_interval_s->get_value());
	ret.receive_timeout = std::chrono::milliseconds(c_receive_timeout_ms->get_value());

	ret.backoff.base = std::chrono::milliseconds(c_backoff_base_ms.get_value());
	ret.backoff.max = std::chrono::milliseconds(c_backoff_max_ms.get_value());
	ret.backoff.multiplier = c_backoff_multiplier.get_value();
	ret.backoff.jitter = c_backoff_jitter.get_value();
	ret.backoff.stability_threshold = std::chrono::milliseconds(c_backoff_stability_ms.get_value());

	ret.queue_bound = c_queue_bound->get_value();

	if (!parse_resumption(c_resumption.get_value(), ret.resumption_policy))
	{
		LOG_WARNING("Unknown resumption policy %s, using auto",
		            c_resumption.get_value().c_str());
		ret.resumption_policy = resumption::AUTO;
	}

	ret.compression = {compression_method::NONE};
	for (const auto& name : c_compression.get_value())
	{
		try
		{
			const compression_method method = protocol::parse_content_encoding(name);
			if (method != compression_method::NONE)
			{
				ret.compression.push_back(method);
			}
		}
		catch (const protocol_error&)
		{
			LOG_WARNING("Ignoring unsupported compression %s", name.c_str());
		}
	}

	if (!c_features.get_value().empty())
	{
		ret.local_features = capabilities::parse_feature_list(c_features.get_value());
	}
	ret.required_features = capabilities::parse_feature_list(c_required_features.get_value());

	// A required feature has to be offered
	ret.local_features = ret.local_features | ret.required_features;

	ret.require_sequencing = c_require_sequencing.get_value();
	ret.shutdown_grace = std::chrono::milliseconds(c_shutdown_grace_ms.get_value());
	ret.service_name = c_service_name.get_value();
	ret.service_version = c_service_version.get_value();
	ret.extra_attributes = c_attributes.get_value();
	ret.instance_uid = c_instance_uid.get_value();

	return ret;
}

bool client_config::parse_resumption(const std::string& name, resumption& out)
{
	if (name == "auto")
	{
		out = resumption::AUTO;
	}
	else if (name == "reset")
	{
		out = resumption::RESET;
	}
	else if (name == "resume")
	{
		out = resumption::RESUME;
	}
	else
	{
		return false;
	}
	return true;
}

const char* client_config::to_string(const resumption policy)
{
	switch (policy)
	{
	case resumption::AUTO:
		return "auto";
	case resumption::RESET:
		return "reset";
	case resumption::RESUME:
		return "resume";
	}
	return "unknown";
}

} // namespace opamp
