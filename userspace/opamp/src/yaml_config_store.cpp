/**
 * @file
 *
 * Implementation of yaml_config_store.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "yaml_config_store.h"
#include "common_logger.h"

#include <Poco/DigestEngine.h>
#include <Poco/File.h>

#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

COMMON_LOGGER();

namespace
{

/**
 * Merge src over target. Mappings are merged key by key, anything else
 * replaces what was there.
 */
void merge_node(YAML::Node target, const YAML::Node& src)
{
	for (const auto& item : src)
	{
		const std::string key = item.first.as<std::string>();
		YAML::Node existing = target[key];

		if (existing.IsMap() && item.second.IsMap())
		{
			merge_node(existing, item.second);
		}
		else
		{
			target[key] = YAML::Clone(item.second);
		}
	}
}

/**
 * @return false if body is not empty and not a yaml mapping
 */
bool load_mapping(const std::string& name,
                  const std::string& body,
                  YAML::Node& out,
                  std::string& errstr)
{
	try
	{
		out = YAML::Load(body);
	}
	catch (const YAML::Exception& ex)
	{
		errstr = name + ": " + ex.what();
		return false;
	}

	if (out.IsNull())
	{
		return true;
	}

	if (!out.IsMap())
	{
		errstr = name + ": top level must be a mapping";
		return false;
	}
	return true;
}

} // namespace

namespace opamp
{

const char* const yaml_config_store::EFFECTIVE_FILE_NAME = "effective.yaml";
const char* const yaml_config_store::CONTENT_TYPE = "text/yaml";

yaml_config_store::yaml_config_store(const std::string& base_file,
                                     const std::string& effective_file) :
	m_base_file(base_file),
	m_effective_file(effective_file)
{
	std::string errstr;

	if (!build(config_map(), m_body, errstr))
	{
		LOG_ERROR("Unable to load base config %s: %s", m_base_file.c_str(), errstr.c_str());
		m_body = "{}\n";
	}
	m_hash = digest(m_body);
}

apply_result yaml_config_store::apply(const remote_config& config)
{
	std::lock_guard<std::mutex> lock(m_lock);
	std::string body;
	std::string errstr;

	for (const auto& file : config.files)
	{
		const std::string& type = file.second.content_type;
		if (!type.empty() && type.find("yaml") == std::string::npos)
		{
			return apply_result::failed(file.first + ": unsupported content type " + type);
		}
	}

	if (!build(config.files, body, errstr))
	{
		return apply_result::failed(errstr);
	}

	const std::string hash = digest(body);
	if (hash == m_hash)
	{
		LOG_INFO("Effective config is already up-to-date");
		return apply_result::applied();
	}

	if (!write(body, errstr))
	{
		return apply_result::failed(errstr);
	}

	LOG_INFO("Effective config updated, digest=%s", hash.c_str());
	m_body = body;
	m_hash = hash;
	return apply_result::applied();
}

effective_config yaml_config_store::current_effective_config()
{
	std::lock_guard<std::mutex> lock(m_lock);
	effective_config ret;

	config_file& file = ret.files[EFFECTIVE_FILE_NAME];
	file.body = m_body;
	file.content_type = CONTENT_TYPE;
	ret.hash = m_hash;
	return ret;
}

bool yaml_config_store::build(const config_map& remote,
                              std::string& body,
                              std::string& errstr) const
{
	YAML::Node root(YAML::NodeType::Map);

	if (!m_base_file.empty() && Poco::File(m_base_file).exists())
	{
		std::ifstream in(m_base_file);
		const std::string content((std::istreambuf_iterator<char>(in)),
		                          std::istreambuf_iterator<char>());
		YAML::Node base;

		if (!load_mapping(m_base_file, content, base, errstr))
		{
			return false;
		}
		if (base.IsMap())
		{
			merge_node(root, base);
		}
	}

	// config_map is ordered, so files merge in name order
	for (const auto& file : remote)
	{
		YAML::Node section;

		if (!load_mapping(file.first, file.second.body, section, errstr))
		{
			return false;
		}
		if (section.IsMap())
		{
			merge_node(root, section);
		}
	}

	YAML::Emitter out;
	out << root;
	body = std::string(out.c_str()) + "\n";
	return true;
}

bool yaml_config_store::write(const std::string& body, std::string& errstr) const
{
	if (m_effective_file.empty())
	{
		return true;
	}

	std::ofstream out(m_effective_file);
	out << body;
	out.flush();
	const int saved_errno = errno;

	if (!out.good())
	{
		errstr = "Unable to write " + m_effective_file + ": " + strerror(saved_errno);
		LOG_WARNING("%s", errstr.c_str());
		return false;
	}
	return true;
}

std::string yaml_config_store::digest(const std::string& body)
{
	m_sha1_engine.reset();
	m_sha1_engine.update(body);
	return Poco::DigestEngine::digestToHex(m_sha1_engine.digest());
}

} // namespace opamp
