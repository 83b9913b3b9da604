/**
 * @file
 *
 * Interface to instance_uid.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <cstddef>
#include <string>

namespace opamp
{

/**
 * The 128-bit identifier of one agent instance. The wire form is the 16
 * raw bytes; the text form is the canonical UUID string.
 */
class instance_uid
{
public:
	static const size_t SIZE = 16;

	/**
	 * Constructs the nil uid.
	 */
	instance_uid();

	/**
	 * Create a new time based uid.
	 */
	static instance_uid generate();

	/**
	 * Parse the canonical text form.
	 *
	 * @return false if the string is not a UUID; out is untouched
	 */
	static bool from_string(const std::string& text, instance_uid& out);

	/**
	 * Build from the wire form.
	 *
	 * @return false unless bytes holds exactly 16 bytes
	 */
	static bool from_bytes(const std::string& bytes, instance_uid& out);

	const std::string& bytes() const { return m_bytes; }
	std::string to_string() const;
	bool is_nil() const;

	bool operator==(const instance_uid& rhs) const { return m_bytes == rhs.m_bytes; }
	bool operator!=(const instance_uid& rhs) const { return m_bytes != rhs.m_bytes; }

private:
	explicit instance_uid(const std::string& bytes) : m_bytes(bytes) {}

	std::string m_bytes;
};

} // namespace opamp
