/**
 * @file
 *
 * Interface to scoped_temp_directory -- a directory that lives as long as
 * the object does.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <string>

namespace test_helpers
{

/**
 * Creates a uniquely named directory on construction and removes it, and
 * everything in it, on destruction.
 */
class scoped_temp_directory
{
public:
	/**
	 * @throws Poco::Exception if the directory could not be created.
	 */
	scoped_temp_directory();
	~scoped_temp_directory();

	const std::string& get_directory() const { return m_directory; }

	/**
	 * @return the path of name inside the directory
	 */
	std::string path(const std::string& name) const;

	/**
	 * Write a file inside the directory.
	 *
	 * @return the path of the file
	 */
	std::string write_file(const std::string& name, const std::string& content) const;

	/**
	 * @return the content of a file inside the directory, empty if it
	 *         does not exist
	 */
	std::string read_file(const std::string& name) const;

private:
	const std::string m_directory;
};

}  // namespace test_helpers
