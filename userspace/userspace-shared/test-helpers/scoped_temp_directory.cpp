/**
 * @file
 *
 * Implementation of scoped_temp_directory.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "scoped_temp_directory.h"

#include <Poco/Exception.h>
#include <Poco/File.h>
#include <Poco/TemporaryFile.h>

#include <fstream>
#include <iostream>
#include <sstream>

namespace test_helpers
{

scoped_temp_directory::scoped_temp_directory() :
	m_directory(Poco::TemporaryFile::tempName())
{
	Poco::File(m_directory).createDirectories();
}

scoped_temp_directory::~scoped_temp_directory()
{
	try
	{
		Poco::File(m_directory).remove(true);
	}
	catch (const Poco::Exception& ex)
	{
		std::cerr << "Unable to remove " << m_directory << ": " << ex.displayText() << std::endl;
	}
}

std::string scoped_temp_directory::path(const std::string& name) const
{
	return m_directory + "/" + name;
}

std::string scoped_temp_directory::write_file(const std::string& name,
                                              const std::string& content) const
{
	const std::string file = path(name);
	std::ofstream out(file);

	out << content;
	return file;
}

std::string scoped_temp_directory::read_file(const std::string& name) const
{
	std::ifstream in(path(name));
	std::stringstream content;

	content << in.rdbuf();
	return content.str();
}

}  // namespace test_helpers
