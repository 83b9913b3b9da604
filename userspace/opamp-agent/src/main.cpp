/**
 * @file
 *
 * Entry point of opamp-agent.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "opamp_agent.h"

#include <Poco/Exception.h>

#include <exception>
#include <iostream>

int main(int argc, char** argv)
{
	try
	{
		opamp_agent::opamp_agent_app app;
		return app.run(argc, argv);
	}
	catch (const Poco::Exception& e)
	{
		std::cerr << e.displayText() << std::endl;
		throw;
	}
	catch (const std::exception& e)
	{
		std::cerr << e.what() << std::endl;
		throw;
	}
}
