#include "pointingjones/commandline.h"
#include "pointingjones/logger.h"
#include "pointingjones/pointingjones.h"

#include <exception>
#include <iostream>

int main(int argc, char *argv[])
{
	try {
		PointingJones pointingJones;
		if(CommandLine::Parse(pointingJones, argc, argv))
			CommandLine::Run(pointingJones);
		return 0;
	} catch(CommandLineError& e)
	{
		Logger::Error << e.what() << '\n';
		CommandLine::PrintUsage(std::cerr);
		return 2;
	} catch(std::exception& e)
	{
		Logger::Error
			<< "+ + + + + + + + + + + + + + + + + + +\n"
			<< "+ An exception occured:\n"
			<< "+ >>> " << e.what() << "\n"
			<< "+ + + + + + + + + + + + + + + + + + +\n";
		return -1;
	}
}
