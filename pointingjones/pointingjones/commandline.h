#ifndef POINTINGJONES_COMMAND_LINE_H
#define POINTINGJONES_COMMAND_LINE_H

#include "../errors.h"

#include <ostream>
#include <string>
#include <vector>

/**
 * Missing or malformed command line arguments. These are reported together
 * with the usage text.
 */
class CommandLineError : public InvalidArgumentError
{
public:
	explicit CommandLineError(const std::string& message) : InvalidArgumentError(message) { }
};

class CommandLine
{
public:
	/**
	 * Fill the settings of the run from the command line.
	 * @returns false when nothing should be run, e.g. after -help.
	 * @throws CommandLineError for missing or malformed arguments.
	 */
	static bool Parse(class PointingJones& pointingJones, int argc, char *argv[]);
	static void Run(class PointingJones& pointingJones);

	static void PrintUsage(std::ostream& stream);

private:
	static void printHeader();
	static void printHelp();
	static double parse_double(const char* param, const std::string& description);
	static double parse_seconds(const char* param, const std::string& description);
	static std::string listing(const std::vector<std::string>& values);
};

#endif
