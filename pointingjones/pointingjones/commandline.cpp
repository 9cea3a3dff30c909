#include "commandline.h"

#include "logger.h"
#include "pointingjones.h"

#include <pjversion.h>

#include "../telescopes/stationgeometry.h"
#include "../telescopes/telescopecatalog.h"

#include "../units/utctime.h"

#include <boost/algorithm/string/join.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>

void CommandLine::PrintUsage(std::ostream& stream)
{
	stream << "Usage:\n  pointingjones [options] print|plot telescope band stnID beammodel beginUTC "
		"duration timeStep pointingRA pointingDEC [frequency]\n";
}

void CommandLine::printHelp()
{
	PrintUsage(std::cout);
	std::cout << "\n"
		"Calculates the Jones matrices of a station that tracks a direction on the sky.\n"
		"Example:\n"
		"  pointingjones print LOFAR LBA SE607 Hamaker 2012-04-01T01:02:03 60 1 6.11 1.02 60E6\n"
		"prints the Jones matrices of the LOFAR LBA antennas of station SE607 at 60 MHz, tracking\n"
		"RA, DEC = 6.11, 1.02 (radians) for 60 s starting at 2012-04-01T01:02:03, using the Hamaker model.\n"
		"\n"
		"Arguments:\n"
		"  print|plot   'print' writes the Jones matrices. 'plot' writes the pointing geometry and\n"
		"               the powers of the p and q channels.\n"
		"  beginUTC     Start time, UTC in ISO format: yyyy-mm-ddTHH:MM:SS\n"
		"  duration     Length of the time window in seconds.\n"
		"  timeStep     Time between samples in seconds.\n"
		"  pointingRA, pointingDEC\n"
		"               Tracked direction in radians.\n"
		"  frequency    Only output the channel closest to this frequency (in Hz).\n"
		"\n"
		"Options can be:\n"
		"-format <csv|pac>\n"
		"   Output format. csv writes comma separated values with a header, pac writes the format\n"
		"   of the pac software. Default: csv. '-frmt' is accepted as well.\n"
		"-pararot\n"
		"-no-pararot\n"
		"   Turn the parallactic rotation of the Jones matrices on or off. Default: on.\n"
		"-frame <reference>\n"
		"   Reference frame of the pointing direction, e.g. J2000 or B1950. Default: J2000.\n"
		"-data-dir <directory>\n"
		"   Directory with the telescope reference data. Default: $POINTINGJONES_DATA, or\n"
		"   " << PointingJonesSettings::DefaultDataDirectory() << " when that is not set.\n"
		"-verbose (or -v)\n"
		"   Increase verbosity of output.\n"
		"-quiet\n"
		"   Do not output anything but errors.\n"
		"-log-time\n"
		"   Add date and time to each log line.\n"
		"-version\n"
		"   Print the version and exit.\n";
}

void CommandLine::printHeader()
{
	Logger::Info << "pointingjones version " POINTINGJONES_VERSION_STR " (" POINTINGJONES_VERSION_DATE ")\n";
#ifndef NDEBUG
	Logger::Debug << "This version was compiled as a DEBUG version.\n";
#endif
}

double CommandLine::parse_double(const char* param, const std::string& description)
{
	char* endptr;
	errno = 0;
	double v = strtod(param, &endptr);
	if(*endptr!=0 || endptr == param || errno!=0 || !std::isfinite(v))
		throw CommandLineError("Could not parse value '" + std::string(param) + "'. " + description);
	return v;
}

double CommandLine::parse_seconds(const char* param, const std::string& description)
{
	double v = parse_double(param, description);
	if(v < 0.0)
		throw CommandLineError("Invalid negative value '" + std::string(param) + "'. " + description);
	return v;
}

std::string CommandLine::listing(const std::vector<std::string>& values)
{
	if(values.empty())
		return "(none available)";
	else
		return boost::algorithm::join(values, ", ");
}

bool CommandLine::Parse(PointingJones& pointingJones, int argc, char* argv[])
{
	PointingJonesSettings& settings = pointingJones.Settings();
	std::vector<std::string> args;
	for(int argi = 1; argi < argc; ++argi)
	{
		// A negative number such as a declination is a positional argument
		if(argv[argi][0] != '-' || argv[argi][1] == 0 || std::isdigit(static_cast<unsigned char>(argv[argi][1])) || argv[argi][1] == '.')
		{
			args.push_back(argv[argi]);
			continue;
		}
		const std::string param = argv[argi][1]=='-' ? (&argv[argi][2]) : (&argv[argi][1]);
		if(param == "version")
		{
			printHeader();
			return false;
		}
		else if(param == "help" || param == "h")
		{
			printHelp();
			return false;
		}
		else if(param == "quiet")
		{
			Logger::SetVerbosity(Logger::QuietVerbosity);
		}
		else if(param == "v" || param == "verbose")
		{
			Logger::SetVerbosity(Logger::VerboseVerbosity);
		}
		else if(param == "log-time")
		{
			Logger::SetLogTime(true);
		}
		else if(param == "format" || param == "frmt")
		{
			++argi;
			if(argi == argc)
				throw CommandLineError("Option -" + param + " requires an output format: csv, pac");
			try {
				settings.outputFormat = JonesFormatter::ParseFormat(argv[argi]);
			} catch(InvalidArgumentError& e)
			{
				throw CommandLineError(e.what());
			}
		}
		else if(param == "pararot")
		{
			settings.doParallacticRotation = true;
		}
		else if(param == "no-pararot")
		{
			settings.doParallacticRotation = false;
		}
		else if(param == "frame")
		{
			++argi;
			if(argi == argc)
				throw CommandLineError("Option -frame requires a reference frame, e.g. J2000");
			settings.direction.frame = argv[argi];
		}
		else if(param == "data-dir")
		{
			++argi;
			if(argi == argc)
				throw CommandLineError("Option -data-dir requires a directory");
			settings.dataDirectory = argv[argi];
		}
		else {
			throw CommandLineError("Unknown parameter: " + param);
		}
	}

	// We print the header only now, because the logger has now been set up
	// and possibly set to quiet.
	printHeader();

	TelescopeCatalog catalog(settings.dataDirectory);
	size_t argIndex = 0;

	if(argIndex == args.size())
		throw CommandLineError("Specify output-type:\n  'print' or 'plot'");
	const std::string& action = args[argIndex++];
	if(action == "print")
		settings.action = PointingJonesSettings::PrintAction;
	else if(action == "plot")
		settings.action = PointingJonesSettings::PlotAction;
	else
		throw CommandLineError("Unknown output-type '" + action + "': specify 'print' or 'plot'");

	if(argIndex == args.size())
		throw CommandLineError("Specify telescope:\n  " + listing(catalog.ListTelescopes()));
	settings.telescope = args[argIndex++];

	const std::vector<std::string> bands = StationGeometry::ListBands(settings.dataDirectory, settings.telescope);
	if(argIndex == args.size())
		throw CommandLineError("Specify band/feed:\n  " + listing(bands));
	settings.band = args[argIndex++];

	if(argIndex == args.size())
	{
		std::vector<std::string> stations;
		if(std::find(bands.begin(), bands.end(), settings.band) != bands.end())
			stations = StationGeometry::ListStations(settings.dataDirectory, settings.telescope, settings.band);
		throw CommandLineError("Specify station-ID:\n  " + listing(stations));
	}
	settings.station = args[argIndex++];

	if(argIndex == args.size())
		throw CommandLineError("Specify beam-model:\n  " + listing(catalog.ListBeamModels(settings.telescope)));
	settings.beamModel = args[argIndex++];

	if(argIndex == args.size())
		throw CommandLineError("Specify start-time (UTC in ISO format: yyyy-mm-ddTHH:MM:SS )");
	try {
		settings.beginTime = UTCTime::Parse(args[argIndex++]);
	} catch(InvalidArgumentError&)
	{
		throw CommandLineError("Wrong start-time format (yyyy-mm-ddTHH:MM:SS).");
	}

	if(argIndex == args.size())
		throw CommandLineError("Specify duration (in seconds).");
	const double durationSeconds = parse_seconds(args[argIndex++].c_str(), "Specify duration (in seconds).");
	settings.duration = boost::posix_time::microseconds((long long) std::llround(durationSeconds * 1e6));

	if(argIndex == args.size())
		throw CommandLineError("Specify step-time (in seconds).");
	const double stepSeconds = parse_seconds(args[argIndex++].c_str(), "Specify step-time (in seconds).");
	settings.step = boost::posix_time::microseconds((long long) std::llround(stepSeconds * 1e6));
	if(settings.step.total_microseconds() <= 0)
		throw CommandLineError("Step-time should be positive. Specify step-time (in seconds).");

	if(argIndex + 2 > args.size())
		throw CommandLineError("Specify pointing direction (in radians): RA DEC");
	settings.direction.ra = parse_double(args[argIndex++].c_str(), "Specify pointing direction (in radians): RA DEC");
	settings.direction.dec = parse_double(args[argIndex++].c_str(), "Specify pointing direction (in radians): RA DEC");

	if(argIndex != args.size())
	{
		settings.frequency = parse_double(args[argIndex++].c_str(), "Specify frequency (in Hz).");
		settings.hasFrequency = true;
	}
	if(argIndex != args.size())
		throw CommandLineError("Too many arguments given");

	try {
		settings.Validate();
	} catch(InvalidArgumentError& e)
	{
		throw CommandLineError(e.what());
	}
	return true;
}

void CommandLine::Run(PointingJones& pointingJones)
{
	pointingJones.Run(std::cout);
}
