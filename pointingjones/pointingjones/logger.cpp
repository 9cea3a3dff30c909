#include "logger.h"

#include <boost/date_time/posix_time/posix_time.hpp>

enum Logger::LoggerLevel Logger::_level = Logger::InfoLevel;

bool Logger::_logTime = false;

Logger::LogWriter<Logger::DebugLevel> Logger::Debug;

Logger::LogWriter<Logger::InfoLevel> Logger::Info;

Logger::LogWriter<Logger::WarningLevel> Logger::Warn;

Logger::LogWriter<Logger::ErrorLevel> Logger::Error;

Logger::LogWriter<Logger::FatalLevel> Logger::Fatal;

void Logger::SetVerbosity(VerbosityLevel verbosityLevel)
{
	switch(verbosityLevel)
	{
		case QuietVerbosity:
			_level = ErrorLevel;
			break;
		case NormalVerbosity:
			_level = InfoLevel;
			break;
		case VerboseVerbosity:
			_level = DebugLevel;
			break;
	}
}

void Logger::outputTime()
{
	boost::posix_time::ptime t(boost::posix_time::microsec_clock::local_time());
	std::cerr << boost::posix_time::to_simple_string(t) << ' ';
}
