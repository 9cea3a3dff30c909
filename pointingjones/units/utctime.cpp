#include "utctime.h"

#include "../errors.h"

#include <casacore/casa/Quanta/MVTime.h>
#include <casacore/casa/Quanta/Quantum.h>
#include <casacore/measures/Measures/MEpoch.h>

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>

boost::posix_time::ptime UTCTime::Parse(const std::string& str)
{
	// Pattern: yyyy-mm-ddTHH:MM:SS[.fff...]
	const std::string pattern = "dddd-dd-ddTdd:dd:dd";
	bool matches = str.size() >= pattern.size();
	for(size_t i=0; matches && i!=pattern.size(); ++i)
	{
		if(pattern[i] == 'd')
			matches = std::isdigit(static_cast<unsigned char>(str[i]));
		else
			matches = (str[i] == pattern[i]);
	}
	if(matches && str.size() > pattern.size())
	{
		matches = str[pattern.size()] == '.' && str.size() > pattern.size()+1;
		for(size_t i=pattern.size()+1; matches && i!=str.size(); ++i)
			matches = std::isdigit(static_cast<unsigned char>(str[i]));
	}
	if(!matches)
		throw InvalidArgumentError("Wrong time format '" + str + "' (should be yyyy-mm-ddTHH:MM:SS)");
	// The duration parser would accept e.g. 25:00:00 as the next day
	if(std::atoi(str.substr(11, 2).c_str()) > 23 || std::atoi(str.substr(14, 2).c_str()) > 59 || std::atoi(str.substr(17, 2).c_str()) > 59)
		throw InvalidArgumentError("Invalid time of day in '" + str + "'");
	try {
		boost::posix_time::ptime time = boost::posix_time::from_iso_extended_string(str);
		if(time.is_special())
			throw InvalidArgumentError("Invalid time: '" + str + "'");
		return time;
	} catch(std::out_of_range& e)
	{
		throw InvalidArgumentError("Invalid time '" + str + "': " + e.what());
	}
}

std::string UTCTime::ToString(const boost::posix_time::ptime& time)
{
	const boost::posix_time::time_duration tod = time.time_of_day();
	std::ostringstream str;
	str << boost::gregorian::to_iso_extended_string(time.date()) << 'T'
		<< std::setfill('0')
		<< std::setw(2) << tod.hours() << ':'
		<< std::setw(2) << tod.minutes() << ':'
		<< std::setw(2) << tod.seconds();
	const long long micro = tod.total_microseconds() % 1000000LL;
	if(micro != 0)
		str << '.' << std::setw(6) << micro;
	return str.str();
}

double UTCTime::ToMJD(const boost::posix_time::ptime& time)
{
	const boost::posix_time::ptime mjdZero(boost::gregorian::date(1858, boost::gregorian::Nov, 17));
	const boost::posix_time::time_duration sinceZero = time - mjdZero;
	// Split in whole days and remainder to keep microsecond accuracy
	const long long days = sinceZero.hours() / 24;
	const long long remainder = sinceZero.total_microseconds() - days * 86400000000LL;
	return double(days) + double(remainder) / 86400.0e6;
}

double UTCTime::ToQuantityValue(const boost::posix_time::ptime& time)
{
	casacore::Quantity quantity;
	if(!casacore::MVTime::read(quantity, ToString(time)))
		throw TransformError("casacore could not read time " + ToString(time));
	return quantity.getValue("d");
}

casacore::MEpoch UTCTime::ToEpoch(const boost::posix_time::ptime& time)
{
	return casacore::MEpoch(casacore::MVEpoch(ToMJD(time)), casacore::MEpoch::UTC);
}
