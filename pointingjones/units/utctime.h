#ifndef UTC_TIME_H
#define UTC_TIME_H

#include <string>

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <casacore/measures/Measures/MEpoch.h>

class UTCTime
{
public:
	/**
	 * Parse an ISO-8601 UTC time of the form yyyy-mm-ddTHH:MM:SS, optionally
	 * followed by a fraction of a second.
	 * @throws InvalidArgumentError when the string is not such a time.
	 */
	static boost::posix_time::ptime Parse(const std::string& str);

	/**
	 * Format as yyyy-mm-ddTHH:MM:SS. Fractional seconds are only added
	 * (as six digits) when the time has a sub-second part.
	 */
	static std::string ToString(const boost::posix_time::ptime& time);

	/** Modified Julian date in days. */
	static double ToMJD(const boost::posix_time::ptime& time);

	/**
	 * The value of the time when read as a casacore quantity, as done
	 * by the pac software. This is the MJD in days.
	 */
	static double ToQuantityValue(const boost::posix_time::ptime& time);

	static casacore::MEpoch ToEpoch(const boost::posix_time::ptime& time);
};

#endif
