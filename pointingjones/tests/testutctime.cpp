#include <boost/test/unit_test.hpp>
#include <boost/test/data/test_case.hpp>

#include "../errors.h"

#include "../units/utctime.h"

#include <boost/date_time/posix_time/posix_time.hpp>

#include <string>

BOOST_AUTO_TEST_SUITE(utc_time)

const std::pair<std::string, double> mjdValues[] = {
	{"1858-11-17T00:00:00", 0.0},
	{"1858-11-18T12:00:00", 1.5},
	{"2000-01-01T00:00:00", 51544.0},
	{"2000-01-01T06:00:00", 51544.25},
	{"2012-04-01T01:02:03", 56018.0 + (1.0 + (2.0 + 3.0/60.0)/60.0)/24.0},
	{"2012-04-01T23:59:59.5", 56018.0 + (86399.5/86400.0)}
};

BOOST_DATA_TEST_CASE( mjd, boost::unit_test::data::xrange(std::end(mjdValues)-std::begin(mjdValues)) )
{
	const boost::posix_time::ptime time = UTCTime::Parse(mjdValues[sample].first);
	BOOST_CHECK_SMALL(UTCTime::ToMJD(time) - mjdValues[sample].second, 1e-9);
}

BOOST_AUTO_TEST_CASE( parse_and_print )
{
	const boost::posix_time::ptime time = UTCTime::Parse("2012-04-01T01:02:03");
	BOOST_CHECK_EQUAL(time.date().year(), 2012);
	BOOST_CHECK_EQUAL(time.date().month(), 4);
	BOOST_CHECK_EQUAL(time.date().day(), 1);
	BOOST_CHECK_EQUAL(time.time_of_day().hours(), 1);
	BOOST_CHECK_EQUAL(time.time_of_day().minutes(), 2);
	BOOST_CHECK_EQUAL(time.time_of_day().seconds(), 3);
	BOOST_CHECK_EQUAL(UTCTime::ToString(time), "2012-04-01T01:02:03");

	const boost::posix_time::ptime fractional = UTCTime::Parse("2012-04-01T01:02:03.25");
	BOOST_CHECK_EQUAL((fractional - time).total_microseconds(), 250000);
	BOOST_CHECK_EQUAL(UTCTime::ToString(fractional), "2012-04-01T01:02:03.250000");
}

BOOST_AUTO_TEST_CASE( wrong_format )
{
	BOOST_CHECK_THROW(UTCTime::Parse(""), InvalidArgumentError);
	BOOST_CHECK_THROW(UTCTime::Parse("2012-04-01"), InvalidArgumentError);
	BOOST_CHECK_THROW(UTCTime::Parse("2012-04-01 01:02:03"), InvalidArgumentError);
	BOOST_CHECK_THROW(UTCTime::Parse("2012/04/01T01:02:03"), InvalidArgumentError);
	BOOST_CHECK_THROW(UTCTime::Parse("2012-04-01T01:02:03Z"), InvalidArgumentError);
	BOOST_CHECK_THROW(UTCTime::Parse("2012-04-01T01:02:03."), InvalidArgumentError);
	BOOST_CHECK_THROW(UTCTime::Parse("12-04-01T01:02:03"), InvalidArgumentError);
}

BOOST_AUTO_TEST_CASE( invalid_values )
{
	BOOST_CHECK_THROW(UTCTime::Parse("2012-13-01T01:02:03"), InvalidArgumentError);
	BOOST_CHECK_THROW(UTCTime::Parse("2012-02-30T01:02:03"), InvalidArgumentError);
	BOOST_CHECK_THROW(UTCTime::Parse("2012-04-01T25:02:03"), InvalidArgumentError);
	BOOST_CHECK_THROW(UTCTime::Parse("2012-04-01T01:60:03"), InvalidArgumentError);
}

BOOST_AUTO_TEST_CASE( quantity_value )
{
	const boost::posix_time::ptime time = UTCTime::Parse("2012-04-01T01:02:03");
	// casacore reads calendar times as MJD in days
	BOOST_CHECK_SMALL(UTCTime::ToQuantityValue(time) - UTCTime::ToMJD(time), 1e-8);
	BOOST_CHECK_SMALL(UTCTime::ToEpoch(time).getValue().get() - UTCTime::ToMJD(time), 1e-8);
}

BOOST_AUTO_TEST_SUITE_END()
