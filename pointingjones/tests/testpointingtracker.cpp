#include <boost/test/unit_test.hpp>

#include "datatreefixture.h"

#include "../errors.h"

#include "../output/jonesformatter.h"

#include "../rime/pointingtracker.h"

#include "../telescopes/alignmentmatrix.h"
#include "../telescopes/cachedtelescopecatalog.h"
#include "../telescopes/telescopecatalog.h"

#include "../units/utctime.h"

#include <boost/date_time/posix_time/posix_time.hpp>

#include <cmath>
#include <sstream>

namespace {
	AlignmentMatrix identity()
	{
		std::vector<double> values = { 1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0 };
		return AlignmentMatrix(3, 3, std::move(values));
	}

	TrackingRequest lofarRequest()
	{
		TrackingRequest request;
		request.telescope = "LOFAR";
		request.band = "HBA";
		request.station = "SE607";
		request.beamModel = "Hamaker";
		request.beginTime = UTCTime::Parse("2012-04-01T01:02:03");
		request.duration = boost::posix_time::seconds(60);
		request.step = boost::posix_time::seconds(1);
		request.direction = CelestialDirection(6.11, 1.02);
		return request;
	}

	double totalPower(const JonesGrid& grid)
	{
		double power = 0.0;
		for(const std::complex<double>& value : grid.Tensor())
			power += std::norm(value);
		return power;
	}

	struct TrackerFixture : public DataTreeFixture
	{
		TrackerFixture()
		{
			WriteConfiguration("TEST", "LBA", "3826896.235 460979.455 5064658.203 30 ST001\n");
			WriteAlignment("TEST", "ST001", "LBA", identityAlignment);
			WriteModel("TEST", "Dipole", dipoleModelParset);
			request.telescope = "TEST";
			request.band = "LBA";
			request.station = "ST001";
			request.beamModel = "Dipole";
			request.beginTime = UTCTime::Parse("2012-04-01T01:02:03");
			request.duration = boost::posix_time::seconds(10);
			request.step = boost::posix_time::seconds(5);
			request.direction = CelestialDirection(0.5, 0.8);
		}

		TrackingRequest request;
	};
}

BOOST_AUTO_TEST_SUITE(pointing_tracker)

BOOST_AUTO_TEST_CASE( make_times )
{
	const boost::posix_time::ptime begin = UTCTime::Parse("2012-04-01T01:02:03");
	std::vector<boost::posix_time::ptime> times = PointingTracker::MakeTimes(begin, boost::posix_time::seconds(60), boost::posix_time::seconds(1));
	BOOST_REQUIRE_EQUAL(times.size(), 60);
	BOOST_CHECK_EQUAL(times.front(), begin);
	BOOST_CHECK_EQUAL(times.back(), begin + boost::posix_time::seconds(59));

	times = PointingTracker::MakeTimes(begin, boost::posix_time::seconds(10), boost::posix_time::seconds(3));
	BOOST_REQUIRE_EQUAL(times.size(), 4);
	BOOST_CHECK_EQUAL(times[3], begin + boost::posix_time::seconds(9));

	times = PointingTracker::MakeTimes(begin, boost::posix_time::seconds(0), boost::posix_time::seconds(1));
	BOOST_REQUIRE_EQUAL(times.size(), 1);
	BOOST_CHECK_EQUAL(times[0], begin);

	times = PointingTracker::MakeTimes(begin, boost::posix_time::milliseconds(1500), boost::posix_time::milliseconds(500));
	BOOST_CHECK_EQUAL(times.size(), 3);
}

BOOST_AUTO_TEST_CASE( make_times_invalid )
{
	const boost::posix_time::ptime begin = UTCTime::Parse("2012-04-01T01:02:03");
	BOOST_CHECK_THROW(PointingTracker::MakeTimes(begin, boost::posix_time::seconds(-1), boost::posix_time::seconds(1)), InvalidArgumentError);
	BOOST_CHECK_THROW(PointingTracker::MakeTimes(begin, boost::posix_time::seconds(60), boost::posix_time::seconds(0)), InvalidArgumentError);
	BOOST_CHECK_THROW(PointingTracker::MakeTimes(begin, boost::posix_time::seconds(60), boost::posix_time::seconds(-1)), InvalidArgumentError);
}

BOOST_AUTO_TEST_CASE( station_angles )
{
	const AlignmentMatrix rotation = identity();
	double theta, phi;
	PointingTracker::StationAngles(rotation, {{ 0.0, 0.0, 1.0 }}, theta, phi);
	BOOST_CHECK_SMALL(theta, 1e-12);
	PointingTracker::StationAngles(rotation, {{ 1.0, 0.0, 0.0 }}, theta, phi);
	BOOST_CHECK_CLOSE(theta, M_PI_2, 1e-9);
	BOOST_CHECK_SMALL(phi, 1e-12);
	PointingTracker::StationAngles(rotation, {{ 0.0, 1.0, 0.0 }}, theta, phi);
	BOOST_CHECK_CLOSE(phi, M_PI_2, 1e-9);

	// Station axes p = y, q = -x, up = z
	std::vector<double> values = { 0.0, -1.0, 0.0, 1.0, 0.0, 0.0, 0.0, 0.0, 1.0 };
	const AlignmentMatrix rotated(3, 3, std::move(values));
	PointingTracker::StationAngles(rotated, {{ 0.0, 1.0, 0.0 }}, theta, phi);
	BOOST_CHECK_CLOSE(theta, M_PI_2, 1e-9);
	BOOST_CHECK_SMALL(phi, 1e-12);
}

BOOST_AUTO_TEST_CASE( parallactic_rotation )
{
	const AlignmentMatrix rotation = identity();
	const double theta = 0.4;
	const std::array<double, 3> direction = {{ std::sin(theta), 0.0, std::cos(theta) }};
	const std::array<double, 3> pole = {{ 0.0, 0.0, 1.0 }};
	std::array<double, 4> m = PointingTracker::ParallacticRotation(rotation, direction, pole);
	BOOST_CHECK_SMALL(m[0], 1e-12);
	BOOST_CHECK_CLOSE(m[1], -1.0, 1e-9);
	BOOST_CHECK_CLOSE(m[2], 1.0, 1e-9);
	BOOST_CHECK_SMALL(m[3], 1e-12);

	// Any direction gives an orthogonal projection
	const std::array<double, 3> tilted = {{ 0.48, 0.6, 0.64 }};
	const std::array<double, 3> tiltedPole = {{ 0.0, 0.6, 0.8 }};
	m = PointingTracker::ParallacticRotation(rotation, tilted, tiltedPole);
	BOOST_CHECK_CLOSE(m[0]*m[0] + m[1]*m[1], 1.0, 1e-9);
	BOOST_CHECK_CLOSE(m[2]*m[2] + m[3]*m[3], 1.0, 1e-9);
	BOOST_CHECK_SMALL(m[0]*m[2] + m[1]*m[3], 1e-12);

	BOOST_CHECK_THROW(PointingTracker::ParallacticRotation(rotation, pole, pole), TransformError);
}

BOOST_AUTO_TEST_CASE( parallactic_angle )
{
	const double latitude = 0.9, declination = 0.5;
	BOOST_CHECK_SMALL(PointingTracker::ParallacticAngle(0.0, declination, latitude), 1e-12);
	BOOST_CHECK_GT(PointingTracker::ParallacticAngle(0.3, declination, latitude), 0.0);
	BOOST_CHECK_LT(PointingTracker::ParallacticAngle(-0.3, declination, latitude), 0.0);
	BOOST_CHECK_CLOSE(PointingTracker::ParallacticAngle(0.3, declination, latitude),
		-PointingTracker::ParallacticAngle(-0.3, declination, latitude), 1e-9);
}

BOOST_FIXTURE_TEST_CASE( track, TrackerFixture )
{
	TelescopeCatalog catalog(Root());
	PointingTracker tracker(catalog);
	TrackingResult result = tracker.Track(request);
	const JonesGrid& grid = result.grid;
	std::array<size_t, 4> shape = grid.Shape();
	BOOST_CHECK_EQUAL(shape[0], 4);
	BOOST_CHECK_EQUAL(shape[1], 2);
	BOOST_CHECK_EQUAL(shape[2], 2);
	BOOST_CHECK_EQUAL(shape[3], 2);
	BOOST_CHECK_EQUAL(grid.Tensor().size(), 4 * 2 * 4);
	BOOST_CHECK_EQUAL(grid.Frequencies()[0], 100e6);
	BOOST_CHECK_EQUAL(grid.Times()[1], request.beginTime + boost::posix_time::seconds(5));
	BOOST_CHECK_EQUAL(result.diagnostics.size(), 2);
	BOOST_CHECK_EQUAL(result.diagnostics[1].time, grid.Times()[1]);
	for(const std::complex<double>& value : grid.Tensor())
	{
		BOOST_CHECK(std::isfinite(value.real()));
		BOOST_CHECK(std::isfinite(value.imag()));
	}
}

BOOST_FIXTURE_TEST_CASE( track_errors, TrackerFixture )
{
	TelescopeCatalog catalog(Root());
	PointingTracker tracker(catalog);

	TrackingRequest early = request;
	early.beginTime = UTCTime::Parse("2009-12-31T23:59:59");
	BOOST_CHECK_THROW(tracker.Track(early), EpochError);

	TrackingRequest unknownBand = request;
	unknownBand.band = "HBA";
	BOOST_CHECK_THROW(tracker.Track(unknownBand), InvalidArgumentError);

	TrackingRequest unknownStation = request;
	unknownStation.station = "ST002";
	BOOST_CHECK_THROW(tracker.Track(unknownStation), NotFoundError);

	TrackingRequest unknownModel = request;
	unknownModel.beamModel = "Hamaker";
	BOOST_CHECK_THROW(tracker.Track(unknownModel), NotFoundError);

	TrackingRequest unknownFrame = request;
	unknownFrame.direction.frame = "NOFRAME";
	BOOST_CHECK_THROW(tracker.Track(unknownFrame), InvalidArgumentError);

	// The time window is checked before anything is read
	TrackingRequest negative = unknownModel;
	negative.duration = boost::posix_time::seconds(-10);
	BOOST_CHECK_THROW(tracker.Track(negative), InvalidArgumentError);

	WriteAlignment("TEST", "ST001", "LBA", "1 0\n0 1\n");
	BOOST_CHECK_THROW(tracker.Track(request), TransformError);
}

BOOST_FIXTURE_TEST_CASE( track_with_cached_catalog, TrackerFixture )
{
	CachedTelescopeCatalog catalog(Root());
	PointingTracker tracker(catalog);
	tracker.Track(request);
	BOOST_CHECK(catalog.Contains("TEST", "Dipole"));
	tracker.Track(request);
	BOOST_CHECK_EQUAL(catalog.Size(), 1);
}

BOOST_AUTO_TEST_CASE( lofar_scenario )
{
	TelescopeCatalog catalog(POINTINGJONES_SOURCE_DATA_DIR);
	PointingTracker tracker(catalog);
	TrackingRequest request = lofarRequest();
	TrackingResult result = tracker.Track(request);
	const JonesGrid& grid = result.grid;

	BOOST_CHECK_EQUAL(grid.TimeCount(), 60);
	BOOST_CHECK_EQUAL(grid.FrequencyCount(), 410);
	std::array<size_t, 4> shape = grid.Shape();
	BOOST_CHECK_EQUAL(shape[0], grid.Frequencies().size());
	BOOST_CHECK_EQUAL(shape[1], grid.Times().size());
	BOOST_CHECK_EQUAL(grid.Tensor().size(), 410 * 60 * 4);
	BOOST_REQUIRE_EQUAL(result.diagnostics.size(), 60);
	// The source is circumpolar for this station
	for(const PointingDiagnostics& diagnostics : result.diagnostics)
	{
		BOOST_CHECK_GT(diagnostics.elevation, 0.0);
		BOOST_CHECK_LT(diagnostics.theta, M_PI_2);
	}
	BOOST_CHECK_GT(totalPower(grid), 0.0);

	std::ostringstream stream;
	JonesFormatter formatter(stream, JonesFormatter::CSVFormat);
	formatter.WriteAll(grid);
	std::istringstream lines(stream.str());
	std::string header;
	std::getline(lines, header);
	BOOST_CHECK_EQUAL(header, "Time, Freq, J00, J01, J10, J11");

	// The parallactic rotation is orthogonal, so it does not change the power
	request.doParallacticRotation = false;
	TrackingResult unrotated = tracker.Track(request);
	BOOST_CHECK_CLOSE(totalPower(unrotated.grid), totalPower(grid), 1e-6);
}

BOOST_AUTO_TEST_CASE( lofar_epoch )
{
	TelescopeCatalog catalog(POINTINGJONES_SOURCE_DATA_DIR);
	PointingTracker tracker(catalog);
	TrackingRequest request = lofarRequest();
	request.beginTime = UTCTime::Parse("2009-04-01T01:02:03");
	BOOST_CHECK_THROW(tracker.Track(request), EpochError);
	// The dipole model has no epoch
	request.beamModel = "Dipole";
	request.duration = boost::posix_time::seconds(2);
	BOOST_CHECK_EQUAL(tracker.Track(request).grid.TimeCount(), 2);
}

BOOST_AUTO_TEST_SUITE_END()
