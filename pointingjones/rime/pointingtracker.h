#ifndef POINTING_TRACKER_H
#define POINTING_TRACKER_H

#include "jonesgrid.h"

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <array>
#include <string>
#include <vector>

class AlignmentMatrix;
class TelescopeCatalog;

struct CelestialDirection
{
	CelestialDirection() : ra(0.0), dec(0.0), frame("J2000") { }
	CelestialDirection(double _ra, double _dec, const std::string& _frame = "J2000") :
		ra(_ra), dec(_dec), frame(_frame)
	{ }

	// In radians
	double ra, dec;
	// casacore direction reference type, e.g. J2000
	std::string frame;
};

struct TrackingRequest
{
	TrackingRequest() : doParallacticRotation(true) { }

	std::string telescope, station, band, beamModel;
	boost::posix_time::ptime beginTime;
	boost::posix_time::time_duration duration, step;
	CelestialDirection direction;
	bool doParallacticRotation;
};

/**
 * Per-time-sample geometry of the tracked direction, used for diagnostic
 * output. Angles are in radians.
 */
struct PointingDiagnostics
{
	boost::posix_time::ptime time;
	double parallacticAngle;
	double azimuth, elevation;
	// Direction in the station frame
	double theta, phi;
};

struct TrackingResult
{
	JonesGrid grid;
	std::vector<PointingDiagnostics> diagnostics;
};

/**
 * Calculates the Jones matrices of a station that tracks a fixed celestial
 * direction over a time window, for all channels of the band.
 */
class PointingTracker
{
public:
	explicit PointingTracker(TelescopeCatalog& catalog) : _catalog(catalog) { }

	/**
	 * Compute the Jones grid. The frequency axis is the channelization of the
	 * band in the telescope model; the time axis is given by
	 * @ref MakeTimes().
	 *
	 * Errors from the catalog and from resolving the station geometry are
	 * passed on unchanged.
	 * @throws EpochError when the window starts before the model epoch.
	 * @throws InvalidArgumentError for an invalid window, band or frame.
	 * @throws TransformError when a coordinate conversion fails.
	 */
	TrackingResult Track(const TrackingRequest& request);

	/**
	 * Time samples begin + i * step for i = 0 .. ceil(duration / step) - 1.
	 * The end of the window is exclusive, and at least one sample is returned,
	 * so a zero duration gives just the begin time.
	 */
	static std::vector<boost::posix_time::ptime> MakeTimes(const boost::posix_time::ptime& begin, const boost::posix_time::time_duration& duration, const boost::posix_time::time_duration& step);

	/**
	 * Convert an ITRF unit vector to angles in the station frame.
	 * @param rotation 3x3 matrix with the station p, q and normal axes as columns.
	 */
	static void StationAngles(const AlignmentMatrix& rotation, const std::array<double, 3>& itrfDirection, double& theta, double& phi);

	/**
	 * Projection of the station (theta, phi) field basis onto the equatorial
	 * (ra, dec) basis at the given direction, as a row-major 2x2 matrix.
	 * @param itrfDirection Unit vector of the tracked direction in ITRF.
	 * @param itrfPole Unit vector of the celestial pole of the direction's frame in ITRF.
	 */
	static std::array<double, 4> ParallacticRotation(const AlignmentMatrix& rotation, const std::array<double, 3>& itrfDirection, const std::array<double, 3>& itrfPole);

	/**
	 * Parallactic angle for an hour angle and declination at a latitude.
	 */
	static double ParallacticAngle(double hourAngle, double declination, double latitude);

private:
	TelescopeCatalog& _catalog;
};

#endif
