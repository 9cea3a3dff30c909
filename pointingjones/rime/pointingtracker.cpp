#include "pointingtracker.h"

#include "../errors.h"

#include "../beam/elementresponse.h"

#include "../telescopes/stationgeometry.h"
#include "../telescopes/telescopecatalog.h"

#include "../units/utctime.h"

#include "../pointingjones/logger.h"

#include <casacore/casa/Exceptions/Error.h>
#include <casacore/measures/Measures/MCDirection.h>
#include <casacore/measures/Measures/MCPosition.h>
#include <casacore/measures/Measures/MDirection.h>
#include <casacore/measures/Measures/MEpoch.h>
#include <casacore/measures/Measures/MPosition.h>
#include <casacore/measures/Measures/MeasConvert.h>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

typedef std::array<double, 3> vector3r;

vector3r cross(const vector3r& a, const vector3r& b)
{
	vector3r c = {{
		a[1]*b[2] - a[2]*b[1],
		a[2]*b[0] - a[0]*b[2],
		a[0]*b[1] - a[1]*b[0]
	}};
	return c;
}

double dot(const vector3r& a, const vector3r& b)
{
	return a[0]*b[0] + a[1]*b[1] + a[2]*b[2];
}

// Station-frame vector to ITRF
vector3r toITRF(const AlignmentMatrix& rotation, const vector3r& local)
{
	vector3r itrf;
	for(size_t i=0; i!=3; ++i)
		itrf[i] = rotation(i, 0)*local[0] + rotation(i, 1)*local[1] + rotation(i, 2)*local[2];
	return itrf;
}

vector3r itrfVector(const casacore::MDirection& itrfDir)
{
	const casacore::Vector<casacore::Double>& itrfVal = itrfDir.getValue().getValue();
	vector3r v = {{ itrfVal[0], itrfVal[1], itrfVal[2] }};
	return v;
}

}

std::vector<boost::posix_time::ptime> PointingTracker::MakeTimes(const boost::posix_time::ptime& begin, const boost::posix_time::time_duration& duration, const boost::posix_time::time_duration& step)
{
	if(duration.is_negative())
		throw InvalidArgumentError("Duration of the time window is negative");
	const long long stepMicro = step.total_microseconds();
	if(stepMicro <= 0)
		throw InvalidArgumentError("Time step should be positive");
	const long long durationMicro = duration.total_microseconds();
	size_t nTimes = (durationMicro + stepMicro - 1) / stepMicro;
	if(nTimes == 0)
		nTimes = 1;
	std::vector<boost::posix_time::ptime> times(nTimes);
	for(size_t i=0; i!=nTimes; ++i)
		times[i] = begin + boost::posix_time::microseconds(stepMicro * (long long) i);
	return times;
}

void PointingTracker::StationAngles(const AlignmentMatrix& rotation, const std::array<double, 3>& itrfDirection, double& theta, double& phi)
{
	// Columns of the rotation are the station axes, so the transpose takes
	// ITRF to station coordinates.
	vector3r local;
	for(size_t j=0; j!=3; ++j)
		local[j] = rotation(0, j)*itrfDirection[0] + rotation(1, j)*itrfDirection[1] + rotation(2, j)*itrfDirection[2];
	const double z = std::max(-1.0, std::min(1.0, local[2]));
	theta = std::acos(z);
	phi = std::atan2(local[1], local[0]);
}

std::array<double, 4> PointingTracker::ParallacticRotation(const AlignmentMatrix& rotation, const std::array<double, 3>& itrfDirection, const std::array<double, 3>& itrfPole)
{
	double theta, phi;
	StationAngles(rotation, itrfDirection, theta, phi);
	double sinTheta, cosTheta, sinPhi, cosPhi;
	sincos(theta, &sinTheta, &cosTheta);
	sincos(phi, &sinPhi, &cosPhi);
	const vector3r thetaLocal = {{ cosTheta*cosPhi, cosTheta*sinPhi, -sinTheta }};
	const vector3r phiLocal = {{ -sinPhi, cosPhi, 0.0 }};
	const vector3r thetaHat = toITRF(rotation, thetaLocal);
	const vector3r phiHat = toITRF(rotation, phiLocal);

	vector3r raHat = cross(itrfPole, itrfDirection);
	const double raNorm = std::sqrt(dot(raHat, raHat));
	if(raNorm < 1e-12)
		throw TransformError("Parallactic rotation is undefined for a direction towards the celestial pole");
	for(double& v : raHat)
		v /= raNorm;
	const vector3r decHat = cross(itrfDirection, raHat);

	std::array<double, 4> m = {{
		dot(thetaHat, raHat), dot(thetaHat, decHat),
		dot(phiHat, raHat), dot(phiHat, decHat)
	}};
	return m;
}

double PointingTracker::ParallacticAngle(double hourAngle, double declination, double latitude)
{
	return std::atan2(std::sin(hourAngle),
		std::tan(latitude)*std::cos(declination) - std::sin(declination)*std::cos(hourAngle));
}

TrackingResult PointingTracker::Track(const TrackingRequest& request)
{
	std::vector<boost::posix_time::ptime> times = MakeTimes(request.beginTime, request.duration, request.step);

	std::shared_ptr<const TelescopeModel> model = _catalog.GetTelescopeModel(request.telescope, request.beamModel);
	if(model->HasEpoch() && request.beginTime < model->Epoch())
	{
		throw EpochError("Requested time " + UTCTime::ToString(request.beginTime) + " is before the first time (" +
			UTCTime::ToString(model->Epoch()) + ") for which telescope model " + request.telescope + "/" + request.beamModel + " is available");
	}
	const BandModel& band = model->Band(request.band);
	const ElementResponse& element = band.Element();

	StationGeometry geometry = StationGeometry::Resolve(_catalog.DataRoot(), request.telescope, request.station, request.band);
	const AlignmentMatrix& rotation = geometry.Rotation();
	if(rotation.Rows() != 3 || rotation.Columns() != 3)
	{
		std::ostringstream msg;
		msg << "Alignment matrix of station " << request.station << " has shape " << rotation.Rows() << " x " << rotation.Columns() << ", but a 3 x 3 rotation is required";
		throw TransformError(msg.str());
	}

	casacore::MDirection::Types frameType;
	if(!casacore::MDirection::getType(frameType, request.direction.frame))
		throw InvalidArgumentError("Unknown direction reference frame: " + request.direction.frame);

	std::vector<double> frequencies = band.Frequencies();
	Logger::Info << "Tracking " << request.station << " (" << request.telescope << ' ' << request.band << ", " << element.Name()
		<< " element) for " << times.size() << " time steps and " << frequencies.size() << " channels\n";

	TrackingResult result;
	result.grid = JonesGrid(std::move(times), std::move(frequencies));
	JonesGrid& grid = result.grid;
	result.diagnostics.resize(grid.TimeCount());

	try {
		const std::array<double, 3>& stationPos = geometry.Position();
		casacore::MPosition position(casacore::MVPosition(stationPos[0], stationPos[1], stationPos[2]), casacore::MPosition::ITRF);
		casacore::MPosition wgs = casacore::MPosition::Convert(position, casacore::MPosition::WGS84)();
		const double latitude = wgs.getValue().getLat();

		for(size_t t=0; t!=grid.TimeCount(); ++t)
		{
			casacore::MeasFrame frame(position, UTCTime::ToEpoch(grid.Times()[t]));
			const casacore::MDirection::Ref sourceRef(frameType, frame);
			const casacore::MDirection::Ref itrfRef(casacore::MDirection::ITRF, frame);
			const casacore::MDirection::Ref azelRef(casacore::MDirection::AZEL, frame);
			const casacore::MDirection::Ref hadecRef(casacore::MDirection::HADEC, frame);

			casacore::MDirection source(casacore::MVDirection(request.direction.ra, request.direction.dec), sourceRef);
			casacore::MDirection pole(casacore::MVDirection(0.0, M_PI_2), sourceRef);
			casacore::MDirection::Convert toITRFConverter(sourceRef, itrfRef);
			const vector3r sourceITRF = itrfVector(toITRFConverter(source));
			const vector3r poleITRF = itrfVector(toITRFConverter(pole));

			casacore::MDirection azel = casacore::MDirection::Convert(source, azelRef)();
			casacore::MDirection hadec = casacore::MDirection::Convert(source, hadecRef)();
			const double hourAngle = hadec.getValue().get()[0];
			const double apparentDec = hadec.getValue().get()[1];

			PointingDiagnostics& diagnostics = result.diagnostics[t];
			diagnostics.time = grid.Times()[t];
			diagnostics.azimuth = azel.getValue().get()[0];
			diagnostics.elevation = azel.getValue().get()[1];
			diagnostics.parallacticAngle = ParallacticAngle(hourAngle, apparentDec, latitude);
			StationAngles(rotation, sourceITRF, diagnostics.theta, diagnostics.phi);

			std::array<double, 4> toEquatorial = {{ 1.0, 0.0, 0.0, 1.0 }};
			if(request.doParallacticRotation)
				toEquatorial = ParallacticRotation(rotation, sourceITRF, poleITRF);

			for(size_t ch=0; ch!=grid.FrequencyCount(); ++ch)
			{
				std::complex<double> response[4];
				element.Response(grid.Frequencies()[ch], diagnostics.theta, diagnostics.phi, response);
				std::complex<double>* matrix = grid.Matrix(ch, t);
				matrix[0] = response[0]*toEquatorial[0] + response[1]*toEquatorial[2];
				matrix[1] = response[0]*toEquatorial[1] + response[1]*toEquatorial[3];
				matrix[2] = response[2]*toEquatorial[0] + response[3]*toEquatorial[2];
				matrix[3] = response[2]*toEquatorial[1] + response[3]*toEquatorial[3];
			}
		}
	} catch(casacore::AipsError& e)
	{
		throw TransformError(std::string("Coordinate conversion failed: ") + e.what());
	}
	return result;
}
