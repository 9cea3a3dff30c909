#include "pointingjonessettings.h"

#include "../errors.h"

#include <cstdlib>

#ifndef POINTINGJONES_DATA_DIR
#define POINTINGJONES_DATA_DIR "/usr/local/share/pointingjones"
#endif

PointingJonesSettings::PointingJonesSettings() :
	action(PrintAction),
	duration(boost::posix_time::seconds(0)),
	step(boost::posix_time::seconds(1)),
	hasFrequency(false),
	frequency(0.0),
	outputFormat(JonesFormatter::CSVFormat),
	doParallacticRotation(true),
	dataDirectory(DefaultDataDirectory())
{ }

void PointingJonesSettings::Validate() const
{
	if(telescope.empty())
		throw InvalidArgumentError("No telescope given");
	if(band.empty())
		throw InvalidArgumentError("No band given");
	if(station.empty())
		throw InvalidArgumentError("No station given");
	if(beamModel.empty())
		throw InvalidArgumentError("No beam model given");
	if(beginTime.is_special())
		throw InvalidArgumentError("No start time given");
	if(duration.is_negative())
		throw InvalidArgumentError("Duration should not be negative");
	if(step.total_microseconds() <= 0)
		throw InvalidArgumentError("Step time should be positive");
	if(dataDirectory.empty())
		throw InvalidArgumentError("No data directory given");
}

TrackingRequest PointingJonesSettings::MakeTrackingRequest() const
{
	TrackingRequest request;
	request.telescope = telescope;
	request.station = station;
	request.band = band;
	request.beamModel = beamModel;
	request.beginTime = beginTime;
	request.duration = duration;
	request.step = step;
	request.direction = direction;
	request.doParallacticRotation = doParallacticRotation;
	return request;
}

std::string PointingJonesSettings::DefaultDataDirectory()
{
	const char* fromEnvironment = getenv("POINTINGJONES_DATA");
	if(fromEnvironment != nullptr && *fromEnvironment != 0)
		return fromEnvironment;
	else
		return POINTINGJONES_DATA_DIR;
}
