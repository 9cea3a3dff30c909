#ifndef POINTINGJONES_SETTINGS_H
#define POINTINGJONES_SETTINGS_H

#include "../output/jonesformatter.h"

#include "../rime/pointingtracker.h"

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <string>

/**
 * This class describes all settings for a single run of the tool.
 * @sa PointingJones
 */
class PointingJonesSettings
{
public:
	PointingJonesSettings();

	/**
	 * @throws InvalidArgumentError when the settings can not be used.
	 */
	void Validate() const;

	TrackingRequest MakeTrackingRequest() const;

	/**
	 * The directory with telescope reference data: the POINTINGJONES_DATA
	 * environment variable when set, otherwise the installed data directory.
	 */
	static std::string DefaultDataDirectory();

	enum Action { PrintAction, PlotAction } action;
	std::string telescope, band, station, beamModel;
	boost::posix_time::ptime beginTime;
	boost::posix_time::time_duration duration, step;
	CelestialDirection direction;
	bool hasFrequency;
	double frequency;
	JonesFormatter::Format outputFormat;
	bool doParallacticRotation;
	std::string dataDirectory;
};

#endif
