#ifndef POINTINGJONES_H
#define POINTINGJONES_H

#include "pointingjonessettings.h"

#include <ostream>

class PointingJones
{
public:
	PointingJones() { }

	PointingJonesSettings& Settings() { return _settings; }
	const PointingJonesSettings& Settings() const { return _settings; }

	/**
	 * Resolve the station, compute its Jones grid and write the requested
	 * table to the output stream.
	 */
	void Run(std::ostream& output);

private:
	PointingJonesSettings _settings;
};

#endif
