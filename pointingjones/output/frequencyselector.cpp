#include "frequencyselector.h"

#include "../errors.h"

#include <cmath>
#include <sstream>

const double FrequencySelector::Tolerance = 190e3;

size_t FrequencySelector::Select(const std::vector<double>& frequencies, double requestedFrequency)
{
	if(frequencies.empty())
		throw RangeError("Can not select a frequency from an empty band");
	if(!(requestedFrequency >= frequencies.front() && requestedFrequency <= frequencies.back()))
	{
		std::ostringstream msg;
		msg << "Requested frequency " << requestedFrequency << " Hz outside of band ("
			<< frequencies.front() << " - " << frequencies.back() << " Hz)";
		throw RangeError(msg.str());
	}
	size_t bestIndex = 0;
	double bestDistance = std::fabs(frequencies[0] - requestedFrequency);
	for(size_t i=1; i!=frequencies.size(); ++i)
	{
		const double distance = std::fabs(frequencies[i] - requestedFrequency);
		if(distance < bestDistance)
		{
			bestDistance = distance;
			bestIndex = i;
		}
	}
	if(bestDistance > Tolerance)
	{
		std::ostringstream msg;
		msg << "No channel within " << Tolerance << " Hz of requested frequency " << requestedFrequency
			<< " Hz (closest channel is at " << frequencies[bestIndex] << " Hz)";
		throw NoMatchingChannelError(msg.str());
	}
	return bestIndex;
}
