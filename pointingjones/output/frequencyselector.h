#ifndef FREQUENCY_SELECTOR_H
#define FREQUENCY_SELECTOR_H

#include <cstddef>
#include <vector>

class FrequencySelector
{
public:
	/** Maximum distance in Hz between a requested frequency and its channel. */
	static const double Tolerance;

	/**
	 * Find the channel that is closest to the requested frequency.
	 * @param frequencies Ascending channel frequencies.
	 * @throws RangeError when the frequency lies outside the first and last
	 * channel. This is checked before looking at channel distances.
	 * @throws NoMatchingChannelError when no channel lies within @ref Tolerance.
	 */
	static size_t Select(const std::vector<double>& frequencies, double requestedFrequency);
};

#endif
