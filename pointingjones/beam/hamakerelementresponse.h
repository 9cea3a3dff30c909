#ifndef HAMAKER_ELEMENT_RESPONSE_H
#define HAMAKER_ELEMENT_RESPONSE_H

#include "elementresponse.h"

#include <array>
#include <complex>
#include <vector>

/**
 * Element response following the Hamaker-Arts harmonic expansion. The
 * coefficients are polynomials in theta and in a normalized frequency,
 * one set per azimuthal harmonic and polarization.
 */
class HamakerElementResponse final : public ElementResponse
{
public:
	/**
	 * @param frequencyCentre Frequency that is mapped to zero in the expansion.
	 * @param frequencyRange Frequency offset that is mapped to one.
	 * @param shape Number of harmonics, theta powers and frequency powers.
	 * @param coefficients Array of harmonics x theta powers x frequency powers x 2
	 * values, with the polarization index changing fastest.
	 */
	HamakerElementResponse(double frequencyCentre, double frequencyRange, const std::array<size_t, 3>& shape, std::vector<std::complex<double>>&& coefficients);

	void Response(double frequency, double theta, double phi, std::complex<double>* response) const final override;

	std::string Name() const final override { return "hamaker"; }

	size_t HarmonicCount() const { return _shape[0]; }

private:
	const std::complex<double>& coefficient(size_t harmonic, size_t thetaPower, size_t freqPower, size_t polarization) const
	{
		return _coefficients[((harmonic * _shape[1] + thetaPower) * _shape[2] + freqPower) * 2 + polarization];
	}

	double _frequencyCentre, _frequencyRange;
	std::array<size_t, 3> _shape;
	std::vector<std::complex<double>> _coefficients;
};

#endif
