#include "hamakerelementresponse.h"

#include "../errors.h"

#include <cmath>
#include <limits>
#include <sstream>

HamakerElementResponse::HamakerElementResponse(double frequencyCentre, double frequencyRange, const std::array<size_t, 3>& shape, std::vector<std::complex<double>>&& coefficients) :
	_frequencyCentre(frequencyCentre),
	_frequencyRange(frequencyRange),
	_shape(shape),
	_coefficients(std::move(coefficients))
{
	if(_shape[0] == 0 || _shape[1] == 0 || _shape[2] == 0)
		throw InvalidArgumentError("Hamaker element response needs at least one harmonic, theta power and frequency power");
	if(_frequencyRange == 0.0)
		throw InvalidArgumentError("Hamaker element response has a frequency range of zero");
	const size_t maxCount = std::numeric_limits<size_t>::max() / 2;
	if(_shape[1] > maxCount / _shape[0] || _shape[2] > maxCount / (_shape[0] * _shape[1]))
		throw InvalidArgumentError("Hamaker element response shape is too large");
	const size_t expected = _shape[0] * _shape[1] * _shape[2] * 2;
	if(_coefficients.size() != expected)
	{
		std::ostringstream msg;
		msg << "Hamaker element response of shape [" << _shape[0] << ", " << _shape[1] << ", " << _shape[2]
			<< "] needs " << expected << " complex coefficients, " << _coefficients.size() << " were given";
		throw InvalidArgumentError(msg.str());
	}
}

void HamakerElementResponse::Response(double frequency, double theta, double phi, std::complex<double>* response) const
{
	for(size_t i=0; i!=4; ++i)
		response[i] = 0.0;

	// Directions below the horizon have no response
	if(theta >= M_PI_2)
		return;

	const double normFrequency = (frequency - _frequencyCentre) / _frequencyRange;
	const size_t nThetaPowers = _shape[1], nFreqPowers = _shape[2];
	for(size_t k=0; k!=_shape[0]; ++k)
	{
		// Diagonal projection for this harmonic, evaluated with Horner's rule in
		// theta and in frequency.
		std::complex<double> projection[2] = { 0.0, 0.0 };
		for(size_t i=nThetaPowers; i!=0; --i)
		{
			for(size_t p=0; p!=2; ++p)
			{
				std::complex<double> inFrequency = coefficient(k, i-1, nFreqPowers-1, p);
				for(size_t j=nFreqPowers-1; j!=0; --j)
					inFrequency = inFrequency * normFrequency + coefficient(k, i-1, j-1, p);
				projection[p] = projection[p] * theta + inFrequency;
			}
		}

		const double kappa = ((k & 1) == 0 ? 1.0 : -1.0) * (2.0 * k + 1.0);
		const double cosPhi = std::cos(kappa * phi), sinPhi = std::sin(kappa * phi);
		response[0] += cosPhi * projection[0];
		response[1] += -sinPhi * projection[1];
		response[2] += sinPhi * projection[0];
		response[3] += cosPhi * projection[1];
	}
}
