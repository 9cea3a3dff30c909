#ifndef ELEMENT_RESPONSE_H
#define ELEMENT_RESPONSE_H

#include <complex>
#include <string>

/**
 * Polarimetric response of a dual-polarized antenna element. Implementations
 * correspond with the beam models that a telescope model can name.
 */
class ElementResponse
{
public:
	virtual ~ElementResponse() { }

	/**
	 * Calculate the Jones matrix of the element towards a direction.
	 * @param frequency Frequency in Hz.
	 * @param theta Angle from the element normal in radians.
	 * @param phi Azimuth from the p axis towards the q axis in radians.
	 * @param response Row-major 2x2 matrix. Rows are the p and q dipoles,
	 * columns the theta and phi components of the incident field.
	 */
	virtual void Response(double frequency, double theta, double phi, std::complex<double>* response) const = 0;

	virtual std::string Name() const = 0;
};

#endif
