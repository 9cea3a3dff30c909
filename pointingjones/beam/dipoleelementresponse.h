#ifndef DIPOLE_ELEMENT_RESPONSE_H
#define DIPOLE_ELEMENT_RESPONSE_H

#include "elementresponse.h"

/**
 * Two ideal, crossed short dipoles. The p dipole lies along the given
 * orientation, the q dipole perpendicular to it.
 */
class DipoleElementResponse final : public ElementResponse
{
public:
	explicit DipoleElementResponse(double orientation = 0.0) : _orientation(orientation) { }

	void Response(double frequency, double theta, double phi, std::complex<double>* response) const final override;

	std::string Name() const final override { return "dipole"; }

	double Orientation() const { return _orientation; }

private:
	double _orientation;
};

#endif
