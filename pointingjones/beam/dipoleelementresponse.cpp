#include "dipoleelementresponse.h"

#include <cmath>

void DipoleElementResponse::Response(double /*frequency*/, double theta, double phi, std::complex<double>* response) const
{
	if(theta >= M_PI_2)
	{
		for(size_t i=0; i!=4; ++i)
			response[i] = 0.0;
		return;
	}
	const double cosTheta = std::cos(theta);
	const double phiDipole = phi - _orientation;
	const double cosPhi = std::cos(phiDipole), sinPhi = std::sin(phiDipole);
	response[0] = cosTheta * cosPhi;
	response[1] = -sinPhi;
	response[2] = cosTheta * sinPhi;
	response[3] = cosPhi;
}
