#include "jonesformatter.h"

#include "../errors.h"

#include "../rime/jonesgrid.h"
#include "../rime/pointingtracker.h"

#include "../units/utctime.h"

#include <boost/algorithm/string/case_conv.hpp>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace {

std::string doubleToString(double value)
{
	std::ostringstream str;
	str.precision(std::numeric_limits<double>::max_digits10);
	str << value;
	return str.str();
}

bool parseDouble(const std::string& str, double& value)
{
	char* endptr;
	errno = 0;
	value = strtod(str.c_str(), &endptr);
	return *endptr == 0 && endptr != str.c_str() && errno == 0;
}

}

JonesFormatter::JonesFormatter(std::ostream& stream, Format format) :
	_stream(stream),
	_format(format)
{ }

JonesFormatter::Format JonesFormatter::ParseFormat(const std::string& name)
{
	const std::string lower = boost::to_lower_copy(name);
	if(lower == "csv")
		return CSVFormat;
	else if(lower == "pac")
		return PACFormat;
	else
		throw InvalidArgumentError("Unknown output format '" + name + "': should be csv or pac");
}

std::string JonesFormatter::FormatName(Format format)
{
	switch(format)
	{
		case CSVFormat: return "csv";
		case PACFormat: return "pac";
	}
	return std::string();
}

std::string JonesFormatter::ComplexToken(const std::complex<double>& value)
{
	std::string token = '(' + doubleToString(value.real());
	if(std::signbit(value.imag()))
		token += '-';
	else
		token += '+';
	return token + doubleToString(std::fabs(value.imag())) + "j)";
}

std::complex<double> JonesFormatter::ParseComplexToken(const std::string& token)
{
	if(token.size() < 6 || token.front() != '(' || token.compare(token.size() - 2, 2, "j)") != 0)
		throw MalformedError("'" + token + "' is not a complex value");
	const std::string inner = token.substr(1, token.size() - 3);
	// The separating sign is the last one that is not part of an exponent
	size_t sign = std::string::npos;
	for(size_t i=inner.size()-1; i!=0; --i)
	{
		if((inner[i] == '+' || inner[i] == '-') && inner[i-1] != 'e' && inner[i-1] != 'E')
		{
			sign = i;
			break;
		}
	}
	double real, imag;
	if(sign == std::string::npos ||
		!parseDouble(inner.substr(0, sign), real) ||
		!parseDouble(inner.substr(sign), imag))
		throw MalformedError("'" + token + "' is not a complex value");
	return std::complex<double>(real, imag);
}

void JonesFormatter::writeHeader(const char* header)
{
	if(_format == CSVFormat)
		_stream << header << '\n';
}

void JonesFormatter::writeTime(const boost::posix_time::ptime& time)
{
	if(_format == CSVFormat)
		_stream << UTCTime::ToString(time);
	else
		_stream << doubleToString(UTCTime::ToQuantityValue(time));
}

void JonesFormatter::writeValue(double value)
{
	_stream << delimiter() << doubleToString(value);
}

void JonesFormatter::writeComplex(const std::complex<double>& value)
{
	if(_format == CSVFormat)
		_stream << ',' << ComplexToken(value);
	else
		_stream << ' ' << doubleToString(value.real()) << ' ' << doubleToString(value.imag());
}

void JonesFormatter::writeMatrixRow(const boost::posix_time::ptime& time, double frequency, const std::complex<double>* matrix)
{
	writeTime(time);
	writeValue(frequency);
	for(size_t i=0; i!=4; ++i)
		writeComplex(matrix[i]);
	_stream << '\n';
}

void JonesFormatter::writePowerRow(const boost::posix_time::ptime& time, double frequency, const std::complex<double>* matrix)
{
	writeTime(time);
	writeValue(frequency);
	writeValue(std::norm(matrix[0]) + std::norm(matrix[1]));
	writeValue(std::norm(matrix[3]) + std::norm(matrix[2]));
	_stream << '\n';
}

void JonesFormatter::WriteAll(const JonesGrid& grid)
{
	writeHeader("Time, Freq, J00, J01, J10, J11");
	for(size_t t=0; t!=grid.TimeCount(); ++t)
	{
		for(size_t f=0; f!=grid.FrequencyCount(); ++f)
			writeMatrixRow(grid.Times()[t], grid.Frequencies()[f], grid.Matrix(f, t));
	}
}

void JonesFormatter::WriteChannel(const JonesGrid& grid, size_t frequencyIndex, double frequency)
{
	if(frequencyIndex >= grid.FrequencyCount())
		throw RangeError("Channel index out of range");
	writeHeader("Time, Freq, J11, J12, J21, J22");
	for(size_t t=0; t!=grid.TimeCount(); ++t)
		writeMatrixRow(grid.Times()[t], frequency, grid.Matrix(frequencyIndex, t));
}

void JonesFormatter::WritePower(const JonesGrid& grid)
{
	writeHeader("Time, Freq, P, Q");
	for(size_t t=0; t!=grid.TimeCount(); ++t)
	{
		for(size_t f=0; f!=grid.FrequencyCount(); ++f)
			writePowerRow(grid.Times()[t], grid.Frequencies()[f], grid.Matrix(f, t));
	}
}

void JonesFormatter::WritePower(const JonesGrid& grid, size_t frequencyIndex, double frequency)
{
	if(frequencyIndex >= grid.FrequencyCount())
		throw RangeError("Channel index out of range");
	writeHeader("Time, Freq, P, Q");
	for(size_t t=0; t!=grid.TimeCount(); ++t)
		writePowerRow(grid.Times()[t], frequency, grid.Matrix(frequencyIndex, t));
}

void JonesFormatter::WriteDiagnostics(const std::vector<PointingDiagnostics>& diagnostics)
{
	writeHeader("Time, ParallacticAngle, Azimuth, Elevation");
	for(const PointingDiagnostics& d : diagnostics)
	{
		writeTime(d.time);
		writeValue(d.parallacticAngle);
		writeValue(d.azimuth);
		writeValue(d.elevation);
		_stream << '\n';
	}
}
