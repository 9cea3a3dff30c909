#ifndef JONES_FORMATTER_H
#define JONES_FORMATTER_H

#include <complex>
#include <ostream>
#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time_types.hpp>

class JonesGrid;
struct PointingDiagnostics;

/**
 * Writes Jones grids as text tables, one line per row.
 *
 * In csv format, lines are comma separated, start with a header line, times
 * are ISO-8601 UTC and each complex value is a single token such as
 * "(0.5-0.25j)". In pac format, lines are space separated without a header,
 * times are written as MJD days and each complex value is written as two
 * tokens, real and imaginary part.
 */
class JonesFormatter
{
public:
	enum Format { CSVFormat, PACFormat };

	JonesFormatter(std::ostream& stream, Format format);

	/** @throws InvalidArgumentError for unknown names. */
	static Format ParseFormat(const std::string& name);

	static std::string FormatName(Format format);

	/** One row per (time, frequency), time-outer. */
	void WriteAll(const JonesGrid& grid);

	/**
	 * One row per time for a single channel.
	 * @param frequency The frequency that is written in the rows.
	 */
	void WriteChannel(const JonesGrid& grid, size_t frequencyIndex, double frequency);

	/**
	 * Power of the p and q channels, i.e. |J00|^2+|J01|^2 and |J11|^2+|J10|^2.
	 * Writes all channels, or only the given one.
	 */
	void WritePower(const JonesGrid& grid);
	void WritePower(const JonesGrid& grid, size_t frequencyIndex, double frequency);

	void WriteDiagnostics(const std::vector<PointingDiagnostics>& diagnostics);

	/** Format a complex number as a single csv token. */
	static std::string ComplexToken(const std::complex<double>& value);

	/**
	 * Parse a token written by @ref ComplexToken().
	 * @throws MalformedError when the token is not a complex number.
	 */
	static std::complex<double> ParseComplexToken(const std::string& token);

private:
	void writeTime(const boost::posix_time::ptime& time);
	void writeValue(double value);
	void writeComplex(const std::complex<double>& value);
	void writeMatrixRow(const boost::posix_time::ptime& time, double frequency, const std::complex<double>* matrix);
	void writePowerRow(const boost::posix_time::ptime& time, double frequency, const std::complex<double>* matrix);
	void writeHeader(const char* header);
	const char* delimiter() const { return _format == CSVFormat ? "," : " "; }

	std::ostream& _stream;
	Format _format;
};

#endif
