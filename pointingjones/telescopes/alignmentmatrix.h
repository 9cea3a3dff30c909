#ifndef ALIGNMENT_MATRIX_H
#define ALIGNMENT_MATRIX_H

#include <istream>
#include <string>
#include <utility>
#include <vector>

/**
 * Orientation of a station in one band, usually a 3x3 rotation whose
 * columns are the station's p axis, q axis and normal, expressed in ITRF.
 * The shape is whatever the file holds; it is not checked here.
 */
class AlignmentMatrix
{
public:
	AlignmentMatrix() : _nRows(0), _nColumns(0) { }

	AlignmentMatrix(size_t nRows, size_t nColumns, std::vector<double>&& values) :
		_nRows(nRows), _nColumns(nColumns), _values(std::move(values))
	{ }

	/**
	 * Read <dataRoot>/<telescope>/share/alignment/<station>_<band>.txt.
	 * @throws NotFoundError when the file does not exist.
	 * @throws MalformedError when it does not hold a numeric matrix.
	 */
	static AlignmentMatrix Read(const std::string& dataRoot, const std::string& telescope, const std::string& station, const std::string& band);

	static std::string Path(const std::string& dataRoot, const std::string& telescope, const std::string& station, const std::string& band);

	static AlignmentMatrix Parse(std::istream& stream, const std::string& sourceName);

	size_t Rows() const { return _nRows; }
	size_t Columns() const { return _nColumns; }
	bool Empty() const { return _values.empty(); }

	double operator()(size_t row, size_t column) const
	{
		return _values[row * _nColumns + column];
	}

	const std::vector<double>& Values() const { return _values; }

private:
	size_t _nRows, _nColumns;
	// row-major
	std::vector<double> _values;
};

#endif
