#ifndef JONES_GRID_H
#define JONES_GRID_H

#include <array>
#include <complex>
#include <utility>
#include <vector>

#include <boost/date_time/posix_time/posix_time_types.hpp>

/**
 * Jones matrices of one station on a time/frequency grid. The tensor is
 * indexed as [frequency, time, row, column], with the column index changing
 * fastest, and always has shape (nFrequencies, nTimes, 2, 2).
 */
class JonesGrid
{
public:
	JonesGrid() { }

	JonesGrid(std::vector<boost::posix_time::ptime>&& times, std::vector<double>&& frequencies) :
		_times(std::move(times)),
		_frequencies(std::move(frequencies)),
		_tensor(_times.size() * _frequencies.size() * 4, std::complex<double>(0.0, 0.0))
	{ }

	const std::vector<boost::posix_time::ptime>& Times() const { return _times; }
	const std::vector<double>& Frequencies() const { return _frequencies; }

	size_t TimeCount() const { return _times.size(); }
	size_t FrequencyCount() const { return _frequencies.size(); }

	std::array<size_t, 4> Shape() const
	{
		std::array<size_t, 4> shape = {{ _frequencies.size(), _times.size(), 2, 2 }};
		return shape;
	}

	/** Pointer to the four values of the matrix at the given channel and time. */
	std::complex<double>* Matrix(size_t frequencyIndex, size_t timeIndex)
	{
		return &_tensor[(frequencyIndex * _times.size() + timeIndex) * 4];
	}

	const std::complex<double>* Matrix(size_t frequencyIndex, size_t timeIndex) const
	{
		return &_tensor[(frequencyIndex * _times.size() + timeIndex) * 4];
	}

	const std::complex<double>& operator()(size_t frequencyIndex, size_t timeIndex, size_t row, size_t column) const
	{
		return Matrix(frequencyIndex, timeIndex)[row * 2 + column];
	}

	std::complex<double>& operator()(size_t frequencyIndex, size_t timeIndex, size_t row, size_t column)
	{
		return Matrix(frequencyIndex, timeIndex)[row * 2 + column];
	}

	const std::vector<std::complex<double>>& Tensor() const { return _tensor; }

private:
	std::vector<boost::posix_time::ptime> _times;
	std::vector<double> _frequencies;
	std::vector<std::complex<double>> _tensor;
};

#endif
