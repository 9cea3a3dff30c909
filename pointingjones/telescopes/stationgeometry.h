#ifndef STATION_GEOMETRY_H
#define STATION_GEOMETRY_H

#include "alignmentmatrix.h"

#include <array>
#include <string>
#include <vector>

/**
 * Position and orientation of one station in one band. The position comes
 * from the array configuration and the orientation from the separate
 * alignment file; the two sources are not cross-checked.
 */
class StationGeometry
{
public:
	StationGeometry(const std::array<double, 3>& position, AlignmentMatrix&& rotation) :
		_position(position), _rotation(std::move(rotation))
	{ }

	/**
	 * Look up a station. Nothing is cached: both reference files are read
	 * on every call.
	 * @throws NotFoundError when the station is not in the array configuration,
	 * or when one of the files is missing.
	 * @throws MalformedError when one of the files can not be parsed.
	 */
	static StationGeometry Resolve(const std::string& dataRoot, const std::string& telescope, const std::string& station, const std::string& band);

	/**
	 * Names of all stations in the configuration of the telescope band, in
	 * file order and including duplicates.
	 * @throws InvalidArgumentError when band is empty.
	 */
	static std::vector<std::string> ListStations(const std::string& dataRoot, const std::string& telescope, const std::string& band);

	/**
	 * Bands for which an array configuration exists, sorted. Returns an
	 * empty list for an unknown telescope.
	 */
	static std::vector<std::string> ListBands(const std::string& dataRoot, const std::string& telescope);

	const std::array<double, 3>& Position() const { return _position; }

	const AlignmentMatrix& Rotation() const { return _rotation; }

private:
	std::array<double, 3> _position;
	AlignmentMatrix _rotation;
};

#endif
