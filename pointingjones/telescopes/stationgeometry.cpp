#include "stationgeometry.h"

#include "arrayconfiguration.h"

#include "../errors.h"

#include "../pointingjones/logger.h"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>

#include <algorithm>

StationGeometry StationGeometry::Resolve(const std::string& dataRoot, const std::string& telescope, const std::string& station, const std::string& band)
{
	ArrayConfiguration configuration = ArrayConfiguration::Read(dataRoot, telescope, band);
	size_t index = configuration.FindFirst(station);
	if(index == ArrayConfiguration::NOT_FOUND)
		throw NotFoundError("Station " + station + " is not part of the " + telescope + " " + band + " array configuration");
	const std::array<double, 3> position = configuration[index].position;
	Logger::Debug << "Station " << station << " at ITRF (" << position[0] << ", " << position[1] << ", " << position[2] << ")\n";

	AlignmentMatrix rotation = AlignmentMatrix::Read(dataRoot, telescope, station, band);
	Logger::Debug << "Read " << rotation.Rows() << " x " << rotation.Columns() << " alignment matrix for " << station << '\n';
	return StationGeometry(position, std::move(rotation));
}

std::vector<std::string> StationGeometry::ListStations(const std::string& dataRoot, const std::string& telescope, const std::string& band)
{
	if(band.empty())
		throw InvalidArgumentError("A band is required to list the stations of telescope " + telescope);
	return ArrayConfiguration::Read(dataRoot, telescope, band).Names();
}

std::vector<std::string> StationGeometry::ListBands(const std::string& dataRoot, const std::string& telescope)
{
	std::vector<std::string> bands;
	boost::filesystem::path directory(dataRoot);
	directory /= telescope;
	directory /= "share";
	directory /= "simmos";
	if(!boost::filesystem::is_directory(directory))
		return bands;
	const std::string prefix = telescope + "_";
	for(boost::filesystem::directory_iterator iter(directory), end; iter != end; ++iter)
	{
		const boost::filesystem::path& file = iter->path();
		const std::string stem = file.stem().string();
		if(file.extension() == ".cfg" && boost::algorithm::starts_with(stem, prefix) && stem.size() > prefix.size())
			bands.push_back(stem.substr(prefix.size()));
	}
	std::sort(bands.begin(), bands.end());
	return bands;
}
