#include "arrayconfiguration.h"

#include "../errors.h"

#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>

#include <fstream>
#include <limits>
#include <sstream>

const size_t ArrayConfiguration::MaxNameLength = 5;

const size_t ArrayConfiguration::NOT_FOUND = std::numeric_limits<size_t>::max();

std::string ArrayConfiguration::Path(const std::string& dataRoot, const std::string& telescope, const std::string& band)
{
	boost::filesystem::path path(dataRoot);
	path /= telescope;
	path /= "share";
	path /= "simmos";
	path /= telescope + "_" + band + ".cfg";
	return path.string();
}

ArrayConfiguration ArrayConfiguration::Read(const std::string& dataRoot, const std::string& telescope, const std::string& band)
{
	const std::string filename = Path(dataRoot, telescope, band);
	if(!boost::filesystem::is_regular_file(filename))
		throw NotFoundError("Array configuration file '" + filename + "' not found: no configuration for telescope " + telescope + ", band " + band);
	std::ifstream file(filename);
	if(!file)
		throw NotFoundError("Could not open array configuration file '" + filename + "'");
	return Parse(file, filename);
}

ArrayConfiguration ArrayConfiguration::Parse(std::istream& stream, const std::string& sourceName)
{
	ArrayConfiguration configuration;
	size_t lineNumber = 0;
	std::string line;
	while(std::getline(stream, line))
	{
		++lineNumber;
		size_t hash = line.find('#');
		if(hash != line.npos)
			line = line.substr(0, hash);
		boost::algorithm::trim(line);
		if(line.empty())
			continue;

		std::istringstream lineStream(line);
		StationRecord record;
		std::string extra;
		lineStream >> record.position[0] >> record.position[1] >> record.position[2] >> record.diameter >> record.name;
		if(lineStream.fail() || (lineStream >> extra))
		{
			std::ostringstream msg;
			msg << sourceName << ':' << lineNumber << ": expected 'X Y Z Diam Name', got '" << line << "'";
			throw MalformedError(msg.str());
		}
		if(record.name.size() > MaxNameLength)
			record.name.resize(MaxNameLength);
		configuration._stations.push_back(record);
	}
	return configuration;
}

std::vector<std::string> ArrayConfiguration::Names() const
{
	std::vector<std::string> names;
	names.reserve(_stations.size());
	for(const StationRecord& station : _stations)
		names.push_back(station.name);
	return names;
}

size_t ArrayConfiguration::FindFirst(const std::string& name) const
{
	for(size_t i=0; i!=_stations.size(); ++i)
	{
		if(_stations[i].name == name)
			return i;
	}
	return NOT_FOUND;
}
