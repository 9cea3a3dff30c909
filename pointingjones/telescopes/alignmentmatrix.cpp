#include "alignmentmatrix.h"

#include "../errors.h"

#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/tokenizer.hpp>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

std::string AlignmentMatrix::Path(const std::string& dataRoot, const std::string& telescope, const std::string& station, const std::string& band)
{
	boost::filesystem::path path(dataRoot);
	path /= telescope;
	path /= "share";
	path /= "alignment";
	path /= station + "_" + band + ".txt";
	return path.string();
}

AlignmentMatrix AlignmentMatrix::Read(const std::string& dataRoot, const std::string& telescope, const std::string& station, const std::string& band)
{
	const std::string filename = Path(dataRoot, telescope, station, band);
	if(!boost::filesystem::is_regular_file(filename))
		throw NotFoundError("Alignment file '" + filename + "' not found: no alignment for station " + station + ", band " + band);
	std::ifstream file(filename);
	if(!file)
		throw NotFoundError("Could not open alignment file '" + filename + "'");
	return Parse(file, filename);
}

AlignmentMatrix AlignmentMatrix::Parse(std::istream& stream, const std::string& sourceName)
{
	std::vector<double> values;
	size_t nRows = 0, nColumns = 0;
	size_t lineNumber = 0;
	std::string line;
	boost::char_separator<char> separator(" \t\r");
	while(std::getline(stream, line))
	{
		++lineNumber;
		size_t hash = line.find('#');
		if(hash != line.npos)
			line = line.substr(0, hash);
		boost::algorithm::trim(line);
		if(line.empty())
			continue;

		size_t columnsInRow = 0;
		boost::tokenizer<boost::char_separator<char>> tokens(line, separator);
		for(const std::string& token : tokens)
		{
			char* endptr;
			errno = 0;
			double value = strtod(token.c_str(), &endptr);
			if(*endptr != 0 || endptr == token.c_str() || errno != 0)
			{
				std::ostringstream msg;
				msg << sourceName << ':' << lineNumber << ": '" << token << "' is not a number";
				throw MalformedError(msg.str());
			}
			values.push_back(value);
			++columnsInRow;
		}
		if(nRows == 0)
			nColumns = columnsInRow;
		else if(columnsInRow != nColumns)
		{
			std::ostringstream msg;
			msg << sourceName << ':' << lineNumber << ": row has " << columnsInRow << " values, previous rows had " << nColumns;
			throw MalformedError(msg.str());
		}
		++nRows;
	}
	if(values.empty())
		throw MalformedError(sourceName + ": no values in alignment matrix");
	return AlignmentMatrix(nRows, nColumns, std::move(values));
}
