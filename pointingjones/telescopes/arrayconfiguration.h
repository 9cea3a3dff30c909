#ifndef ARRAY_CONFIGURATION_H
#define ARRAY_CONFIGURATION_H

#include <array>
#include <istream>
#include <string>
#include <vector>

struct StationRecord
{
	std::string name;
	// ITRF, in metres
	std::array<double, 3> position;
	double diameter;
};

/**
 * The station layout of one band of a telescope, as stored in a CASA array
 * configuration file. Each line of such a file holds "X Y Z Diam Name", with
 * names of at most five characters; longer names are truncated.
 */
class ArrayConfiguration
{
public:
	static const size_t MaxNameLength;

	/**
	 * Read the file <dataRoot>/<telescope>/share/simmos/<telescope>_<band>.cfg.
	 * @throws NotFoundError when the file does not exist.
	 * @throws MalformedError when a line is not a valid row.
	 */
	static ArrayConfiguration Read(const std::string& dataRoot, const std::string& telescope, const std::string& band);

	static std::string Path(const std::string& dataRoot, const std::string& telescope, const std::string& band);

	/**
	 * Parse a configuration from a stream. The source name is only used
	 * in error messages.
	 */
	static ArrayConfiguration Parse(std::istream& stream, const std::string& sourceName);

	size_t StationCount() const { return _stations.size(); }

	const StationRecord& operator[](size_t index) const { return _stations[index]; }

	const std::vector<StationRecord>& Stations() const { return _stations; }

	/** All names in file order. Duplicates are kept. */
	std::vector<std::string> Names() const;

	static const size_t NOT_FOUND;

	/**
	 * Index of the first station with the given name, or @ref NOT_FOUND.
	 * Stations listed again later in the file are never returned.
	 */
	size_t FindFirst(const std::string& name) const;

private:
	std::vector<StationRecord> _stations;
};

#endif
