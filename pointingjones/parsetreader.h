#ifndef PARSET_READER_H
#define PARSET_READER_H

#include <istream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

class ParsetError : public std::runtime_error
{
public:
	explicit ParsetError(const std::string& message) : std::runtime_error(message) { }
};

/**
 * Reads files of "key = value" lines. A value that starts with '[' is a
 * list, which may continue over several lines until the closing ']'.
 * Everything after a '#' is a comment.
 */
class ParsetReader
{
public:
	explicit ParsetReader(const std::string& filename);
	explicit ParsetReader(std::istream& stream);

	class ParsetEntry
	{
	public:
		ParsetEntry(ParsetEntry&& source) = default;
		enum Type { String, StringList };
		explicit ParsetEntry(const std::string& line);
		bool operator<(const ParsetEntry& rhs) const
		{
			return _key < rhs._key;
		}
		const std::string& Key() const { return _key; }
		const std::string& GetStringValue() const;
		const std::vector<std::string>& GetStringListValue() const;
	private:
		struct Value { virtual ~Value() { } };
		struct StringValue : public Value { std::string _value; } ;
		struct StringListValue : public Value { std::vector<std::string> _value; } ;

		std::string _key;
		std::unique_ptr<Value> _value;
	};

	bool IsDefined(const std::string& key) const
	{
		return _entries.find(key) != _entries.end();
	}

	const std::string& GetString(const std::string& key) const;
	const std::vector<std::string>& GetStringList(const std::string& key) const;
	double GetDouble(const std::string& key) const;
	double GetDoubleOr(const std::string& key, double orValue) const;
	std::vector<double> GetDoubleList(const std::string& key) const;

private:
	void read(std::istream& stream);
	static double toDouble(const std::string& key, const std::string& str);

	std::map<std::string, ParsetEntry> _entries;
};

#endif
