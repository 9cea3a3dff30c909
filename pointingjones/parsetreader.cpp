#include "parsetreader.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>

#include <boost/algorithm/string/trim.hpp>

#include <boost/tokenizer.hpp>

ParsetReader::ParsetReader(const std::string& filename)
{
	std::ifstream stream(filename);
	if(!stream)
		throw ParsetError("Could not open parset file '" + filename + "'");
	read(stream);
}

ParsetReader::ParsetReader(std::istream& stream)
{
	read(stream);
}

void ParsetReader::read(std::istream& stream)
{
	std::string pending;
	while(stream)
	{
		std::string line;
		std::getline(stream, line);
		if(stream)
		{
			size_t hash = line.find('#');
			if(hash != line.npos)
				line = line.substr(0, hash);
			boost::algorithm::trim(line);
			if(!pending.empty())
			{
				// Continuation of an unterminated list
				pending += ' ' + line;
				if(pending.find(']') != pending.npos)
				{
					ParsetEntry entry(pending);
					_entries.emplace(entry.Key(), std::move(entry));
					pending.clear();
				}
			}
			else if(!line.empty())
			{
				size_t eqsym = line.find('=');
				size_t open = line.find('[');
				if(eqsym != line.npos && open != line.npos && open > eqsym && line.find(']') == line.npos)
					pending = line;
				else {
					ParsetEntry entry(line);
					_entries.emplace(entry.Key(), std::move(entry));
				}
			}
		}
	}
	if(!pending.empty())
		throw ParsetError("Parset error: list is not terminated with ']' in line:\n" + pending);
}

ParsetReader::ParsetEntry::ParsetEntry(const std::string& line)
{
	size_t eqsym = line.find('=');
	if(eqsym == line.npos)
		throw ParsetError("Parset error: expecting equals sign ('=') in line:\n" + line);
	_key = line.substr(0, eqsym);
	boost::algorithm::trim(_key);
	if(_key.empty())
		throw ParsetError("Parset error: no key given before equals sign ('=')");
	std::string valStr = line.substr(eqsym+1);
	boost::algorithm::trim(valStr);
	if(valStr.empty() || valStr[0] != '[')
	{
		std::unique_ptr<StringValue> value(new StringValue());
		value->_value = valStr;
		_value = std::move(value);
	}
	else {
		// It's a list
		boost::char_separator<char> listSep("[,] ");
		boost::tokenizer<boost::char_separator<char>> listTokenizer(valStr, listSep);
		std::unique_ptr<StringListValue> value(new StringListValue());
		for(auto item : listTokenizer)
			value->_value.push_back(item);
		_value = std::move(value);
	}
}

const std::string& ParsetReader::ParsetEntry::GetStringValue() const {
	StringValue* value = dynamic_cast<StringValue*>(_value.get());
	if(value == nullptr)
		throw ParsetError("Value of key " + _key + " is not a string");
	else
		return value->_value;
}

const std::vector<std::string>& ParsetReader::ParsetEntry::GetStringListValue() const {
	StringListValue* value = dynamic_cast<StringListValue*>(_value.get());
	if(value == nullptr)
		throw ParsetError("Value of key " + _key + " is not a string list");
	else
		return value->_value;
}

const std::string& ParsetReader::GetString(const std::string& key) const
{
	auto iter = _entries.find(key);
	if(iter == _entries.end())
		throw ParsetError("Key not found: " + key);
	return iter->second.GetStringValue();
}

const std::vector<std::string>& ParsetReader::GetStringList(const std::string& key) const
{
	auto iter = _entries.find(key);
	if(iter == _entries.end())
		throw ParsetError("Key not found: " + key);
	return iter->second.GetStringListValue();
}

double ParsetReader::GetDouble(const std::string& key) const
{
	return toDouble(key, GetString(key));
}

double ParsetReader::GetDoubleOr(const std::string& key, double orValue) const
{
	auto iter = _entries.find(key);
	if(iter == _entries.end())
		return orValue;
	else
		return toDouble(key, iter->second.GetStringValue());
}

std::vector<double> ParsetReader::GetDoubleList(const std::string& key) const
{
	const std::vector<std::string>& strings = GetStringList(key);
	std::vector<double> values;
	values.reserve(strings.size());
	for(const std::string& str : strings)
		values.push_back(toDouble(key, str));
	return values;
}

double ParsetReader::toDouble(const std::string& key, const std::string& str)
{
	char* endptr;
	errno = 0;
	double v = strtod(str.c_str(), &endptr);
	if(*endptr!=0 || endptr == str.c_str() || errno!=0)
		throw ParsetError("Could not parse value '" + str + "' for key " + key + " as a number");
	return v;
}
