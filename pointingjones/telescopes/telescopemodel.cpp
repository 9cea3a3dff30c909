#include "telescopemodel.h"

#include "../errors.h"
#include "../parsetreader.h"

#include "../beam/dipoleelementresponse.h"
#include "../beam/hamakerelementresponse.h"

#include "../units/utctime.h"

#include <boost/algorithm/string/case_conv.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>

namespace {

const size_t maxChannelCount = 1 << 20;

size_t toCount(const std::string& key, double value)
{
	if(!std::isfinite(value) || value < 0.0 || value != std::floor(value) || value > double(std::numeric_limits<uint32_t>::max()))
	{
		std::ostringstream msg;
		msg << "Value of " << key << " should be a non-negative integer, but is " << value;
		throw DeserializeError(msg.str());
	}
	return size_t(value);
}

std::vector<double> readFrequencies(const ParsetReader& reader, const std::string& band)
{
	std::vector<double> frequencies;
	if(reader.IsDefined(band + ".frequencies"))
	{
		frequencies = reader.GetDoubleList(band + ".frequencies");
	}
	else {
		const double start = reader.GetDouble(band + ".freqstart");
		const double step = reader.GetDouble(band + ".freqstep");
		const size_t count = toCount(band + ".nchannels", reader.GetDouble(band + ".nchannels"));
		if(step <= 0.0)
			throw DeserializeError("Channel width of band " + band + " should be positive");
		if(count > maxChannelCount)
		{
			std::ostringstream msg;
			msg << "Band " << band << " has " << count << " channels, the maximum is " << maxChannelCount;
			throw DeserializeError(msg.str());
		}
		frequencies.resize(count);
		for(size_t ch=0; ch!=count; ++ch)
			frequencies[ch] = start + step * ch;
	}
	if(frequencies.empty())
		throw DeserializeError("Band " + band + " has no channels");
	for(size_t ch=1; ch<frequencies.size(); ++ch)
	{
		if(frequencies[ch] <= frequencies[ch-1])
			throw DeserializeError("Channel frequencies of band " + band + " are not strictly increasing");
	}
	return frequencies;
}

std::unique_ptr<ElementResponse> readElement(const ParsetReader& reader, const std::string& band)
{
	const std::string prefix = band + ".element.";
	std::string type = reader.GetString(prefix + "type");
	boost::to_lower(type);
	if(type == "hamaker")
	{
		const double centre = reader.GetDouble(prefix + "freqcentre");
		const double range = reader.GetDouble(prefix + "freqrange");
		const std::vector<double> shapeValues = reader.GetDoubleList(prefix + "shape");
		if(shapeValues.size() != 3)
			throw DeserializeError("Key " + prefix + "shape should list three dimensions");
		std::array<size_t, 3> shape;
		for(size_t i=0; i!=3; ++i)
			shape[i] = toCount(prefix + "shape", shapeValues[i]);
		const std::vector<double> values = reader.GetDoubleList(prefix + "coefficients");
		if(values.size() % 2 != 0)
			throw DeserializeError("Key " + prefix + "coefficients should hold real, imaginary pairs");
		std::vector<std::complex<double>> coefficients(values.size() / 2);
		for(size_t i=0; i!=coefficients.size(); ++i)
			coefficients[i] = std::complex<double>(values[i*2], values[i*2+1]);
		return std::unique_ptr<ElementResponse>(new HamakerElementResponse(centre, range, shape, std::move(coefficients)));
	}
	else if(type == "dipole")
	{
		return std::unique_ptr<ElementResponse>(new DipoleElementResponse(reader.GetDoubleOr(prefix + "orientation", 0.0)));
	}
	else
		throw DeserializeError("Unknown element response type '" + type + "' for band " + band);
}

std::unique_ptr<TelescopeModel> readModel(const ParsetReader& reader)
{
	std::unique_ptr<TelescopeModel> model(new TelescopeModel(reader.GetString("telescope"), reader.GetString("beammodel")));
	if(reader.IsDefined("epoch"))
		model->SetEpoch(UTCTime::Parse(reader.GetString("epoch")));
	const std::vector<std::string>& bands = reader.GetStringList("bands");
	if(bands.empty())
		throw DeserializeError("Telescope model does not define any bands");
	for(const std::string& band : bands)
	{
		std::vector<double> frequencies = readFrequencies(reader, band);
		std::unique_ptr<ElementResponse> element = readElement(reader, band);
		model->AddBand(band, std::unique_ptr<BandModel>(new BandModel(std::move(frequencies), std::move(element))));
	}
	return model;
}

}

std::unique_ptr<TelescopeModel> TelescopeModel::FromParset(const ParsetReader& reader)
{
	try {
		return readModel(reader);
	} catch(ParsetError& e)
	{
		throw DeserializeError(std::string("Invalid telescope model: ") + e.what());
	} catch(InvalidArgumentError& e)
	{
		throw DeserializeError(std::string("Invalid telescope model: ") + e.what());
	}
}

void TelescopeModel::AddBand(const std::string& name, std::unique_ptr<BandModel> band)
{
	if(!_bands.emplace(name, std::move(band)).second)
		throw DeserializeError("Band " + name + " is defined twice in telescope model");
}

const BandModel& TelescopeModel::Band(const std::string& name) const
{
	auto iter = _bands.find(name);
	if(iter == _bands.end())
	{
		std::ostringstream msg;
		msg << "Telescope model " << _telescopeName << '/' << _beamModelName << " has no band " << name << "; available bands:";
		for(const std::string& band : BandNames())
			msg << ' ' << band;
		throw InvalidArgumentError(msg.str());
	}
	return *iter->second;
}

std::vector<std::string> TelescopeModel::BandNames() const
{
	std::vector<std::string> names;
	for(const auto& band : _bands)
		names.push_back(band.first);
	return names;
}
