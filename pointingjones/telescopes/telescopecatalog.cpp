#include "telescopecatalog.h"

#include "../errors.h"
#include "../parsetreader.h"

#include "../pointingjones/logger.h"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>

#include <algorithm>
#include <fstream>

std::string TelescopeCatalog::ModelPath(const std::string& telescope, const std::string& beamModel) const
{
	boost::filesystem::path path(_dataRoot);
	path /= telescope;
	path /= "data";
	path /= "teldat_" + telescope + "_" + beamModel + ".p";
	return path.string();
}

std::shared_ptr<const TelescopeModel> TelescopeCatalog::GetTelescopeModel(const std::string& telescope, const std::string& beamModel)
{
	const std::string filename = ModelPath(telescope, beamModel);
	if(!boost::filesystem::is_regular_file(filename))
		throw NotFoundError("No telescope model '" + beamModel + "' for telescope " + telescope + " (file '" + filename + "' not found)");
	std::ifstream file(filename);
	if(!file)
		throw NotFoundError("Could not open telescope model file '" + filename + "'");
	Logger::Debug << "Reading telescope model " << filename << '\n';

	std::shared_ptr<TelescopeModel> model;
	try {
		ParsetReader reader(file);
		model = TelescopeModel::FromParset(reader);
	} catch(ParsetError& e)
	{
		throw DeserializeError("Could not read telescope model '" + filename + "': " + e.what());
	}
	if(model->TelescopeName() != telescope || model->BeamModelName() != beamModel)
	{
		throw DeserializeError("Telescope model file '" + filename + "' holds model " +
			model->TelescopeName() + "/" + model->BeamModelName() + " instead of " + telescope + "/" + beamModel);
	}
	return model;
}

std::vector<std::string> TelescopeCatalog::ListTelescopes() const
{
	std::vector<std::string> telescopes;
	if(!boost::filesystem::is_directory(_dataRoot))
		return telescopes;
	for(boost::filesystem::directory_iterator iter(_dataRoot), end; iter != end; ++iter)
	{
		if(boost::filesystem::is_directory(iter->path()))
			telescopes.push_back(iter->path().filename().string());
	}
	std::sort(telescopes.begin(), telescopes.end());
	return telescopes;
}

std::vector<std::string> TelescopeCatalog::ListBeamModels(const std::string& telescope) const
{
	std::vector<std::string> models;
	boost::filesystem::path directory(_dataRoot);
	directory /= telescope;
	directory /= "data";
	if(!boost::filesystem::is_directory(directory))
		return models;
	const std::string prefix = "teldat_" + telescope + "_";
	for(boost::filesystem::directory_iterator iter(directory), end; iter != end; ++iter)
	{
		const boost::filesystem::path& file = iter->path();
		const std::string stem = file.stem().string();
		if(file.extension() == ".p" && boost::algorithm::starts_with(stem, prefix) && stem.size() > prefix.size())
			models.push_back(stem.substr(prefix.size()));
	}
	std::sort(models.begin(), models.end());
	return models;
}
