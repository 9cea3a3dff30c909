#ifndef TELESCOPE_CATALOG_H
#define TELESCOPE_CATALOG_H

#include "telescopemodel.h"

#include <memory>
#include <string>
#include <vector>

/**
 * Maps a (telescope, beam model) pair to the telescope model stored under
 * <dataRoot>/<telescope>/data/teldat_<telescope>_<beammodel>.p .
 *
 * The catalog does not cache: every call to @ref GetTelescopeModel() reads
 * and deserializes the file again. See @ref CachedTelescopeCatalog.
 */
class TelescopeCatalog
{
public:
	explicit TelescopeCatalog(const std::string& dataRoot) : _dataRoot(dataRoot) { }

	virtual ~TelescopeCatalog() { }

	/**
	 * @throws NotFoundError if no model is stored for the pair.
	 * @throws DeserializeError if the stored model can not be read.
	 */
	virtual std::shared_ptr<const TelescopeModel> GetTelescopeModel(const std::string& telescope, const std::string& beamModel);

	std::string ModelPath(const std::string& telescope, const std::string& beamModel) const;

	/** Telescopes in the data root, sorted. */
	std::vector<std::string> ListTelescopes() const;

	/** Beam models stored for the telescope, sorted. */
	std::vector<std::string> ListBeamModels(const std::string& telescope) const;

	const std::string& DataRoot() const { return _dataRoot; }

private:
	std::string _dataRoot;
};

#endif
