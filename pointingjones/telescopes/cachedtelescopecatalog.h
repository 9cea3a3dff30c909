#ifndef CACHED_TELESCOPE_CATALOG_H
#define CACHED_TELESCOPE_CATALOG_H

#include "telescopecatalog.h"

#include <map>
#include <utility>

/**
 * A telescope catalog that keeps every model it has read, keyed by
 * (telescope, beam model). Entries are never invalidated: when the files
 * on disk change, the owner has to call @ref Clear().
 *
 * Meant for callers that compute many grids in one process; a single run
 * of the command line tool uses the plain @ref TelescopeCatalog.
 */
class CachedTelescopeCatalog : public TelescopeCatalog
{
public:
	explicit CachedTelescopeCatalog(const std::string& dataRoot) : TelescopeCatalog(dataRoot) { }

	CachedTelescopeCatalog(const CachedTelescopeCatalog&) = delete;
	CachedTelescopeCatalog& operator=(const CachedTelescopeCatalog&) = delete;

	std::shared_ptr<const TelescopeModel> GetTelescopeModel(const std::string& telescope, const std::string& beamModel) final override
	{
		const Key key(telescope, beamModel);
		auto iter = _models.find(key);
		if(iter == _models.end())
		{
			// Failures are not cached, so a failing lookup is retried next time
			std::shared_ptr<const TelescopeModel> model = TelescopeCatalog::GetTelescopeModel(telescope, beamModel);
			iter = _models.emplace(key, model).first;
		}
		return iter->second;
	}

	bool Contains(const std::string& telescope, const std::string& beamModel) const
	{
		return _models.find(Key(telescope, beamModel)) != _models.end();
	}

	size_t Size() const { return _models.size(); }

	void Clear() { _models.clear(); }

private:
	typedef std::pair<std::string, std::string> Key;
	std::map<Key, std::shared_ptr<const TelescopeModel>> _models;
};

#endif
