#ifndef TELESCOPE_MODEL_H
#define TELESCOPE_MODEL_H

#include "../beam/elementresponse.h"

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

class ParsetReader;

/**
 * Channelization and element response of one band of a telescope.
 */
class BandModel
{
public:
	BandModel(std::vector<double>&& frequencies, std::unique_ptr<ElementResponse> element) :
		_frequencies(std::move(frequencies)),
		_element(std::move(element))
	{ }

	/** Channel frequencies in Hz, ascending. */
	const std::vector<double>& Frequencies() const { return _frequencies; }

	const ElementResponse& Element() const { return *_element; }

private:
	std::vector<double> _frequencies;
	std::unique_ptr<ElementResponse> _element;
};

/**
 * The beam model of a telescope, as stored in the telescope-model store
 * under a (telescope, beam model) name. Read by the @ref TelescopeCatalog.
 */
class TelescopeModel
{
public:
	TelescopeModel(const std::string& telescopeName, const std::string& beamModelName) :
		_telescopeName(telescopeName),
		_beamModelName(beamModelName),
		_hasEpoch(false)
	{ }

	TelescopeModel(const TelescopeModel&) = delete;
	TelescopeModel& operator=(const TelescopeModel&) = delete;

	/**
	 * Construct a model from the keys of a telescope-model parset.
	 * @throws DeserializeError if the keys do not form a valid model.
	 */
	static std::unique_ptr<TelescopeModel> FromParset(const ParsetReader& reader);

	const std::string& TelescopeName() const { return _telescopeName; }
	const std::string& BeamModelName() const { return _beamModelName; }

	/**
	 * The first time for which the model is valid, if the model has
	 * such a limit.
	 */
	bool HasEpoch() const { return _hasEpoch; }
	const boost::posix_time::ptime& Epoch() const { return _epoch; }
	void SetEpoch(const boost::posix_time::ptime& epoch)
	{
		_epoch = epoch;
		_hasEpoch = true;
	}

	void AddBand(const std::string& name, std::unique_ptr<BandModel> band);

	/**
	 * @throws InvalidArgumentError if the model does not have the band.
	 */
	const BandModel& Band(const std::string& name) const;

	bool HasBand(const std::string& name) const { return _bands.find(name) != _bands.end(); }

	std::vector<std::string> BandNames() const;

private:
	std::string _telescopeName, _beamModelName;
	bool _hasEpoch;
	boost::posix_time::ptime _epoch;
	std::map<std::string, std::unique_ptr<BandModel>> _bands;
};

#endif
