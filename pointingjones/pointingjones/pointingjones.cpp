#include "pointingjones.h"

#include "logger.h"

#include "../output/frequencyselector.h"
#include "../output/jonesformatter.h"

#include "../rime/pointingtracker.h"

#include "../telescopes/telescopecatalog.h"

#include "../units/utctime.h"

void PointingJones::Run(std::ostream& output)
{
	_settings.Validate();

	TelescopeCatalog catalog(_settings.dataDirectory);
	PointingTracker tracker(catalog);
	Logger::Debug << "Data directory: " << catalog.DataRoot() << '\n';
	Logger::Info << "Start time " << UTCTime::ToString(_settings.beginTime) << ", direction RA="
		<< _settings.direction.ra << " DEC=" << _settings.direction.dec << " (" << _settings.direction.frame << ")"
		<< (_settings.doParallacticRotation ? ", with" : ", without") << " parallactic rotation\n";

	TrackingResult result = tracker.Track(_settings.MakeTrackingRequest());
	const JonesGrid& grid = result.grid;

	size_t channel = 0;
	if(_settings.hasFrequency)
	{
		channel = FrequencySelector::Select(grid.Frequencies(), _settings.frequency);
		Logger::Debug << "Requested frequency " << _settings.frequency << " Hz is channel " << channel
			<< " (" << grid.Frequencies()[channel] << " Hz)\n";
	}

	JonesFormatter formatter(output, _settings.outputFormat);
	if(_settings.action == PointingJonesSettings::PlotAction)
	{
		Logger::Info << "Graphical output is not available, writing the plotted values instead.\n";
		formatter.WriteDiagnostics(result.diagnostics);
		output << '\n';
		if(_settings.hasFrequency)
			formatter.WritePower(grid, channel, _settings.frequency);
		else
			formatter.WritePower(grid);
	}
	else {
		if(_settings.hasFrequency)
			formatter.WriteChannel(grid, channel, _settings.frequency);
		else
			formatter.WriteAll(grid);
	}
	output.flush();
}
