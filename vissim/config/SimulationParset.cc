/// @file
///
/// @brief Set up of the simulation from a parset
///
/// @copyright (c) 2024 CSIRO
/// Australia Telescope National Facility (ATNF)
/// Commonwealth Scientific and Industrial Research Organisation (CSIRO)
/// PO Box 76, Epping NSW 1710, Australia
/// atnf-enquiries@csiro.au
///
/// This file is part of the ASKAP software distribution.
///
/// The ASKAP software distribution is free software: you can redistribute it
/// and/or modify it under the terms of the GNU General Public License as
/// published by the Free Software Foundation; either version 2 of the License,
/// or (at your option) any later version.
///
/// This program is distributed in the hope that it will be useful,
/// but WITHOUT ANY WARRANTY; without even the implied warranty of
/// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
/// GNU General Public License for more details.
///
/// You should have received a copy of the GNU General Public License
/// along with this program; if not, write to the Free Software
/// Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307 USA
///

#include <vissim/askap_vissim.h>

#include <vissim/config/SimulationParset.h>
#include <vissim/sky/SourceSelection.h>
#include <vissim/beams/BeamFactory.h>
#include <vissim/coordinates/CoordinateUtils.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>
#include <askap/askap/AskapLogging.h>
#include <askap/askap/AskapUtil.h>

#include <casacore/measures/Measures/MDirection.h>
#include <casacore/measures/Measures/MCDirection.h>
#include <casacore/measures/Measures/MeasConvert.h>

#include <algorithm>

ASKAP_LOGGER(logger, ".config.simulationparset");

namespace vissim {

namespace simulation {

SimulationParset::SimulationParset(const LOFAR::ParameterSet &parset) : itsParset(parset) {}

Source::ShPtr SimulationParset::readSource(const std::string &name) const
{
  const LOFAR::ParameterSet subset = itsParset.makeSubset("sources." + name + ".");
  if (!subset.isDefined("direction")) {
      ASKAPTHROW(MissingParameter, "Direction of source "<<name<<" is not defined");
  }
  casacore::MDirection dir = askap::asMDirection(subset.getStringVector("direction"));
  if (dir.getRef().getType() != casacore::MDirection::ICRS) {
      ASKAPCHECK(dir.getRef().getType() == casacore::MDirection::J2000,
                 "Direction of source "<<name<<" should be given in J2000 or ICRS");
      dir = casacore::MDirection::Convert(dir, casacore::MDirection::ICRS)();
  }
  const casacore::Quantity ra(dir.getValue().getLong(), "rad");
  const casacore::Quantity dec(dir.getValue().getLat(), "rad");
  if (!subset.isDefined("frequency")) {
      ASKAPTHROW(MissingParameter, "Frequency of source "<<name<<" is not defined");
  }
  const casacore::Quantity freq = askap::asQuantity(subset.getString("frequency"));
  casacore::Vector<double> stokes(4, 0.);
  if (subset.isDefined("stokes")) {
      const std::vector<double> values = subset.getDoubleVector("stokes");
      if (values.size() != 4) {
          ASKAPTHROW(ConfigurationError, "Source "<<name<<": expect 4 Stokes parameters, you have "<<values.size());
      }
      for (size_t pol = 0; pol < 4; ++pol) {
           stokes[pol] = values[pol];
      }
  } else {
      stokes[0] = subset.getDouble("flux.i", 1.);
  }
  return Source::ShPtr(new Source(name, ra, dec, freq, stokes));
}

std::vector<Source::ShPtr> SimulationParset::sources() const
{
  const std::vector<std::string> names = itsParset.getStringVector("sources.names");
  std::vector<Source::ShPtr> result;
  result.reserve(names.size());
  for (std::vector<std::string>::const_iterator ci = names.begin(); ci != names.end(); ++ci) {
       result.push_back(readSource(*ci));
  }
  ASKAPLOG_INFO_STR(logger, "Read "<<result.size()<<" sources");

  SourceSelection selection;
  bool doSelect = false;
  if (itsParset.isDefined("sources.select.minflux")) {
      selection.setMinFlux(itsParset.getDouble("sources.select.minflux"));
      doSelect = true;
  }
  if (itsParset.isDefined("sources.select.maxflux")) {
      selection.setMaxFlux(itsParset.getDouble("sources.select.maxflux"));
      doSelect = true;
  }
  if (itsParset.getBool("sources.select.horizon", false)) {
      const casacore::MPosition location = askap::asMPosition(itsParset.getStringVector("antennas.location"));
      selection.setLatitude(geodeticLatitude(location));
      doSelect = true;
  }
  return doSelect ? selection.select(result) : result;
}

std::vector<IBeam::ShPtr> SimulationParset::beams() const
{
  std::vector<IBeam::ShPtr> result;
  if (!itsParset.isDefined("beams.names")) {
      ASKAPLOG_INFO_STR(logger, "No beams defined, all antennas will have uniform response");
      result.push_back(BeamFactory::make(std::string("analytic_uniform")));
      return result;
  }
  const std::vector<std::string> names = itsParset.getStringVector("beams.names");
  for (std::vector<std::string>::const_iterator ci = names.begin(); ci != names.end(); ++ci) {
       const LOFAR::ParameterSet subset = itsParset.makeSubset("beams." + *ci + ".");
       if (subset.isDefined("descriptor")) {
           result.push_back(BeamFactory::make(subset.getString("descriptor")));
       } else {
           result.push_back(BeamFactory::make(subset));
       }
       ASKAPLOG_INFO_STR(logger, "Beam "<<*ci<<" is of "<<result.back()->kind()<<" type");
  }
  return result;
}

TaskBuilder::BeamAssignment SimulationParset::beamAssignment() const
{
  TaskBuilder::BeamAssignment result;
  if (!itsParset.isDefined("beams.names")) {
      return result;
  }
  const std::vector<std::string> beamNames = itsParset.getStringVector("beams.names");
  const std::vector<std::string> antNames = itsParset.getStringVector("antennas.names");
  for (std::vector<std::string>::const_iterator ci = antNames.begin(); ci != antNames.end(); ++ci) {
       const std::string key = "beams.assignment." + *ci;
       if (itsParset.isDefined(key)) {
           const std::string beam = itsParset.getString(key);
           const std::vector<std::string>::const_iterator it = std::find(beamNames.begin(), beamNames.end(), beam);
           if (it == beamNames.end()) {
               ASKAPTHROW(ConfigurationError, "Antenna "<<*ci<<" is assigned to undefined beam "<<beam);
           }
           result[*ci] = int(it - beamNames.begin());
       }
  }
  return result;
}

InstrumentGeometry SimulationParset::geometry() const
{
  const std::string telescope = itsParset.getString("antennas.telescope", "vissim");
  const casacore::MPosition location = askap::asMPosition(itsParset.getStringVector("antennas.location"));
  InstrumentGeometry result(telescope, location);

  const std::vector<std::string> antNames = itsParset.getStringVector("antennas.names");
  std::vector<int> numbers;
  for (size_t ant = 0; ant < antNames.size(); ++ant) {
       const LOFAR::ParameterSet subset = itsParset.makeSubset("antennas." + antNames[ant] + ".");
       const int number = subset.getInt32("number", int(ant));
       const std::vector<double> enu = subset.getDoubleVector("enu");
       if (enu.size() != 3) {
           ASKAPTHROW(ConfigurationError, "Antenna "<<antNames[ant]<<": expect 3 elements in enu, you have "<<enu.size());
       }
       result.addAntenna(antNames[ant], number, casacore::Vector<double>(enu));
       numbers.push_back(number);
  }

  const bool autoCorrelations = itsParset.getBool("observation.autocorrelations", false);
  const std::string timeFrame = itsParset.getString("observation.timeframe", "UTC");
  const std::vector<std::string> times = itsParset.getStringVector("observation.times");
  for (std::vector<std::string>::const_iterator ci = times.begin(); ci != times.end(); ++ci) {
       std::vector<std::string> epochString(2);
       epochString[0] = *ci;
       epochString[1] = timeFrame;
       const casacore::MEpoch epoch = askap::asMEpoch(epochString);
       for (size_t ant1 = 0; ant1 < numbers.size(); ++ant1) {
            for (size_t ant2 = autoCorrelations ? ant1 : ant1 + 1; ant2 < numbers.size(); ++ant2) {
                 result.addRow(epoch, numbers[ant1], numbers[ant2]);
            }
       }
  }

  const std::vector<std::string> freqStrings = itsParset.getStringVector("observation.frequencies");
  casacore::Vector<double> freqs(freqStrings.size());
  for (size_t chan = 0; chan < freqStrings.size(); ++chan) {
       freqs[chan] = askap::asQuantity(freqStrings[chan], "Hz").getValue("Hz");
  }
  result.setFrequencies(freqs);
  result.check();
  ASKAPLOG_INFO_STR(logger, "Observation of "<<antNames.size()<<" antennas of "<<telescope<<" with "<<result.nRow()<<
                    " baseline-time rows and "<<result.nChan()<<" channels");
  return result;
}

std::string SimulationParset::executorMode() const
{
  const std::string mode = itsParset.getString("executor.mode", "serial");
  if (mode != "serial" && mode != "threads" && mode != "mpi") {
      ASKAPTHROW(ConfigurationError, "Unknown executor mode "<<mode<<", use serial, threads or mpi");
  }
  return mode;
}

int SimulationParset::nThreads() const
{
  const int nThreads = itsParset.getInt32("executor.nthreads", 1);
  if (nThreads < 1) {
      ASKAPTHROW(ConfigurationError, "Number of threads should be positive, you have "<<nThreads);
  }
  return nThreads;
}

} // namespace simulation

} // namespace vissim
