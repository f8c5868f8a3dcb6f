/// @file
///
/// @brief Expansion of the observation into simulation tasks
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

#include <vissim/engine/TaskBuilder.h>
#include <vissim/instrument/Antenna.h>
#include <vissim/instrument/Baseline.h>
#include <vissim/instrument/Telescope.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>
#include <askap/askap/AskapLogging.h>

#include <utility>

ASKAP_LOGGER(logger, ".engine.taskbuilder");

namespace vissim {

namespace simulation {

std::vector<UVTask> TaskBuilder::buildTasks(const InstrumentGeometry &geometry, const std::vector<Source::ShPtr> &sources,
                                            const std::vector<IBeam::ShPtr> &beams, const BeamAssignment &assignment)
{
  geometry.check();
  if (sources.size() == 0) {
      ASKAPTHROW(ConfigurationError, "Sky model is empty, nothing to simulate");
  }
  for (size_t i = 0; i < sources.size(); ++i) {
       if (!sources[i]) {
           ASKAPTHROW(ConfigurationError, "Source "<<i<<" of the sky model is undefined");
       }
  }
  if (beams.size() == 0) {
      ASKAPTHROW(ConfigurationError, "At least one beam model is required");
  }
  if (beams.size() > 1 && assignment.size() == 0) {
      ASKAPTHROW(ConfigurationError, "Beam assignment is required if more than one beam is given, you have "<<
                 beams.size()<<" beams");
  }

  const Telescope::ShPtr telescope(new Telescope(geometry.telescopeName(), geometry.location(), beams));

  // antennas by number
  std::map<int, Antenna::ShPtr> antennas;
  const std::vector<AntennaRecord> &layout = geometry.antennas();
  for (std::vector<AntennaRecord>::const_iterator ci = layout.begin(); ci != layout.end(); ++ci) {
       int beamId = 0;
       if (assignment.size() > 0) {
           const BeamAssignment::const_iterator it = assignment.find(ci->name);
           if (it == assignment.end()) {
               ASKAPTHROW(ConfigurationError, "Antenna "<<ci->name<<" is missing in the beam assignment");
           }
           beamId = it->second;
       }
       if (beamId < 0 || static_cast<size_t>(beamId) >= beams.size()) {
           ASKAPTHROW(ConfigurationError, "Antenna "<<ci->name<<" is assigned to beam "<<beamId<<
                      " which is outside the list of "<<beams.size()<<" beams");
       }
       antennas[ci->number] = Antenna::ShPtr(new Antenna(ci->name, ci->number, ci->enu, beamId));
  }

  // one baseline object per antenna pair
  std::map<std::pair<int, int>, Baseline::ShPtr> baselines;
  std::vector<Baseline::ShPtr> rowBaselines(geometry.nRow());
  for (casacore::uInt row = 0; row < geometry.nRow(); ++row) {
       const std::pair<int, int> key(geometry.antenna1(row), geometry.antenna2(row));
       std::map<std::pair<int, int>, Baseline::ShPtr>::const_iterator it = baselines.find(key);
       if (it == baselines.end()) {
           const Baseline::ShPtr bl(new Baseline(antennas[key.first], antennas[key.second]));
           it = baselines.insert(std::make_pair(key, bl)).first;
       }
       rowBaselines[row] = it->second;
  }

  const casacore::Vector<double> &freqs = geometry.frequencies();
  std::vector<UVTask> tasks;
  tasks.reserve(size_t(freqs.nelements()) * geometry.nRow() * sources.size());
  for (casacore::uInt chan = 0; chan < freqs.nelements(); ++chan) {
       for (casacore::uInt row = 0; row < geometry.nRow(); ++row) {
            const DestinationIndex dest(row, 0, chan);
            for (std::vector<Source::ShPtr>::const_iterator ci = sources.begin(); ci != sources.end(); ++ci) {
                 tasks.push_back(UVTask(*ci, geometry.time(row), freqs[chan], rowBaselines[row], telescope, dest));
            }
       }
  }
  ASKAPLOG_INFO_STR(logger, "Built "<<tasks.size()<<" tasks for "<<sources.size()<<" sources, "<<geometry.nRow()<<
                    " baseline-time rows and "<<freqs.nelements()<<" channels");
  return tasks;
}

} // namespace simulation

} // namespace vissim
