/// @file
///
/// @brief Set up of the simulation from a parset
/// @details Example (all keys relative to the prefix given to the application):
/// @code
/// sources.names = [src1]
/// sources.src1.direction = [12h30m00.00, -45.00.00.00, J2000]
/// sources.src1.frequency = 150MHz
/// sources.src1.stokes = [1.0, 0.0, 0.0, 0.0]
/// sources.select.minflux = 0.1
/// sources.select.horizon = true
/// beams.names = [dish]
/// beams.dish.type = airy
/// beams.dish.diameter = 14m
/// antennas.telescope = HERA
/// antennas.location = [21.4283deg, -30.7215deg, 1073m, WGS84]
/// antennas.names = [ant0, ant1]
/// antennas.ant0.number = 0
/// antennas.ant0.enu = [0.0, 0.0, 0.0]
/// antennas.ant1.number = 1
/// antennas.ant1.enu = [14.6, 0.0, 0.0]
/// observation.times = [2018/03/01/12:00:00, 2018/03/01/12:00:10]
/// observation.timeframe = UTC
/// observation.frequencies = [150MHz, 150.1MHz]
/// observation.autocorrelations = false
/// executor.mode = threads
/// executor.nthreads = 4
/// @endcode
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

#ifndef VISSIM_SIMULATION_PARSET_H
#define VISSIM_SIMULATION_PARSET_H

#include <vissim/sky/Source.h>
#include <vissim/beams/IBeam.h>
#include <vissim/engine/InstrumentGeometry.h>
#include <vissim/engine/TaskBuilder.h>

#include <Common/ParameterSet.h>

#include <string>
#include <vector>

namespace vissim {

namespace simulation {

/// @brief simulation inputs defined by a parset
class SimulationParset {
public:
   /// @brief set up from the parset
   /// @param[in] parset parameters, without application prefix
   explicit SimulationParset(const LOFAR::ParameterSet &parset);

   /// @brief sky model after the selection
   std::vector<Source::ShPtr> sources() const;

   /// @brief beam models in the order of beams.names
   std::vector<IBeam::ShPtr> beams() const;

   /// @brief beam index for the antennas listed in beams.assignment
   TaskBuilder::BeamAssignment beamAssignment() const;

   /// @brief layout, rows and frequency grid
   InstrumentGeometry geometry() const;

   /// @return executor mode: serial, threads or mpi
   std::string executorMode() const;

   /// @return number of threads for the threaded mode
   int nThreads() const;

private:
   /// @brief read a single source
   Source::ShPtr readSource(const std::string &name) const;

   LOFAR::ParameterSet itsParset;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_SIMULATION_PARSET_H
