/// @file
///
/// @brief Unit of work of the simulator
/// @details A task describes the contribution of one source to one sample:
/// one baseline at one time and one frequency. Sources, baselines and the
/// telescope are shared between tasks.
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

#ifndef VISSIM_UV_TASK_H
#define VISSIM_UV_TASK_H

#include <vissim/engine/VisTypes.h>
#include <vissim/sky/Source.h>
#include <vissim/instrument/Baseline.h>
#include <vissim/instrument/Telescope.h>

#include <casacore/measures/Measures/MEpoch.h>

#include <boost/optional.hpp>

namespace vissim {

namespace simulation {

/// @brief simulation task
struct UVTask {
   /// @brief construct the task
   /// @param[in] inSource sky source
   /// @param[in] inTime time of the sample
   /// @param[in] inFreq frequency in Hz
   /// @param[in] inBaseline baseline
   /// @param[in] inTelescope telescope (location and beams)
   /// @param[in] inDestination position of the sample in the output
   UVTask(const Source::ShPtr &inSource, const casacore::MEpoch &inTime, double inFreq,
          const Baseline::ShPtr &inBaseline, const Telescope::ShPtr &inTelescope,
          const DestinationIndex &inDestination);

   Source::ShPtr source;
   casacore::MEpoch time;
   double freq;
   Baseline::ShPtr baseline;
   Telescope::ShPtr telescope;
   DestinationIndex destination;

   /// @brief result, empty until the task has been computed
   boost::optional<Visibility> visibility;
};

/// @brief ordering of tasks
/// @details by frequency channel, then by baseline-time row, then by baseline
bool taskLess(const UVTask &first, const UVTask &second);

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_UV_TASK_H
