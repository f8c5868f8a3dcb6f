/// @file
///
/// @brief Expansion of the observation into simulation tasks
/// @details One task is created for every combination of baseline-time
/// row, frequency channel and source. Tasks are emitted channel by channel,
/// rows within a channel and sources within a row, so the order is
/// reproducible.
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

#ifndef VISSIM_TASK_BUILDER_H
#define VISSIM_TASK_BUILDER_H

#include <vissim/engine/UVTask.h>
#include <vissim/engine/InstrumentGeometry.h>
#include <vissim/beams/IBeam.h>
#include <vissim/sky/Source.h>

#include <map>
#include <string>
#include <vector>

namespace vissim {

namespace simulation {

/// @brief builder of the task list
class TaskBuilder {
public:
   /// @brief antenna name to beam index
   typedef std::map<std::string, int> BeamAssignment;

   /// @brief build all tasks of the observation
   /// @details If more than one beam is given, every antenna has to be present in the
   /// beam assignment. With a single beam and no assignment all antennas use beam 0.
   /// ConfigurationError is thrown on inconsistent input.
   /// @param[in] geometry layout and sampling of the observation
   /// @param[in] sources sky model
   /// @param[in] beams beam models
   /// @param[in] assignment beam index for each antenna name
   /// @return task list
   static std::vector<UVTask> buildTasks(const InstrumentGeometry &geometry, const std::vector<Source::ShPtr> &sources,
                                         const std::vector<IBeam::ShPtr> &beams,
                                         const BeamAssignment &assignment = BeamAssignment());
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_TASK_BUILDER_H
