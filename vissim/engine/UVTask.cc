/// @file
///
/// @brief Unit of work of the simulator
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

#include <vissim/engine/UVTask.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>

namespace vissim {

namespace simulation {

UVTask::UVTask(const Source::ShPtr &inSource, const casacore::MEpoch &inTime, double inFreq,
               const Baseline::ShPtr &inBaseline, const Telescope::ShPtr &inTelescope,
               const DestinationIndex &inDestination) :
     source(inSource), time(inTime), freq(inFreq), baseline(inBaseline), telescope(inTelescope),
     destination(inDestination)
{
  if (!source || !baseline || !telescope) {
      ASKAPTHROW(InvalidArgument, "Task requires source, baseline and telescope to be defined");
  }
  if (freq <= 0.) {
      ASKAPTHROW(InvalidArgument, "Task frequency should be positive, you have "<<freq);
  }
}

bool taskLess(const UVTask &first, const UVTask &second)
{
  if (first.destination.chan != second.destination.chan) {
      return first.destination.chan < second.destination.chan;
  }
  if (first.destination.blt != second.destination.blt) {
      return first.destination.blt < second.destination.blt;
  }
  ASKAPDEBUGASSERT(first.baseline && second.baseline);
  return *first.baseline < *second.baseline;
}

} // namespace simulation

} // namespace vissim
