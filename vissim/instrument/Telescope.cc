/// @file
///
/// @brief Array-wide description: name, location and beam models
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

#include <vissim/instrument/Telescope.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>

namespace vissim {

namespace simulation {

Telescope::Telescope(const std::string &name, const casacore::MPosition &location,
                     const std::vector<IBeam::ShPtr> &beams) : itsName(name), itsLocation(location), itsBeams(beams)
{
  for (size_t i = 0; i < itsBeams.size(); ++i) {
       if (!itsBeams[i]) {
           ASKAPTHROW(ConfigurationError, "Beam "<<i<<" of telescope "<<name<<" is undefined");
       }
  }
}

IBeam& Telescope::beam(int beamId) const
{
  if (beamId < 0 || static_cast<size_t>(beamId) >= itsBeams.size()) {
      ASKAPTHROW(ConfigurationError, "Beam id "<<beamId<<" is outside the beam list of telescope "<<itsName<<
                 " with "<<itsBeams.size()<<" beams");
  }
  ASKAPDEBUGASSERT(itsBeams[beamId]);
  return *itsBeams[beamId];
}

} // namespace simulation

} // namespace vissim
