/// @file
///
/// @brief Single antenna of the array
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

#include <vissim/instrument/Antenna.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>

#include <casacore/casa/Arrays/ArrayLogical.h>

namespace vissim {

namespace simulation {

Antenna::Antenna(const std::string &name, int number, const casacore::Vector<double> &enu, int beamId) :
     itsName(name), itsNumber(number), itsENU(enu.copy()), itsBeamId(beamId)
{
  if (enu.nelements() != 3) {
      ASKAPTHROW(InvalidArgument, "Antenna "<<name<<": position should have 3 elements, you have "<<enu.nelements());
  }
  if (beamId < 0) {
      ASKAPTHROW(InvalidArgument, "Antenna "<<name<<": beam id should be non-negative, you have "<<beamId);
  }
}

IBeam::Jones Antenna::beamJones(const Telescope &telescope, double az, double za, double freq) const
{
  IBeam &beam = telescope.beam(itsBeamId);
  if (!beam.isPeakNormalised()) {
      beam.peakNormalise();
  }
  return beam.evaluate(az, za, freq);
}

bool Antenna::operator==(const Antenna &other) const
{
  return itsName == other.itsName && itsNumber == other.itsNumber && itsBeamId == other.itsBeamId &&
         casacore::allEQ(itsENU, other.itsENU);
}

} // namespace simulation

} // namespace vissim
