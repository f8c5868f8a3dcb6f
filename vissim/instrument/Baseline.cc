/// @file
///
/// @brief Ordered pair of antennas
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

#include <vissim/instrument/Baseline.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>

#include <cmath>

namespace vissim {

namespace simulation {

Baseline::Baseline(const Antenna::ShPtr &ant1, const Antenna::ShPtr &ant2) :
     itsAntenna1(ant1), itsAntenna2(ant2), itsUVW(3, 0.)
{
  if (!ant1 || !ant2) {
      ASKAPTHROW(InvalidArgument, "Baseline requires two defined antennas");
  }
  for (casacore::uInt dim = 0; dim < 3; ++dim) {
       itsUVW[dim] = ant2->positionENU()[dim] - ant1->positionENU()[dim];
  }
}

bool Baseline::operator==(const Baseline &other) const
{
  if (itsAntenna1->name() != other.itsAntenna1->name() || itsAntenna2->name() != other.itsAntenna2->name() ||
      itsAntenna1->number() != other.itsAntenna1->number() || itsAntenna2->number() != other.itsAntenna2->number()) {
      return false;
  }
  for (casacore::uInt dim = 0; dim < 3; ++dim) {
       if (std::abs(itsUVW[dim] - other.itsUVW[dim]) > 1e-3) {
           return false;
       }
  }
  return true;
}

bool Baseline::operator<(const Baseline &other) const
{
  if (itsAntenna1->number() != other.itsAntenna1->number()) {
      return itsAntenna1->number() < other.itsAntenna1->number();
  }
  return itsAntenna2->number() < other.itsAntenna2->number();
}

} // namespace simulation

} // namespace vissim
