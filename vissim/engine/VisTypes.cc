/// @file
///
/// @brief Basic types shared by the simulation engine and the messages
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

#include <vissim/engine/VisTypes.h>

namespace vissim {

namespace simulation {

Visibility zeroVisibility()
{
  return Visibility(casacore::DComplex(0., 0.));
}

bool DestinationIndex::operator<(const DestinationIndex &other) const
{
  if (blt != other.blt) {
      return blt < other.blt;
  }
  if (spw != other.spw) {
      return spw < other.spw;
  }
  return chan < other.chan;
}

bool DestinationIndex::operator==(const DestinationIndex &other) const
{
  return blt == other.blt && spw == other.spw && chan == other.chan;
}

std::ostream& operator<<(std::ostream &os, const DestinationIndex &index)
{
  os<<"(row="<<index.blt<<", spw="<<index.spw<<", chan="<<index.chan<<")";
  return os;
}

} // namespace simulation

} // namespace vissim
