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

#ifndef VISSIM_VIS_TYPES_H
#define VISSIM_VIS_TYPES_H

#include <casacore/casa/aips.h>
#include <casacore/casa/BasicSL/Complex.h>
#include <casacore/scimath/Mathematics/RigidVector.h>

#include <ostream>

namespace vissim {

namespace simulation {

/// @brief visibility in the xx, yy, xy, yx order
typedef casacore::RigidVector<casacore::DComplex, 4> Visibility;

/// @brief zero visibility of the right length
Visibility zeroVisibility();

/// @brief position of the simulated sample in the output container
/// @details baseline-time row, spectral window and frequency channel
struct DestinationIndex {
   DestinationIndex() : blt(0), spw(0), chan(0) {}

   DestinationIndex(casacore::uInt inBlt, casacore::uInt inSpw, casacore::uInt inChan) :
        blt(inBlt), spw(inSpw), chan(inChan) {}

   casacore::uInt blt;
   casacore::uInt spw;
   casacore::uInt chan;

   /// @brief strict weak ordering, used as a map key
   bool operator<(const DestinationIndex &other) const;

   bool operator==(const DestinationIndex &other) const;
};

/// @brief output of the index for logging
std::ostream& operator<<(std::ostream &os, const DestinationIndex &index);

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_VIS_TYPES_H
