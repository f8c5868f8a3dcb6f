/// @file
///
/// @brief Buffer for the simulated visibilities
/// @details One cube per spectral window, indexed by baseline-time row,
/// channel and correlation (xx, yy, xy, yx). The buffer is zeroed on
/// construction and contributions are summed into it.
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

#ifndef VISSIM_VISIBILITY_CONTAINER_H
#define VISSIM_VISIBILITY_CONTAINER_H

#include <vissim/engine/VisTypes.h>
#include <vissim/engine/InstrumentGeometry.h>

#include <casacore/casa/Arrays/Cube.h>

#include <vector>

namespace vissim {

namespace simulation {

/// @brief visibility buffer
class VisibilityContainer {
public:
   /// @brief construct zero buffer
   /// @param[in] nRow number of baseline-time rows
   /// @param[in] nSpw number of spectral windows
   /// @param[in] nChan number of channels per spectral window
   VisibilityContainer(casacore::uInt nRow, casacore::uInt nSpw, casacore::uInt nChan);

   /// @brief construct zero buffer matching the geometry
   static VisibilityContainer fromGeometry(const InstrumentGeometry &geometry);

   casacore::uInt nRow() const { return itsNRow; }

   casacore::uInt nSpw() const { return casacore::uInt(itsData.size()); }

   casacore::uInt nChan() const { return itsNChan; }

   /// @brief add contribution to the sample
   /// @param[in] index position of the sample
   /// @param[in] vis visibility to add
   void add(const DestinationIndex &index, const Visibility &vis);

   /// @brief access to a single sample
   Visibility visibility(const DestinationIndex &index) const;

   /// @brief data of the spectral window
   /// @return cube of shape (nRow, nChan, 4)
   const casacore::Cube<casacore::DComplex>& data(casacore::uInt spw) const;

private:
   /// @brief throw if the index is outside the buffer
   void checkIndex(const DestinationIndex &index) const;

   casacore::uInt itsNRow;
   casacore::uInt itsNChan;
   std::vector<casacore::Cube<casacore::DComplex> > itsData;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_VISIBILITY_CONTAINER_H
