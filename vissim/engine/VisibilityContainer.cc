/// @file
///
/// @brief Buffer for the simulated visibilities
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

#include <vissim/engine/VisibilityContainer.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>

namespace vissim {

namespace simulation {

VisibilityContainer::VisibilityContainer(casacore::uInt nRow, casacore::uInt nSpw, casacore::uInt nChan) :
     itsNRow(nRow), itsNChan(nChan)
{
  ASKAPCHECK(nSpw > 0, "At least one spectral window is required");
  for (casacore::uInt spw = 0; spw < nSpw; ++spw) {
       itsData.push_back(casacore::Cube<casacore::DComplex>(nRow, nChan, 4, casacore::DComplex(0., 0.)));
  }
}

VisibilityContainer VisibilityContainer::fromGeometry(const InstrumentGeometry &geometry)
{
  return VisibilityContainer(geometry.nRow(), geometry.nSpw(), geometry.nChan());
}

void VisibilityContainer::checkIndex(const DestinationIndex &index) const
{
  if (index.blt >= itsNRow || index.spw >= itsData.size() || index.chan >= itsNChan) {
      ASKAPTHROW(InvalidArgument, "Index "<<index<<" is outside the visibility buffer of "<<itsNRow<<
                 " rows, "<<itsData.size()<<" spectral windows and "<<itsNChan<<" channels");
  }
}

void VisibilityContainer::add(const DestinationIndex &index, const Visibility &vis)
{
  checkIndex(index);
  casacore::Cube<casacore::DComplex> &cube = itsData[index.spw];
  for (casacore::uInt pol = 0; pol < 4; ++pol) {
       cube(index.blt, index.chan, pol) += vis(pol);
  }
}

Visibility VisibilityContainer::visibility(const DestinationIndex &index) const
{
  checkIndex(index);
  const casacore::Cube<casacore::DComplex> &cube = itsData[index.spw];
  Visibility result;
  for (casacore::uInt pol = 0; pol < 4; ++pol) {
       result(pol) = cube(index.blt, index.chan, pol);
  }
  return result;
}

const casacore::Cube<casacore::DComplex>& VisibilityContainer::data(casacore::uInt spw) const
{
  ASKAPCHECK(spw < itsData.size(), "Spectral window "<<spw<<" doesn't exist");
  return itsData[spw];
}

} // namespace simulation

} // namespace vissim
