/// @file
///
/// @brief Interface to the antenna beam (voltage pattern) models
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

#include <vissim/beams/IBeam.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>

namespace vissim {

namespace simulation {

IBeam::~IBeam() {}

std::vector<IBeam::Jones> IBeam::evaluate(const casacore::Vector<double> &az, const casacore::Vector<double> &za,
                                          double freq) const
{
  if (az.nelements() != za.nelements()) {
      ASKAPTHROW(InvalidArgument, "Azimuth and zenith angle vectors should be of the same length, you have "<<
                 az.nelements()<<" and "<<za.nelements());
  }
  std::vector<Jones> result;
  result.reserve(az.nelements());
  for (casacore::uInt i = 0; i < az.nelements(); ++i) {
       result.push_back(evaluate(az[i], za[i], freq));
  }
  return result;
}

IBeam::Jones IBeam::diagonalJones(double value)
{
  Jones result(2, 2, casacore::DComplex(0., 0.));
  result(0, 0) = casacore::DComplex(value, 0.);
  result(1, 1) = casacore::DComplex(value, 0.);
  return result;
}

} // namespace simulation

} // namespace vissim
