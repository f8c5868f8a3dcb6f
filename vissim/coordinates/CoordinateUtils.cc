/// @file
///
/// @brief Coordinate and polarisation frame utilities
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

#include <vissim/coordinates/CoordinateUtils.h>

#include <askap/askap/AskapError.h>

#include <casacore/casa/BasicSL/Constants.h>
#include <casacore/measures/Measures/MDirection.h>
#include <casacore/measures/Measures/MCDirection.h>
#include <casacore/measures/Measures/MCPosition.h>
#include <casacore/measures/Measures/MeasConvert.h>
#include <casacore/measures/Measures/MeasFrame.h>

#include <cmath>

namespace vissim {

namespace simulation {

HorizonPosition equatorialToHorizon(double ra, double dec, const casacore::MEpoch &epoch,
                                    const casacore::MPosition &location)
{
  casacore::MeasFrame frame(location, epoch);
  const casacore::MVDirection dir(ra, dec);
  const casacore::MVDirection azEl = casacore::MDirection::Convert(casacore::MDirection(dir, casacore::MDirection::ICRS),
         casacore::MDirection::Ref(casacore::MDirection::AZEL, frame))().getValue();
  HorizonPosition result;
  result.az = std::fmod(azEl.getLong(), casacore::C::_2pi);
  if (result.az < 0.) {
      result.az += casacore::C::_2pi;
  }
  result.za = casacore::C::pi_2 - azEl.getLat();
  return result;
}

ApparentPosition apparentHourAngleDec(double ra, double dec, const casacore::MEpoch &epoch,
                                      const casacore::MPosition &location)
{
  casacore::MeasFrame frame(location, epoch);
  const casacore::MVDirection dir(ra, dec);
  const casacore::MVDirection hadec = casacore::MDirection::Convert(casacore::MDirection(dir, casacore::MDirection::ICRS),
         casacore::MDirection::Ref(casacore::MDirection::HADEC, frame))().getValue();
  ApparentPosition result;
  result.ha = hadec.getLong();
  result.dec = hadec.getLat();
  return result;
}

double hourAngle(double ra, double dec, const casacore::MEpoch &epoch,
                 const casacore::MPosition &location)
{
  return apparentHourAngleDec(ra, dec, epoch, location).ha;
}

double geodeticLatitude(const casacore::MPosition &location)
{
  const casacore::MPosition wgs = casacore::MPosition::Convert(location, casacore::MPosition::WGS84)();
  return wgs.getAngle("rad").getValue()[1];
}

double geodeticLongitude(const casacore::MPosition &location)
{
  const casacore::MPosition wgs = casacore::MPosition::Convert(location, casacore::MPosition::WGS84)();
  return wgs.getAngle("rad").getValue()[0];
}

casacore::Matrix<double> parallacticRotation(double dec, double ha, double latitude)
{
  const double sinX = sin(ha);
  const double cosX = tan(latitude) * cos(dec) - sin(dec) * cos(ha);
  casacore::Matrix<double> rot(2, 2);
  rot(0, 0) = cosX;
  rot(0, 1) = sinX;
  rot(1, 0) = -sinX;
  rot(1, 1) = cosX;
  return rot;
}

casacore::Matrix<double> unitRotation()
{
  casacore::Matrix<double> rot(2, 2, 0.);
  rot.diagonal() = 1.;
  return rot;
}

casacore::Matrix<casacore::DComplex> rotateCoherency(const casacore::Matrix<casacore::DComplex> &coherency,
                                                     const casacore::Matrix<double> &rotation)
{
  ASKAPCHECK(coherency.nrow() == 2 && coherency.ncolumn() == 2, "Coherency matrix is expected to be 2x2, you have "<<
             coherency.shape());
  ASKAPCHECK(rotation.nrow() == 2 && rotation.ncolumn() == 2, "Rotation matrix is expected to be 2x2, you have "<<
             rotation.shape());
  casacore::Matrix<casacore::DComplex> result(2, 2, casacore::DComplex(0., 0.));
  // result(i,j) = sum_k,l R(k,i) C(k,l) R(l,j)
  for (casacore::uInt i = 0; i < 2; ++i) {
       for (casacore::uInt j = 0; j < 2; ++j) {
            for (casacore::uInt k = 0; k < 2; ++k) {
                 for (casacore::uInt l = 0; l < 2; ++l) {
                      result(i, j) += rotation(k, i) * coherency(k, l) * rotation(l, j);
                 }
            }
       }
  }
  return result;
}

} // namespace simulation

} // namespace vissim
