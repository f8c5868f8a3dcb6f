/// @file
///
/// @brief Airy disk beam model
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

#include <vissim/beams/AiryBeam.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>

#include <casacore/casa/BasicSL/Constants.h>

#include <gsl/gsl_errno.h>
#include <gsl/gsl_sf_bessel.h>

#include <cmath>

namespace vissim {

namespace simulation {

// increment the number when format changes
#define VISSIM_AIRY_BEAM_STREAM_VERSION 1

AiryBeam::AiryBeam() {}

AiryBeam::AiryBeam(const boost::optional<double> &diameter) : itsDiameter(diameter)
{
  if (!itsDiameter) {
      ASKAPTHROW(MissingParameter, "Dish diameter has to be set for the airy beam");
  }
  if (*itsDiameter <= 0.) {
      ASKAPTHROW(InvalidArgument, "Dish diameter should be positive, you have "<<*itsDiameter);
  }
}

double AiryBeam::diameter() const
{
  if (!itsDiameter) {
      ASKAPTHROW(MissingParameter, "Dish diameter has to be set for the airy beam");
  }
  return *itsDiameter;
}

double AiryBeam::airy(double x)
{
  if (x == 0.) {
      return 1.;
  }
  gsl_sf_result res;
  const int status = gsl_sf_bessel_J1_e(x, &res);
  ASKAPCHECK(status == GSL_SUCCESS, "Error in calculation of Bessel function for x="<<x<<", status="<<status);
  return 2. * res.val / x;
}

IBeam::Jones AiryBeam::evaluate(double, double za, double freq) const
{
  const double x = diameter() / 2. * sin(za) * casacore::C::_2pi * freq / casacore::C::c;
  return diagonalJones(airy(x));
}

bool AiryBeam::isPeakNormalised() const
{
  return true;
}

void AiryBeam::peakNormalise() {}

IBeam::ShPtr AiryBeam::clone() const
{
  return IBeam::ShPtr(new AiryBeam(*this));
}

std::string AiryBeam::kind() const
{
  return "airy";
}

void AiryBeam::writeToBlob(LOFAR::BlobOStream& os) const
{
  os.putStart("AiryBeam", VISSIM_AIRY_BEAM_STREAM_VERSION);
  os << diameter();
  os.putEnd();
}

void AiryBeam::readFromBlob(LOFAR::BlobIStream& is)
{
  const int version = is.getStart("AiryBeam");
  ASKAPCHECK(version == VISSIM_AIRY_BEAM_STREAM_VERSION,
       "Attempting to read from a blob stream an object of the wrong version, expected "<<VISSIM_AIRY_BEAM_STREAM_VERSION<<
       " got "<<version);
  double diameterBuf = 0.;
  is >> diameterBuf;
  is.getEnd();
  itsDiameter = diameterBuf;
}

} // namespace simulation

} // namespace vissim
