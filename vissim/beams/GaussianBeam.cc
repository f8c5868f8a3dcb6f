/// @file
///
/// @brief Gaussian beam model
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

#include <vissim/beams/GaussianBeam.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>

#include <casacore/casa/BasicSL/Constants.h>

#include <cmath>

namespace vissim {

namespace simulation {

// increment the number when format changes
#define VISSIM_GAUSSIAN_BEAM_STREAM_VERSION 1

GaussianBeam::GaussianBeam() {}

GaussianBeam::GaussianBeam(const boost::optional<double> &sigma, const boost::optional<double> &diameter) :
     itsSigma(sigma), itsDiameter(diameter)
{
  if (!itsSigma && !itsDiameter) {
      ASKAPTHROW(MissingParameter, "Either sigma or diameter has to be set for the gaussian beam");
  }
  if (itsSigma && *itsSigma <= 0.) {
      ASKAPTHROW(InvalidArgument, "Gaussian beam width should be positive, you have "<<*itsSigma);
  }
  if (itsDiameter && *itsDiameter <= 0.) {
      ASKAPTHROW(InvalidArgument, "Dish diameter should be positive, you have "<<*itsDiameter);
  }
}

double GaussianBeam::diameterToSigma(double diameter, double freq)
{
  ASKAPCHECK(freq > 0., "Frequency should be positive, you have "<<freq);
  const double wavelength = casacore::C::c / freq;
  // first null of the Airy pattern matched to a gaussian of the same FWHM
  const double arg = 2.2150894 * wavelength / (casacore::C::pi * diameter);
  if (arg > 1.) {
      ASKAPTHROW(InvalidArgument, "Dish diameter of "<<diameter<<" m is too small for the frequency of "<<freq<<" Hz");
  }
  return asin(arg) * 2. / 2.355;
}

double GaussianBeam::sigma(double freq) const
{
  if (itsDiameter) {
      return diameterToSigma(*itsDiameter, freq);
  }
  if (itsSigma) {
      return *itsSigma;
  }
  ASKAPTHROW(MissingParameter, "Either sigma or diameter has to be set for the gaussian beam");
}

IBeam::Jones GaussianBeam::evaluate(double, double za, double freq) const
{
  const double width = sigma(freq);
  return diagonalJones(exp(-za * za / (2. * width * width)));
}

bool GaussianBeam::isPeakNormalised() const
{
  return true;
}

void GaussianBeam::peakNormalise() {}

IBeam::ShPtr GaussianBeam::clone() const
{
  return IBeam::ShPtr(new GaussianBeam(*this));
}

std::string GaussianBeam::kind() const
{
  return "gaussian";
}

void GaussianBeam::writeToBlob(LOFAR::BlobOStream& os) const
{
  os.putStart("GaussianBeam", VISSIM_GAUSSIAN_BEAM_STREAM_VERSION);
  os << bool(itsSigma) << (itsSigma ? *itsSigma : 0.) << bool(itsDiameter) << (itsDiameter ? *itsDiameter : 0.);
  os.putEnd();
}

void GaussianBeam::readFromBlob(LOFAR::BlobIStream& is)
{
  const int version = is.getStart("GaussianBeam");
  ASKAPCHECK(version == VISSIM_GAUSSIAN_BEAM_STREAM_VERSION,
       "Attempting to read from a blob stream an object of the wrong version, expected "<<VISSIM_GAUSSIAN_BEAM_STREAM_VERSION<<
       " got "<<version);
  bool hasSigma = false;
  bool hasDiameter = false;
  double sigmaBuf = 0.;
  double diameterBuf = 0.;
  is >> hasSigma >> sigmaBuf >> hasDiameter >> diameterBuf;
  is.getEnd();
  itsSigma.reset();
  itsDiameter.reset();
  if (hasSigma) {
      itsSigma = sigmaBuf;
  }
  if (hasDiameter) {
      itsDiameter = diameterBuf;
  }
}

} // namespace simulation

} // namespace vissim
