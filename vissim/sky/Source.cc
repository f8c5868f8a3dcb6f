/// @file
///
/// @brief A point source of the sky model
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

#include <vissim/sky/Source.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>

#include <casacore/casa/BasicSL/Constants.h>
#include <casacore/casa/Arrays/ArrayLogical.h>

#include <cmath>

namespace vissim {

namespace simulation {

// increment the number when format changes
#define VISSIM_SOURCE_STREAM_VERSION 1

Source::Source() : itsRA(0.), itsDec(0.), itsFrequency(0.), itsStokes(4, 0.),
     itsCacheValid(false), itsCacheTime(0.), itsCacheTimeRef(0), itsCacheLocationRef(0)
{
  itsHorizon.az = 0.;
  itsHorizon.za = 0.;
  computeCoherency();
}

Source::Source(const std::string &name, const casacore::Quantity &ra, const casacore::Quantity &dec,
               const casacore::Quantity &freq, const casacore::Vector<double> &stokes) :
     itsName(name), itsRA(0.), itsDec(0.), itsFrequency(0.), itsStokes(stokes.copy()),
     itsCacheValid(false), itsCacheTime(0.), itsCacheTimeRef(0), itsCacheLocationRef(0)
{
  if (!ra.isConform("rad") || !dec.isConform("rad")) {
      ASKAPTHROW(InvalidArgument, "Source "<<name<<": ra and dec must be angles, you have "<<ra<<" and "<<dec);
  }
  if (!freq.isConform("Hz")) {
      ASKAPTHROW(InvalidArgument, "Source "<<name<<": frequency must be given in frequency units, you have "<<freq);
  }
  if (stokes.nelements() != 4) {
      ASKAPTHROW(InvalidArgument, "Source "<<name<<": expect 4 Stokes parameters, you have "<<stokes.nelements());
  }
  itsRA = ra.getValue("rad");
  itsDec = dec.getValue("rad");
  itsFrequency = freq.getValue("Hz");
  if (itsFrequency <= 0.) {
      ASKAPTHROW(InvalidArgument, "Source "<<name<<": frequency must be positive, you have "<<freq);
  }
  itsHorizon.az = 0.;
  itsHorizon.za = 0.;
  computeCoherency();
}

void Source::computeCoherency()
{
  ASKAPDEBUGASSERT(itsStokes.nelements() == 4);
  const double i = itsStokes[0];
  const double q = itsStokes[1];
  const double u = itsStokes[2];
  const double v = itsStokes[3];
  itsCoherency.resize(2, 2);
  itsCoherency(0, 0) = casacore::DComplex(0.5 * (i + q), 0.);
  itsCoherency(0, 1) = casacore::DComplex(0.5 * u, -0.5 * v);
  itsCoherency(1, 0) = casacore::DComplex(0.5 * u, 0.5 * v);
  itsCoherency(1, 1) = casacore::DComplex(0.5 * (i - q), 0.);
}

bool Source::isPolarised() const
{
  return std::abs(itsStokes[1]) + std::abs(itsStokes[2]) + std::abs(itsStokes[3]) != 0.;
}

bool Source::cacheValid(const casacore::MEpoch &epoch, const casacore::MPosition &location) const
{
  if (!itsCacheValid) {
      return false;
  }
  if (epoch.getValue().get() != itsCacheTime || epoch.getRef().getType() != itsCacheTimeRef) {
      return false;
  }
  if (location.getRef().getType() != itsCacheLocationRef) {
      return false;
  }
  return casacore::allEQ(location.getValue().getValue(), itsCacheLocation.getValue());
}

void Source::updatePosition(const casacore::MEpoch &epoch, const casacore::MPosition &location)
{
  if (cacheValid(epoch, location)) {
      return;
  }
  itsHorizon = equatorialToHorizon(itsRA, itsDec, epoch, location);
  itsCacheTime = epoch.getValue().get();
  itsCacheTimeRef = epoch.getRef().getType();
  itsCacheLocation = location.getValue();
  itsCacheLocationRef = location.getRef().getType();
  itsCacheValid = true;
}

boost::optional<HorizonPosition> Source::azZa(const casacore::MEpoch &epoch, const casacore::MPosition &location)
{
  updatePosition(epoch, location);
  if (itsHorizon.za > casacore::C::pi_2) {
      return boost::none;
  }
  return itsHorizon;
}

boost::optional<DirectionCosines> Source::directionCosines(const casacore::MEpoch &epoch,
                                                           const casacore::MPosition &location)
{
  const boost::optional<HorizonPosition> pos = azZa(epoch, location);
  if (!pos) {
      return boost::none;
  }
  DirectionCosines lmn;
  lmn.l = sin(pos->az) * sin(pos->za);
  lmn.m = cos(pos->az) * sin(pos->za);
  lmn.n = cos(pos->za);
  return lmn;
}

casacore::Matrix<casacore::DComplex> Source::localCoherency(const casacore::MEpoch &epoch,
                                                            const casacore::MPosition &location) const
{
  if (!isPolarised()) {
      return rotateCoherency(itsCoherency, unitRotation());
  }
  // apparent hour angle with the catalogue declination
  const double ha = hourAngle(itsRA, itsDec, epoch, location);
  const casacore::Matrix<double> rot = parallacticRotation(itsDec, ha, geodeticLatitude(location));
  return rotateCoherency(itsCoherency, rot);
}

bool Source::operator==(const Source &other) const
{
  return itsName == other.itsName && itsRA == other.itsRA && itsDec == other.itsDec &&
         itsFrequency == other.itsFrequency && casacore::allEQ(itsStokes, other.itsStokes);
}

void Source::writeToBlob(LOFAR::BlobOStream& os) const
{
  os.putStart("Source", VISSIM_SOURCE_STREAM_VERSION);
  os << itsName << itsRA << itsDec << itsFrequency;
  for (casacore::uInt pol = 0; pol < 4; ++pol) {
       os << itsStokes[pol];
  }
  os.putEnd();
}

void Source::readFromBlob(LOFAR::BlobIStream& is)
{
  const int version = is.getStart("Source");
  ASKAPCHECK(version == VISSIM_SOURCE_STREAM_VERSION,
       "Attempting to read from a blob stream an object of the wrong version, expected "<<VISSIM_SOURCE_STREAM_VERSION<<
       " got "<<version);
  is >> itsName >> itsRA >> itsDec >> itsFrequency;
  itsStokes.resize(4);
  for (casacore::uInt pol = 0; pol < 4; ++pol) {
       is >> itsStokes[pol];
  }
  is.getEnd();
  computeCoherency();
  itsCacheValid = false;
}

} // namespace simulation

} // namespace vissim
