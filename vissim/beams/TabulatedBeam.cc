/// @file
///
/// @brief Beam defined by a table of Jones matrices
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

#include <vissim/askap_vissim.h>

#include <vissim/beams/TabulatedBeam.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>
#include <askap/askap/AskapLogging.h>

#include <casacore/casa/BasicSL/Constants.h>

#include <Common/LofarTypes.h>

#include <cmath>

ASKAP_LOGGER(logger, ".beams.tabulatedbeam");

namespace vissim {

namespace simulation {

// increment the number when format changes
#define VISSIM_TABULATED_BEAM_STREAM_VERSION 1

TabulatedBeam::TabulatedBeam() : itsNormalised(false) {}

TabulatedBeam::TabulatedBeam(const casacore::Vector<double> &az, const casacore::Vector<double> &za,
                             const casacore::Vector<double> &freq, const casacore::Array<casacore::DComplex> &values) :
     itsAz(az.copy()), itsZa(za.copy()), itsFreq(freq.copy()), itsValues(values.copy()), itsNormalised(false)
{
  validate();
}

void TabulatedBeam::validate() const
{
  if (itsAz.nelements() == 0 || itsZa.nelements() == 0 || itsFreq.nelements() == 0) {
      ASKAPTHROW(InvalidArgument, "Beam table axes should not be empty, you have "<<itsAz.nelements()<<
                 " azimuths, "<<itsZa.nelements()<<" zenith angles and "<<itsFreq.nelements()<<" frequencies");
  }
  const casacore::IPosition expected(5, 2, 2, itsAz.nelements(), itsZa.nelements(), itsFreq.nelements());
  if (!itsValues.shape().isEqual(expected)) {
      ASKAPTHROW(InvalidArgument, "Beam table is expected to have shape "<<expected<<", you have "<<itsValues.shape());
  }
  for (casacore::uInt i = 1; i < itsAz.nelements(); ++i) {
       if (itsAz[i] <= itsAz[i - 1]) {
           ASKAPTHROW(InvalidArgument, "Azimuth grid of the beam table should be strictly increasing");
       }
  }
  if (itsAz[0] < 0. || itsAz[itsAz.nelements() - 1] >= casacore::C::_2pi) {
      ASKAPTHROW(InvalidArgument, "Azimuth grid of the beam table should be within [0, 2pi)");
  }
  for (casacore::uInt i = 1; i < itsZa.nelements(); ++i) {
       if (itsZa[i] <= itsZa[i - 1]) {
           ASKAPTHROW(InvalidArgument, "Zenith angle grid of the beam table should be strictly increasing");
       }
  }
  for (casacore::uInt i = 1; i < itsFreq.nelements(); ++i) {
       if (itsFreq[i] <= itsFreq[i - 1]) {
           ASKAPTHROW(InvalidArgument, "Frequency grid of the beam table should be strictly increasing");
       }
  }
}

casacore::IPosition TabulatedBeam::gridShape() const
{
  return casacore::IPosition(3, itsAz.nelements(), itsZa.nelements(), itsFreq.nelements());
}

void TabulatedBeam::locate(const casacore::Vector<double> &grid, double value, casacore::uInt &index, double &weight)
{
  const casacore::uInt n = grid.nelements();
  ASKAPDEBUGASSERT(n > 0);
  index = 0;
  weight = 0.;
  if (n == 1 || value <= grid[0]) {
      return;
  }
  while (index + 2 < n && grid[index + 1] <= value) {
         ++index;
  }
  weight = (value - grid[index]) / (grid[index + 1] - grid[index]);
  if (weight > 1.) {
      weight = 1.;
  }
}

void TabulatedBeam::locateAzimuth(double value, casacore::uInt &lower, casacore::uInt &upper, double &weight) const
{
  const casacore::uInt n = itsAz.nelements();
  double az = std::fmod(value, casacore::C::_2pi);
  if (az < 0.) {
      az += casacore::C::_2pi;
  }
  lower = 0;
  upper = 0;
  weight = 0.;
  if (n == 1) {
      return;
  }
  const double first = itsAz[0];
  const double last = itsAz[n - 1];
  if (az >= last || az < first) {
      // cell wrapping through 2pi
      lower = n - 1;
      upper = 0;
      const double offset = az >= last ? az - last : az + casacore::C::_2pi - last;
      weight = offset / (first + casacore::C::_2pi - last);
      return;
  }
  while (lower + 1 < n && itsAz[lower + 1] <= az) {
         ++lower;
  }
  upper = lower + 1;
  weight = (az - itsAz[lower]) / (itsAz[upper] - itsAz[lower]);
}

IBeam::Jones TabulatedBeam::evaluate(double az, double za, double freq) const
{
  ASKAPCHECK(itsValues.nelements() > 0, "Beam table is empty");
  const casacore::uInt nFreq = itsFreq.nelements();
  if (freq < itsFreq[0] || freq > itsFreq[nFreq - 1]) {
      ASKAPTHROW(InvalidArgument, "Frequency "<<freq<<" Hz is outside the tabulated range of "<<itsFreq[0]<<
                 " - "<<itsFreq[nFreq - 1]<<" Hz");
  }
  Jones result(2, 2, casacore::DComplex(0., 0.));
  if (za > itsZa[itsZa.nelements() - 1]) {
      return result;
  }
  casacore::uInt azLower = 0;
  casacore::uInt azUpper = 0;
  double azWeight = 0.;
  locateAzimuth(az, azLower, azUpper, azWeight);
  casacore::uInt zaIndex = 0;
  double zaWeight = 0.;
  locate(itsZa, za, zaIndex, zaWeight);
  const casacore::uInt zaUpper = itsZa.nelements() > 1 ? zaIndex + 1 : zaIndex;
  casacore::uInt freqIndex = 0;
  double freqWeight = 0.;
  locate(itsFreq, freq, freqIndex, freqWeight);
  const casacore::uInt freqUpper = nFreq > 1 ? freqIndex + 1 : freqIndex;

  const casacore::uInt azCorner[2] = {azLower, azUpper};
  const double azW[2] = {1. - azWeight, azWeight};
  const casacore::uInt zaCorner[2] = {zaIndex, zaUpper};
  const double zaW[2] = {1. - zaWeight, zaWeight};
  const casacore::uInt freqCorner[2] = {freqIndex, freqUpper};
  const double freqW[2] = {1. - freqWeight, freqWeight};

  for (casacore::uInt i = 0; i < 2; ++i) {
       for (casacore::uInt j = 0; j < 2; ++j) {
            casacore::DComplex sum(0., 0.);
            for (int a = 0; a < 2; ++a) {
                 for (int z = 0; z < 2; ++z) {
                      for (int f = 0; f < 2; ++f) {
                           const double w = azW[a] * zaW[z] * freqW[f];
                           if (w != 0.) {
                               sum += w * itsValues(casacore::IPosition(5, i, j, azCorner[a], zaCorner[z], freqCorner[f]));
                           }
                      }
                 }
            }
            result(i, j) = sum;
       }
  }
  return result;
}

bool TabulatedBeam::isPeakNormalised() const
{
  return itsNormalised;
}

void TabulatedBeam::peakNormalise()
{
  if (itsNormalised) {
      return;
  }
  for (casacore::uInt f = 0; f < itsFreq.nelements(); ++f) {
       double peak = 0.;
       for (casacore::uInt a = 0; a < itsAz.nelements(); ++a) {
            for (casacore::uInt z = 0; z < itsZa.nelements(); ++z) {
                 for (casacore::uInt pol = 0; pol < 2; ++pol) {
                      const double amp = std::abs(itsValues(casacore::IPosition(5, pol, pol, a, z, f)));
                      if (amp > peak) {
                          peak = amp;
                      }
                 }
            }
       }
       if (peak == 0.) {
           ASKAPLOG_WARN_STR(logger, "Beam table has zero response at "<<itsFreq[f]<<" Hz, plane left unnormalised");
           continue;
       }
       for (casacore::uInt a = 0; a < itsAz.nelements(); ++a) {
            for (casacore::uInt z = 0; z < itsZa.nelements(); ++z) {
                 for (casacore::uInt i = 0; i < 2; ++i) {
                      for (casacore::uInt j = 0; j < 2; ++j) {
                           itsValues(casacore::IPosition(5, i, j, a, z, f)) /= peak;
                      }
                 }
            }
       }
  }
  itsNormalised = true;
}

IBeam::ShPtr TabulatedBeam::clone() const
{
  boost::shared_ptr<TabulatedBeam> result(new TabulatedBeam(*this));
  // casacore arrays use reference semantics on copy, rebind to private storage
  result->itsAz.reference(itsAz.copy());
  result->itsZa.reference(itsZa.copy());
  result->itsFreq.reference(itsFreq.copy());
  result->itsValues.reference(itsValues.copy());
  return result;
}

std::string TabulatedBeam::kind() const
{
  return "tabulated";
}

void TabulatedBeam::writeToBlob(LOFAR::BlobOStream& os) const
{
  os.putStart("TabulatedBeam", VISSIM_TABULATED_BEAM_STREAM_VERSION);
  os << itsNormalised << static_cast<LOFAR::TYPES::uint32>(itsAz.nelements()) <<
        static_cast<LOFAR::TYPES::uint32>(itsZa.nelements()) << static_cast<LOFAR::TYPES::uint32>(itsFreq.nelements());
  for (casacore::uInt i = 0; i < itsAz.nelements(); ++i) {
       os << itsAz[i];
  }
  for (casacore::uInt i = 0; i < itsZa.nelements(); ++i) {
       os << itsZa[i];
  }
  for (casacore::uInt i = 0; i < itsFreq.nelements(); ++i) {
       os << itsFreq[i];
  }
  for (casacore::Array<casacore::DComplex>::const_iterator ci = itsValues.begin(); ci != itsValues.end(); ++ci) {
       os << *ci;
  }
  os.putEnd();
}

void TabulatedBeam::readFromBlob(LOFAR::BlobIStream& is)
{
  const int version = is.getStart("TabulatedBeam");
  ASKAPCHECK(version == VISSIM_TABULATED_BEAM_STREAM_VERSION,
       "Attempting to read from a blob stream an object of the wrong version, expected "<<VISSIM_TABULATED_BEAM_STREAM_VERSION<<
       " got "<<version);
  LOFAR::TYPES::uint32 nAz = 0;
  LOFAR::TYPES::uint32 nZa = 0;
  LOFAR::TYPES::uint32 nFreq = 0;
  is >> itsNormalised >> nAz >> nZa >> nFreq;
  itsAz.resize(nAz);
  itsZa.resize(nZa);
  itsFreq.resize(nFreq);
  for (casacore::uInt i = 0; i < nAz; ++i) {
       is >> itsAz[i];
  }
  for (casacore::uInt i = 0; i < nZa; ++i) {
       is >> itsZa[i];
  }
  for (casacore::uInt i = 0; i < nFreq; ++i) {
       is >> itsFreq[i];
  }
  itsValues.resize(casacore::IPosition(5, 2, 2, nAz, nZa, nFreq));
  for (casacore::Array<casacore::DComplex>::iterator it = itsValues.begin(); it != itsValues.end(); ++it) {
       is >> *it;
  }
  is.getEnd();
  validate();
}

} // namespace simulation

} // namespace vissim
