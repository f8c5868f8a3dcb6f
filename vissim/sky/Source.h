/// @file
///
/// @brief A point source of the sky model
/// @details The source is described by its equatorial (ICRS) position,
/// reference frequency and Stokes parameters. The coherency matrix is derived
/// at construction. The horizontal position is cached for the last
/// (epoch, location) pair because many tasks share the same time.
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

#ifndef VISSIM_SOURCE_H
#define VISSIM_SOURCE_H

#include <vissim/coordinates/CoordinateUtils.h>

#include <casacore/casa/aips.h>
#include <casacore/casa/Arrays/Matrix.h>
#include <casacore/casa/Arrays/Vector.h>
#include <casacore/casa/Quanta/Quantum.h>
#include <casacore/casa/Quanta/MVPosition.h>
#include <casacore/measures/Measures/MEpoch.h>
#include <casacore/measures/Measures/MPosition.h>

#include <askap/scimath/fitting/ISerializable.h>
#include <Blob/BlobOStream.h>
#include <Blob/BlobIStream.h>

#include <boost/shared_ptr.hpp>
#include <boost/optional.hpp>

#include <string>

namespace vissim {

namespace simulation {

/// @brief direction cosines of the source in the local frame
struct DirectionCosines {
   double l;
   double m;
   double n;
};

/// @brief point source
/// @details Positions are kept in radians, frequency in Hz and Stokes
/// parameters in Jy in the I, Q, U, V order.
class Source : public askap::ISerializable {
public:
   /// @brief shared pointer type
   typedef boost::shared_ptr<Source> ShPtr;

   /// @brief default constructor, used before reading from a blob
   Source();

   /// @brief construct the source
   /// @details Units are checked, InvalidArgument is thrown if ra or dec are
   /// not angles or freq is not a frequency.
   /// @param[in] name source name
   /// @param[in] ra right ascension (ICRS)
   /// @param[in] dec declination (ICRS)
   /// @param[in] freq reference frequency
   /// @param[in] stokes I, Q, U and V flux densities
   Source(const std::string &name, const casacore::Quantity &ra, const casacore::Quantity &dec,
          const casacore::Quantity &freq, const casacore::Vector<double> &stokes);

   /// @return source name
   const std::string& name() const { return itsName; }

   /// @return right ascension in radians
   double ra() const { return itsRA; }

   /// @return declination in radians
   double dec() const { return itsDec; }

   /// @return reference frequency in Hz
   double frequency() const { return itsFrequency; }

   /// @return Stokes vector (I,Q,U,V)
   const casacore::Vector<double>& stokes() const { return itsStokes; }

   /// @return Stokes I
   double flux() const { return itsStokes[0]; }

   /// @return true if any of Q, U or V is non-zero
   bool isPolarised() const;

   /// @brief coherency matrix in the equatorial frame
   /// @return 0.5 [[I+Q, U-iV], [U+iV, I-Q]]
   const casacore::Matrix<casacore::DComplex>& coherency() const { return itsCoherency; }

   /// @brief update cached horizontal position
   /// @details The position is only recomputed if either the epoch or the
   /// location differ from those used last time.
   /// @param[in] epoch time of observation
   /// @param[in] location array reference position
   void updatePosition(const casacore::MEpoch &epoch, const casacore::MPosition &location);

   /// @brief azimuth and zenith angle
   /// @return horizontal position or empty if the source is below the horizon
   boost::optional<HorizonPosition> azZa(const casacore::MEpoch &epoch, const casacore::MPosition &location);

   /// @brief direction cosines in the local (East, North, Up) frame
   /// @return l,m,n or empty if the source is below the horizon
   boost::optional<DirectionCosines> directionCosines(const casacore::MEpoch &epoch,
                                                      const casacore::MPosition &location);

   /// @brief coherency matrix rotated to the local polarisation frame
   /// @details unpolarised sources are not rotated at all
   casacore::Matrix<casacore::DComplex> localCoherency(const casacore::MEpoch &epoch,
                                                       const casacore::MPosition &location) const;

   /// @brief compare two sources
   /// @details name, position, frequency and Stokes vector have to match
   bool operator==(const Source &other) const;

   /// @brief write the object to a blob stream
   /// @param[in] os the output stream
   virtual void writeToBlob(LOFAR::BlobOStream& os) const;

   /// @brief read the object from a blob stream
   /// @param[in] is the input stream
   virtual void readFromBlob(LOFAR::BlobIStream& is);

private:
   /// @brief fill itsCoherency from the Stokes vector
   void computeCoherency();

   /// @brief check whether the cache is valid for the given epoch and location
   bool cacheValid(const casacore::MEpoch &epoch, const casacore::MPosition &location) const;

   std::string itsName;
   double itsRA;
   double itsDec;
   double itsFrequency;
   casacore::Vector<double> itsStokes;
   casacore::Matrix<casacore::DComplex> itsCoherency;

   /// @brief epoch (MJD, days) and frame type of the cached position
   bool itsCacheValid;
   double itsCacheTime;
   casacore::uInt itsCacheTimeRef;
   casacore::MVPosition itsCacheLocation;
   casacore::uInt itsCacheLocationRef;
   HorizonPosition itsHorizon;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_SOURCE_H
