/// @file
///
/// @brief Interface to the antenna beam (voltage pattern) models
/// @details A beam returns a 2x2 Jones matrix for a direction given in the
/// local horizontal frame and a frequency. Element (0,0) and (1,1) are the
/// responses of the two feeds to their own polarisation, (0,1) and (1,0) are
/// the cross terms. Beams are shipped to the workers as blobs, so every
/// implementation is serialisable.
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

#ifndef VISSIM_I_BEAM_H
#define VISSIM_I_BEAM_H

#include <casacore/casa/aips.h>
#include <casacore/casa/Arrays/Matrix.h>
#include <casacore/casa/Arrays/Vector.h>

#include <askap/scimath/fitting/ISerializable.h>
#include <Blob/BlobOStream.h>
#include <Blob/BlobIStream.h>

#include <boost/shared_ptr.hpp>

#include <string>
#include <vector>

namespace vissim {

namespace simulation {

/// @brief interface to a beam model
class IBeam : public askap::ISerializable {
public:
   /// @brief shared pointer type
   typedef boost::shared_ptr<IBeam> ShPtr;

   /// @brief Jones matrix type
   typedef casacore::Matrix<casacore::DComplex> Jones;

   /// @brief empty virtual destructor to keep the compiler happy
   virtual ~IBeam();

   /// @brief evaluate the beam for a single direction
   /// @param[in] az azimuth (radians, North through East)
   /// @param[in] za zenith angle (radians)
   /// @param[in] freq frequency in Hz
   /// @return 2x2 Jones matrix
   virtual Jones evaluate(double az, double za, double freq) const = 0;

   /// @brief evaluate the beam for a number of directions
   /// @details The default implementation calls the scalar version for every
   /// direction.
   /// @param[in] az azimuths (radians)
   /// @param[in] za zenith angles (radians), same length as az
   /// @param[in] freq frequency in Hz
   /// @return one Jones matrix per direction
   virtual std::vector<Jones> evaluate(const casacore::Vector<double> &az, const casacore::Vector<double> &za,
                                       double freq) const;

   /// @brief check whether the beam is normalised to unit peak response
   virtual bool isPeakNormalised() const = 0;

   /// @brief normalise the beam to unit peak response
   /// @details analytic beams are normalised by construction, so this is a no-op for them
   virtual void peakNormalise() = 0;

   /// @brief deep copy of the beam
   virtual ShPtr clone() const = 0;

   /// @brief short string identifying the model
   /// @details used to reconstruct the right type from a blob stream
   virtual std::string kind() const = 0;

protected:
   /// @brief helper to make a diagonal Jones matrix
   /// @param[in] value response of both feeds
   static Jones diagonalJones(double value);
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_I_BEAM_H
