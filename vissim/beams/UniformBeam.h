/// @file
///
/// @brief Beam with unit response in all directions
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

#ifndef VISSIM_UNIFORM_BEAM_H
#define VISSIM_UNIFORM_BEAM_H

#include <vissim/beams/IBeam.h>

namespace vissim {

namespace simulation {

/// @brief uniform beam
/// @details The Jones matrix is the identity everywhere, i.e. the feeds
/// see only their own polarisation and there is no attenuation.
class UniformBeam : public IBeam {
public:
   /// @brief evaluate the beam, returns identity matrix
   virtual Jones evaluate(double az, double za, double freq) const;

   using IBeam::evaluate;

   /// @return true, uniform beam is always normalised
   virtual bool isPeakNormalised() const;

   /// @brief no-op
   virtual void peakNormalise();

   virtual ShPtr clone() const;

   virtual std::string kind() const;

   virtual void writeToBlob(LOFAR::BlobOStream& os) const;

   virtual void readFromBlob(LOFAR::BlobIStream& is);
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_UNIFORM_BEAM_H
