/// @file
///
/// @brief Airy disk beam model
/// @details Response of a uniformly illuminated circular aperture,
/// 2 J1(x)/x with x = (D/2) sin(za) 2 pi f / c. Both feeds get the same
/// response and there is no leakage.
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

#ifndef VISSIM_AIRY_BEAM_H
#define VISSIM_AIRY_BEAM_H

#include <vissim/beams/IBeam.h>

#include <boost/optional.hpp>

namespace vissim {

namespace simulation {

/// @brief airy beam
class AiryBeam : public IBeam {
public:
   /// @brief construct an empty beam to be read from a blob
   AiryBeam();

   /// @brief construct the beam
   /// @param[in] diameter dish diameter in metres, MissingParameter is thrown if not set
   explicit AiryBeam(const boost::optional<double> &diameter);

   virtual Jones evaluate(double az, double za, double freq) const;

   using IBeam::evaluate;

   virtual bool isPeakNormalised() const;

   virtual void peakNormalise();

   virtual ShPtr clone() const;

   virtual std::string kind() const;

   virtual void writeToBlob(LOFAR::BlobOStream& os) const;

   virtual void readFromBlob(LOFAR::BlobIStream& is);

   /// @return dish diameter in metres
   double diameter() const;

   /// @brief value of 2 J1(x)/x
   /// @details exactly 1 at x = 0
   static double airy(double x);

private:
   boost::optional<double> itsDiameter;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_AIRY_BEAM_H
