/// @file
///
/// @brief Gaussian beam model
/// @details The response of both feeds is exp(-za^2/(2 sigma^2)). The width
/// is either fixed or derived from the dish diameter, in which case it
/// scales with wavelength.
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

#ifndef VISSIM_GAUSSIAN_BEAM_H
#define VISSIM_GAUSSIAN_BEAM_H

#include <vissim/beams/IBeam.h>

#include <boost/optional.hpp>

namespace vissim {

namespace simulation {

/// @brief gaussian beam
class GaussianBeam : public IBeam {
public:
   /// @brief construct an empty beam to be read from a blob
   GaussianBeam();

   /// @brief construct the beam
   /// @details Either sigma or diameter has to be given, MissingParameter is
   /// thrown otherwise. If both are given, the width derived from the diameter is used.
   /// @param[in] sigma width of the gaussian in radians
   /// @param[in] diameter dish diameter in metres
   GaussianBeam(const boost::optional<double> &sigma, const boost::optional<double> &diameter);

   virtual Jones evaluate(double az, double za, double freq) const;

   using IBeam::evaluate;

   virtual bool isPeakNormalised() const;

   virtual void peakNormalise();

   virtual ShPtr clone() const;

   virtual std::string kind() const;

   virtual void writeToBlob(LOFAR::BlobOStream& os) const;

   virtual void readFromBlob(LOFAR::BlobIStream& is);

   /// @return width for the given frequency, radians
   double sigma(double freq) const;

   /// @return fixed width if given
   const boost::optional<double>& fixedSigma() const { return itsSigma; }

   /// @return diameter if given
   const boost::optional<double>& diameter() const { return itsDiameter; }

   /// @brief equivalent gaussian width of an Airy pattern
   /// @param[in] diameter dish diameter in metres
   /// @param[in] freq frequency in Hz
   /// @return sigma in radians
   static double diameterToSigma(double diameter, double freq);

private:
   boost::optional<double> itsSigma;
   boost::optional<double> itsDiameter;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_GAUSSIAN_BEAM_H
