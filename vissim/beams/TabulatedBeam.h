/// @file
///
/// @brief Beam defined by a table of Jones matrices
/// @details The table is a regular grid in azimuth, zenith angle and
/// frequency, normally filled by a loader of measured beam patterns.
/// Values in between are interpolated linearly along all three axes.
/// Azimuth is periodic. The pattern is treated as zero beyond the largest
/// tabulated zenith angle, and a frequency outside the tabulated range is
/// an error. Normalisation to the unit peak is done on request, separately
/// for every frequency plane.
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

#ifndef VISSIM_TABULATED_BEAM_H
#define VISSIM_TABULATED_BEAM_H

#include <vissim/beams/IBeam.h>

#include <casacore/casa/Arrays/Array.h>
#include <casacore/casa/Arrays/IPosition.h>

namespace vissim {

namespace simulation {

/// @brief tabulated beam
class TabulatedBeam : public IBeam {
public:
   /// @brief construct an empty beam to be read from a blob
   TabulatedBeam();

   /// @brief construct the beam from the table
   /// @param[in] az azimuth grid, radians, strictly increasing within [0, 2pi)
   /// @param[in] za zenith angle grid, radians, strictly increasing
   /// @param[in] freq frequency grid, Hz, strictly increasing
   /// @param[in] values Jones matrices, array of shape (2, 2, nAz, nZa, nFreq)
   TabulatedBeam(const casacore::Vector<double> &az, const casacore::Vector<double> &za,
                 const casacore::Vector<double> &freq, const casacore::Array<casacore::DComplex> &values);

   virtual Jones evaluate(double az, double za, double freq) const;

   using IBeam::evaluate;

   virtual bool isPeakNormalised() const;

   /// @brief scale each frequency plane so the largest feed response is 1
   virtual void peakNormalise();

   virtual ShPtr clone() const;

   virtual std::string kind() const;

   virtual void writeToBlob(LOFAR::BlobOStream& os) const;

   virtual void readFromBlob(LOFAR::BlobIStream& is);

   /// @return number of grid points along azimuth, zenith angle and frequency
   casacore::IPosition gridShape() const;

private:
   /// @brief check the grid and the table
   void validate() const;

   /// @brief find interpolation cell along a non-periodic axis
   /// @param[in] grid axis values
   /// @param[in] value coordinate
   /// @param[out] index lower index of the cell
   /// @param[out] weight weight of the upper point
   static void locate(const casacore::Vector<double> &grid, double value, casacore::uInt &index, double &weight);

   /// @brief find interpolation cell along the periodic azimuth axis
   /// @param[in] value azimuth in radians
   /// @param[out] lower lower index of the cell
   /// @param[out] upper upper index of the cell
   /// @param[out] weight weight of the upper point
   void locateAzimuth(double value, casacore::uInt &lower, casacore::uInt &upper, double &weight) const;

   casacore::Vector<double> itsAz;
   casacore::Vector<double> itsZa;
   casacore::Vector<double> itsFreq;
   casacore::Array<casacore::DComplex> itsValues;
   bool itsNormalised;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_TABULATED_BEAM_H
