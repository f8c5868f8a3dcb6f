/// @file
///
/// @brief Ordered pair of antennas
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

#ifndef VISSIM_BASELINE_H
#define VISSIM_BASELINE_H

#include <vissim/instrument/Antenna.h>

#include <casacore/casa/Arrays/Vector.h>

#include <boost/shared_ptr.hpp>

namespace vissim {

namespace simulation {

/// @brief baseline
/// @details The baseline vector is the position of the second antenna
/// relative to the first one, metres in the East, North, Up frame.
class Baseline {
public:
   /// @brief shared pointer type
   typedef boost::shared_ptr<Baseline> ShPtr;

   /// @brief construct the baseline
   /// @param[in] ant1 first antenna
   /// @param[in] ant2 second antenna
   Baseline(const Antenna::ShPtr &ant1, const Antenna::ShPtr &ant2);

   /// @return first antenna
   const Antenna& antenna1() const { return *itsAntenna1; }

   /// @return second antenna
   const Antenna& antenna2() const { return *itsAntenna2; }

   /// @return shared pointer to the first antenna
   const Antenna::ShPtr& antenna1Ptr() const { return itsAntenna1; }

   /// @return shared pointer to the second antenna
   const Antenna::ShPtr& antenna2Ptr() const { return itsAntenna2; }

   /// @return baseline vector enu2 - enu1, metres
   const casacore::Vector<double>& uvw() const { return itsUVW; }

   /// @brief compare baselines
   /// @details Antenna names and numbers have to match, vectors within 1 mm
   bool operator==(const Baseline &other) const;

   /// @brief order by antenna numbers
   bool operator<(const Baseline &other) const;

private:
   Antenna::ShPtr itsAntenna1;
   Antenna::ShPtr itsAntenna2;
   casacore::Vector<double> itsUVW;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_BASELINE_H
