/// @file
///
/// @brief Array-wide description: name, location and beam models
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

#ifndef VISSIM_TELESCOPE_H
#define VISSIM_TELESCOPE_H

#include <vissim/beams/IBeam.h>

#include <casacore/measures/Measures/MPosition.h>

#include <boost/shared_ptr.hpp>

#include <string>
#include <vector>

namespace vissim {

namespace simulation {

/// @brief telescope
/// @details Antennas refer to the beams by their index in the beam list.
/// Beams are held by shared pointers, so normalisation of a beam is seen
/// by all antennas sharing it.
class Telescope {
public:
   /// @brief shared pointer type
   typedef boost::shared_ptr<Telescope> ShPtr;

   /// @brief construct the telescope
   /// @param[in] name telescope name
   /// @param[in] location array reference position
   /// @param[in] beams beam models
   Telescope(const std::string &name, const casacore::MPosition &location,
             const std::vector<IBeam::ShPtr> &beams);

   /// @return telescope name
   const std::string& name() const { return itsName; }

   /// @return array reference position
   const casacore::MPosition& location() const { return itsLocation; }

   /// @return number of beam models
   size_t nBeams() const { return itsBeams.size(); }

   /// @brief access to the beam model
   /// @param[in] beamId index in the beam list
   /// @return reference to the beam
   IBeam& beam(int beamId) const;

   /// @return all beams
   const std::vector<IBeam::ShPtr>& beams() const { return itsBeams; }

private:
   std::string itsName;
   casacore::MPosition itsLocation;
   std::vector<IBeam::ShPtr> itsBeams;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_TELESCOPE_H
