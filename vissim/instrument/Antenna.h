/// @file
///
/// @brief Single antenna of the array
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

#ifndef VISSIM_ANTENNA_H
#define VISSIM_ANTENNA_H

#include <vissim/beams/IBeam.h>
#include <vissim/instrument/Telescope.h>

#include <casacore/casa/Arrays/Vector.h>

#include <boost/shared_ptr.hpp>

#include <string>

namespace vissim {

namespace simulation {

/// @brief antenna
/// @details The position is given in metres in the local East, North, Up
/// frame relative to the telescope location. The beam is referred to by its
/// index in the telescope beam list.
class Antenna {
public:
   /// @brief shared pointer type
   typedef boost::shared_ptr<Antenna> ShPtr;

   /// @brief construct the antenna
   /// @param[in] name antenna name
   /// @param[in] number antenna number
   /// @param[in] enu East, North and Up offsets in metres
   /// @param[in] beamId index of the beam model in the telescope
   Antenna(const std::string &name, int number, const casacore::Vector<double> &enu, int beamId);

   /// @return antenna name
   const std::string& name() const { return itsName; }

   /// @return antenna number
   int number() const { return itsNumber; }

   /// @return position in the East, North, Up frame (metres)
   const casacore::Vector<double>& positionENU() const { return itsENU; }

   /// @return index of the beam model
   int beamId() const { return itsBeamId; }

   /// @brief Jones matrix of this antenna towards the given direction
   /// @details The beam is normalised to the unit peak first if it hasn't been
   /// already. Normalisation changes the beam held by the telescope.
   /// @param[in] telescope telescope holding the beam models
   /// @param[in] az azimuth in radians
   /// @param[in] za zenith angle in radians
   /// @param[in] freq frequency in Hz
   /// @return 2x2 Jones matrix
   IBeam::Jones beamJones(const Telescope &telescope, double az, double za, double freq) const;

   /// @brief compare antennas
   bool operator==(const Antenna &other) const;

private:
   std::string itsName;
   int itsNumber;
   casacore::Vector<double> itsENU;
   int itsBeamId;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_ANTENNA_H
