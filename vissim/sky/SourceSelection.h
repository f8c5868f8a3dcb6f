/// @file
///
/// @brief Flux and coarse horizon selection of the sky model
/// @details Sources outside the allowed Stokes I range, or sources which
/// never rise above the horizon at the array latitude, can be dropped before
/// the task list is built. The horizon test is a cheap declination test which
/// does not depend on time. Rise and set local sidereal times can be estimated
/// for the remaining sources.
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

#ifndef VISSIM_SOURCE_SELECTION_H
#define VISSIM_SOURCE_SELECTION_H

#include <vissim/sky/Source.h>

#include <boost/optional.hpp>

#include <vector>
#include <utility>

namespace vissim {

namespace simulation {

/// @brief selection of sources to simulate
class SourceSelection {
public:
   /// @brief default horizon buffer, about 10 minutes of sky rotation (radians)
   static const double theirDefaultHorizonBuffer;

   /// @brief construct selection which passes all sources
   SourceSelection();

   /// @brief set lower flux limit, sources with Stokes I <= minFlux are rejected
   void setMinFlux(double minFlux);

   /// @brief set upper flux limit, sources with Stokes I >= maxFlux are rejected
   void setMaxFlux(double maxFlux);

   /// @brief enable the coarse horizon cut
   /// @param[in] latitude array latitude in radians
   void setLatitude(double latitude);

   /// @brief set horizon buffer used in rise/set estimates
   /// @param[in] buffer angle in radians
   void setHorizonBuffer(double buffer);

   /// @brief check whether a single source passes the selection
   bool passes(const Source &src) const;

   /// @brief select sources
   /// @param[in] sources input source list
   /// @return sources which passed all cuts, in the original order
   std::vector<Source::ShPtr> select(const std::vector<Source::ShPtr> &sources) const;

   /// @brief estimate rise and set local sidereal time of a source
   /// @details Requires the latitude to be set. The horizon buffer widens the
   /// interval on both sides.
   /// @param[in] src source
   /// @return (rise, set) LST in radians, or empty for circumpolar or never-rising sources
   boost::optional<std::pair<double, double> > riseSetLST(const Source &src) const;

private:
   boost::optional<double> itsMinFlux;
   boost::optional<double> itsMaxFlux;
   boost::optional<double> itsLatitude;
   double itsHorizonBuffer;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_SOURCE_SELECTION_H
