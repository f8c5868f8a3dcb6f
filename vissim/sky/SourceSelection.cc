/// @file
///
/// @brief Flux and coarse horizon selection of the sky model
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

#include <vissim/askap_vissim.h>

#include <vissim/sky/SourceSelection.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>
#include <askap/askap/AskapLogging.h>

#include <casacore/casa/BasicSL/Constants.h>

#include <cmath>

ASKAP_LOGGER(logger, ".sky.sourceselection");

namespace vissim {

namespace simulation {

const double SourceSelection::theirDefaultHorizonBuffer = 0.04364;

SourceSelection::SourceSelection() : itsHorizonBuffer(theirDefaultHorizonBuffer) {}

void SourceSelection::setMinFlux(double minFlux)
{
  itsMinFlux = minFlux;
}

void SourceSelection::setMaxFlux(double maxFlux)
{
  itsMaxFlux = maxFlux;
}

void SourceSelection::setLatitude(double latitude)
{
  if (std::abs(latitude) > casacore::C::pi_2) {
      ASKAPTHROW(InvalidArgument, "Latitude should be within [-pi/2, pi/2], you have "<<latitude);
  }
  itsLatitude = latitude;
}

void SourceSelection::setHorizonBuffer(double buffer)
{
  if (buffer < 0.) {
      ASKAPTHROW(InvalidArgument, "Horizon buffer should be non-negative, you have "<<buffer);
  }
  itsHorizonBuffer = buffer;
}

bool SourceSelection::passes(const Source &src) const
{
  if (itsMinFlux && !(src.flux() > *itsMinFlux)) {
      return false;
  }
  if (itsMaxFlux && !(src.flux() < *itsMaxFlux)) {
      return false;
  }
  if (itsLatitude) {
      // never rises
      if (tan(*itsLatitude) * tan(src.dec()) < -1.) {
          return false;
      }
  }
  return true;
}

std::vector<Source::ShPtr> SourceSelection::select(const std::vector<Source::ShPtr> &sources) const
{
  std::vector<Source::ShPtr> result;
  result.reserve(sources.size());
  for (std::vector<Source::ShPtr>::const_iterator ci = sources.begin(); ci != sources.end(); ++ci) {
       ASKAPCHECK(*ci, "Empty shared pointer in the source list");
       if (passes(**ci)) {
           result.push_back(*ci);
       }
  }
  ASKAPLOG_INFO_STR(logger, "Source selection kept "<<result.size()<<" out of "<<sources.size()<<" sources");
  return result;
}

boost::optional<std::pair<double, double> > SourceSelection::riseSetLST(const Source &src) const
{
  ASKAPCHECK(itsLatitude, "Latitude has to be set to estimate rise and set times");
  const double tans = tan(*itsLatitude) * tan(src.dec());
  if (tans < -1. || tans >= 1.) {
      return boost::none;
  }
  const double halfDuration = acos(-tans);
  double riseLST = src.ra() - halfDuration - itsHorizonBuffer;
  double setLST = src.ra() + halfDuration + itsHorizonBuffer;
  if (riseLST < 0.) {
      riseLST += casacore::C::_2pi;
  }
  if (setLST >= casacore::C::_2pi) {
      setLST -= casacore::C::_2pi;
  }
  return std::make_pair(riseLST, setLST);
}

} // namespace simulation

} // namespace vissim
