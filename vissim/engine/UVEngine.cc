/// @file
///
/// @brief Computation of the visibility for a single task
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

#include <vissim/engine/UVEngine.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>

#include <casacore/casa/BasicSL/Constants.h>
#include <casacore/casa/Arrays/MatrixMath.h>

#include <boost/optional.hpp>

#include <cmath>

namespace vissim {

namespace simulation {

UVEngine::UVEngine(UVTask &task) : itsTask(task)
{
  ASKAPDEBUGASSERT(itsTask.source && itsTask.baseline && itsTask.telescope);
}

casacore::Matrix<casacore::DComplex> UVEngine::applyBeam() const
{
  const casacore::MPosition &location = itsTask.telescope->location();
  const boost::optional<HorizonPosition> pos = itsTask.source->azZa(itsTask.time, location);
  if (!pos) {
      ASKAPTHROW(InvalidArgument, "Source "<<itsTask.source->name()<<" is below the horizon, beam can't be applied");
  }
  const casacore::Matrix<casacore::DComplex> jones1 = itsTask.baseline->antenna1().beamJones(*itsTask.telescope,
                                                          pos->az, pos->za, itsTask.freq);
  const casacore::Matrix<casacore::DComplex> jones2 = itsTask.baseline->antenna2().beamJones(*itsTask.telescope,
                                                          pos->az, pos->za, itsTask.freq);
  const casacore::Matrix<casacore::DComplex> coherency = itsTask.source->localCoherency(itsTask.time, location);
  return casacore::product(jones1, casacore::product(coherency, casacore::adjoint(jones2)));
}

Visibility UVEngine::makeVisibility() const
{
  const boost::optional<DirectionCosines> lmn = itsTask.source->directionCosines(itsTask.time,
                                                    itsTask.telescope->location());
  if (!lmn) {
      return zeroVisibility();
  }
  const casacore::Matrix<casacore::DComplex> apparent = applyBeam();
  const casacore::Vector<double> &uvw = itsTask.baseline->uvw();
  // baseline in wavelengths
  const double scale = itsTask.freq / casacore::C::c;
  const double phase = casacore::C::_2pi * scale * (uvw[0] * lmn->l + uvw[1] * lmn->m + uvw[2] * lmn->n);
  const casacore::DComplex fringe(cos(phase), sin(phase));
  Visibility vis;
  vis(0) = apparent(0, 0) * fringe;
  vis(1) = apparent(1, 1) * fringe;
  vis(2) = apparent(0, 1) * fringe;
  vis(3) = apparent(1, 0) * fringe;
  return vis;
}

void UVEngine::updateTask()
{
  itsTask.visibility = makeVisibility();
}

} // namespace simulation

} // namespace vissim
