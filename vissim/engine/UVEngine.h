/// @file
///
/// @brief Computation of the visibility for a single task
/// @details The measurement equation for a point source is
/// V = J1 C J2^H exp(2 pi i (u l + v m + w n)), where J1 and J2 are the
/// Jones matrices of the two antennas towards the source, C is the
/// coherency matrix in the local polarisation frame and (u, v, w) is the
/// baseline vector in wavelengths. Sources below the horizon give zero.
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

#ifndef VISSIM_UV_ENGINE_H
#define VISSIM_UV_ENGINE_H

#include <vissim/engine/UVTask.h>

#include <casacore/casa/Arrays/Matrix.h>

namespace vissim {

namespace simulation {

/// @brief visibility calculator
/// @details The engine works on the task it has been set up with. It doesn't
/// own the task.
class UVEngine {
public:
   /// @brief set up the engine for the task
   /// @param[in] task task to work on
   explicit UVEngine(UVTask &task);

   /// @brief apparent coherency
   /// @details Source must be above the horizon.
   /// @return J1 C J2^H, 2x2 complex matrix
   casacore::Matrix<casacore::DComplex> applyBeam() const;

   /// @brief compute the visibility
   /// @return xx, yy, xy and yx correlations, zeros if the source is below the horizon
   Visibility makeVisibility() const;

   /// @brief compute the visibility and store it in the task
   void updateTask();

private:
   UVTask &itsTask;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_UV_ENGINE_H
