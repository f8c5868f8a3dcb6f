/// @file
///
/// @brief Exception classes raised by the visibility simulator
/// @details All errors derive from askap::AskapError so the applications
/// can report them in a uniform way. Separate types allow callers to tell
/// a bad argument (e.g. a frequency given in the wrong units) from a
/// configuration which can't be simulated and from a failure of the
/// distributed job as a whole.
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

#ifndef VISSIM_SIMULATION_ERRORS_H
#define VISSIM_SIMULATION_ERRORS_H

#include <askap/askap/AskapError.h>
#include <string>

namespace vissim {

/// @brief argument has wrong units, shape or value
struct InvalidArgument: public askap::AskapError
{
  /// Constructor taking a message
  /// @param[in] message Message string
  explicit InvalidArgument(const std::string& message);
};

/// @brief a required model parameter has not been given
/// @details e.g. gaussian beam without sigma or diameter
struct MissingParameter: public askap::AskapError
{
  /// Constructor taking a message
  /// @param[in] message Message string
  explicit MissingParameter(const std::string& message);
};

/// @brief inconsistent beam assignment, antenna list or geometry
struct ConfigurationError: public askap::AskapError
{
  /// Constructor taking a message
  /// @param[in] message Message string
  explicit ConfigurationError(const std::string& message);
};

/// @brief any failure on any rank of the distributed job
/// @details The job is aborted as a whole, no partial result is returned.
struct DistributedFailure: public askap::AskapError
{
  /// Constructor taking a message
  /// @param[in] message Message string
  explicit DistributedFailure(const std::string& message);
};

} // namespace vissim

#endif // #ifndef VISSIM_SIMULATION_ERRORS_H
