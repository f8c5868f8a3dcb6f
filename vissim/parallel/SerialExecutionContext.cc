/// @file
///
/// @brief Execution context with a single worker
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

#include <vissim/parallel/SerialExecutionContext.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>
#include <askap/askap/AskapLogging.h>

ASKAP_LOGGER(logger, ".parallel.serialcontext");

namespace vissim {

namespace simulation {

SerialExecutionContext::SerialExecutionContext() : itsAborted(false) {}

int SerialExecutionContext::rank() const
{
  return 0;
}

int SerialExecutionContext::nWorkers() const
{
  return 1;
}

void SerialExecutionContext::scatter(const std::vector<Buffer> &shards, Buffer &local)
{
  if (itsAborted) {
      ASKAPTHROW(DistributedFailure, "Job has been aborted");
  }
  ASKAPCHECK(shards.size() == 1, "Serial context expects exactly one shard, you have "<<shards.size());
  local = shards[0];
}

void SerialExecutionContext::gather(const Buffer &local, std::vector<Buffer> &all)
{
  if (itsAborted) {
      ASKAPTHROW(DistributedFailure, "Job has been aborted");
  }
  all.assign(1, local);
}

void SerialExecutionContext::abort(const std::string &reason)
{
  ASKAPLOG_ERROR_STR(logger, "Aborting the job: "<<reason);
  itsAborted = true;
}

} // namespace simulation

} // namespace vissim
