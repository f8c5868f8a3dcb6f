/// @file
///
/// @brief Execution context over MPI
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

#include <vissim/parallel/MPIExecutionContext.h>

#include <askap/askap/AskapError.h>
#include <askap/askap/AskapLogging.h>

ASKAP_LOGGER(logger, ".parallel.mpicontext");

namespace vissim {

namespace simulation {

namespace {

/// @brief message tags
enum MessageTag {
   SHARD_TAG = 1,
   RESULT_TAG = 2
};

} // anonymous namespace

MPIExecutionContext::MPIExecutionContext(askap::askapparallel::AskapParallel &comms) : itsComms(comms) {}

int MPIExecutionContext::rank() const
{
  return itsComms.rank();
}

int MPIExecutionContext::nWorkers() const
{
  return itsComms.nProcs();
}

void MPIExecutionContext::sendBuffer(const Buffer &buf, int dest, int tag)
{
  // First send the size of the buffer
  const unsigned long size = buf.size();
  itsComms.send(&size, sizeof(long), dest, tag);
  // Now send the actual byte stream
  if (size > 0) {
      itsComms.send(&buf[0], size * sizeof(int8_t), dest, tag);
  }
}

void MPIExecutionContext::receiveBuffer(Buffer &buf, int source, int tag)
{
  unsigned long size = 0;
  itsComms.receive(&size, sizeof(long), source, tag);
  buf.resize(size);
  ASKAPCHECK(buf.size() == size, "MPIExecutionContext::receiveBuffer() buf is too small");
  if (size > 0) {
      itsComms.receive(&buf[0], size * sizeof(int8_t), source, tag);
  }
}

void MPIExecutionContext::scatter(const std::vector<Buffer> &shards, Buffer &local)
{
  if (isCoordinator()) {
      ASKAPCHECK(int(shards.size()) == nWorkers(), "Expect one shard per rank, you have "<<shards.size()<<
                 " shards for "<<nWorkers()<<" ranks");
      for (int dest = 1; dest < nWorkers(); ++dest) {
           sendBuffer(shards[dest], dest, SHARD_TAG);
      }
      local = shards[0];
  } else {
      receiveBuffer(local, 0, SHARD_TAG);
  }
}

void MPIExecutionContext::gather(const Buffer &local, std::vector<Buffer> &all)
{
  all.clear();
  if (isCoordinator()) {
      all.resize(nWorkers());
      all[0] = local;
      for (int source = 1; source < nWorkers(); ++source) {
           receiveBuffer(all[source], source, RESULT_TAG);
      }
  } else {
      sendBuffer(local, 0, RESULT_TAG);
  }
}

void MPIExecutionContext::abort(const std::string &reason)
{
  ASKAPLOG_FATAL_STR(logger, "Rank "<<rank()<<" aborts the job: "<<reason);
  itsComms.abort();
}

} // namespace simulation

} // namespace vissim
