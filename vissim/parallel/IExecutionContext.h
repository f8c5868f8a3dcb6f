/// @file
///
/// @brief Interface to the communication layer of the distributed job
/// @details The executor is written against this interface, so the same
/// partition, scatter, compute, gather and merge sequence runs in a single
/// process, in a number of threads or on a number of MPI ranks. Rank 0 is
/// the coordinator, it also acts as a worker. Both collective operations are
/// barriers, all ranks have to call them.
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

#ifndef VISSIM_I_EXECUTION_CONTEXT_H
#define VISSIM_I_EXECUTION_CONTEXT_H

#include <stdint.h>
#include <string>
#include <vector>

namespace vissim {

namespace simulation {

/// @brief communication layer of the distributed job
class IExecutionContext {
public:
   /// @brief serialised message
   typedef std::vector<int8_t> Buffer;

   /// @brief empty virtual destructor to keep the compiler happy
   virtual ~IExecutionContext();

   /// @return rank of this process or thread, 0 for the coordinator
   virtual int rank() const = 0;

   /// @return total number of workers including the coordinator
   virtual int nWorkers() const = 0;

   /// @return true on the coordinator
   bool isCoordinator() const { return rank() == 0; }

   /// @brief distribute one message to every rank
   /// @details On the coordinator, shards should contain one message per rank
   /// and is ignored elsewhere. Every rank receives its own message.
   /// @param[in] shards messages for all ranks (coordinator only)
   /// @param[out] local message for this rank
   virtual void scatter(const std::vector<Buffer> &shards, Buffer &local) = 0;

   /// @brief collect one message from every rank on the coordinator
   /// @details On the coordinator all is filled in rank order, elsewhere it is left empty.
   /// @param[in] local message of this rank
   /// @param[out] all messages of all ranks (coordinator only)
   virtual void gather(const Buffer &local, std::vector<Buffer> &all) = 0;

   /// @brief terminate the whole job
   /// @details Ranks blocked in a collective operation are released and fail.
   /// Depending on the implementation this may not return.
   /// @param[in] reason description of the failure
   virtual void abort(const std::string &reason) = 0;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_I_EXECUTION_CONTEXT_H
