/// @file
///
/// @brief Execution context over MPI
/// @details Each MPI rank is a worker, rank 0 is the coordinator. Messages
/// are sent point to point, the size first and then the byte stream.
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

#ifndef VISSIM_MPI_EXECUTION_CONTEXT_H
#define VISSIM_MPI_EXECUTION_CONTEXT_H

#include <vissim/parallel/IExecutionContext.h>

#include <askap/askapparallel/AskapParallel.h>

namespace vissim {

namespace simulation {

/// @brief MPI context
class MPIExecutionContext : public IExecutionContext {
public:
   /// @brief set up the context
   /// @param[in] comms initialised communicator, should outlive this object
   explicit MPIExecutionContext(askap::askapparallel::AskapParallel &comms);

   virtual int rank() const;

   virtual int nWorkers() const;

   virtual void scatter(const std::vector<Buffer> &shards, Buffer &local);

   virtual void gather(const Buffer &local, std::vector<Buffer> &all);

   /// @brief abort all ranks through MPI_Abort
   virtual void abort(const std::string &reason);

private:
   /// @brief send the buffer to the given rank
   void sendBuffer(const Buffer &buf, int dest, int tag);

   /// @brief receive the buffer from the given rank
   void receiveBuffer(Buffer &buf, int source, int tag);

   askap::askapparallel::AskapParallel &itsComms;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_MPI_EXECUTION_CONTEXT_H
