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

#ifndef VISSIM_SERIAL_EXECUTION_CONTEXT_H
#define VISSIM_SERIAL_EXECUTION_CONTEXT_H

#include <vissim/parallel/IExecutionContext.h>

namespace vissim {

namespace simulation {

/// @brief single process context
/// @details The coordinator is the only worker, messages are passed through.
class SerialExecutionContext : public IExecutionContext {
public:
   SerialExecutionContext();

   virtual int rank() const;

   virtual int nWorkers() const;

   virtual void scatter(const std::vector<Buffer> &shards, Buffer &local);

   virtual void gather(const Buffer &local, std::vector<Buffer> &all);

   /// @brief log the failure, the caller is expected to throw
   virtual void abort(const std::string &reason);

   /// @return true if abort has been called
   bool aborted() const { return itsAborted; }

private:
   bool itsAborted;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_SERIAL_EXECUTION_CONTEXT_H
