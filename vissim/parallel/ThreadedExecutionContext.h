/// @file
///
/// @brief Execution context with workers running as threads of one process
/// @details All ranks share a LocalCluster which holds the message slots and
/// the synchronisation primitives. This context is used for multi-core runs
/// without MPI and in the tests of the distributed protocol.
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

#ifndef VISSIM_THREADED_EXECUTION_CONTEXT_H
#define VISSIM_THREADED_EXECUTION_CONTEXT_H

#include <vissim/parallel/IExecutionContext.h>

#include <boost/thread/mutex.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/function.hpp>
#include <boost/shared_ptr.hpp>

#include <string>
#include <vector>

namespace vissim {

namespace simulation {

/// @brief state shared by the ranks of a threaded job
class LocalCluster {
public:
   /// @brief shared pointer type
   typedef boost::shared_ptr<LocalCluster> ShPtr;

   /// @brief body executed by every rank
   typedef boost::function<void(IExecutionContext&)> RankBody;

   /// @brief set up the cluster
   /// @param[in] nWorkers number of ranks, including the coordinator
   explicit LocalCluster(int nWorkers);

   /// @return number of ranks
   int nWorkers() const { return itsNWorkers; }

   /// @brief run the body in nWorkers threads and wait for all of them
   /// @details If any rank fails, DistributedFailure is thrown after all threads
   /// have finished.
   /// @param[in] nWorkers number of ranks
   /// @param[in] body function to execute, gets the context of its rank
   static void run(int nWorkers, const RankBody &body);

   /// @brief coordinator side of scatter
   void putShards(const std::vector<IExecutionContext::Buffer> &shards);

   /// @brief wait for the shard of the given rank
   void getShard(int rank, IExecutionContext::Buffer &local);

   /// @brief deposit the message of the given rank for gather
   void putResult(int rank, const IExecutionContext::Buffer &local);

   /// @brief wait until all ranks deposited their messages
   void getResults(std::vector<IExecutionContext::Buffer> &all);

   /// @brief mark the job as failed and release all waiting ranks
   void abort(const std::string &reason);

   /// @return true if the job has been aborted
   bool aborted() const;

   /// @return reason of the first abort
   std::string abortReason() const;

private:
   /// @brief throw DistributedFailure if the job has been aborted, mutex must be held
   void checkNotAborted() const;

   const int itsNWorkers;
   mutable boost::mutex itsMutex;
   boost::condition_variable itsCondition;
   std::vector<IExecutionContext::Buffer> itsShards;
   bool itsShardsReady;
   std::vector<IExecutionContext::Buffer> itsResults;
   int itsNResults;
   bool itsAborted;
   std::string itsAbortReason;
};

/// @brief context of a single rank of the threaded job
class ThreadedExecutionContext : public IExecutionContext {
public:
   /// @brief set up the context
   /// @param[in] cluster shared state of the job
   /// @param[in] rank rank of this thread
   ThreadedExecutionContext(const LocalCluster::ShPtr &cluster, int rank);

   virtual int rank() const;

   virtual int nWorkers() const;

   virtual void scatter(const std::vector<Buffer> &shards, Buffer &local);

   virtual void gather(const Buffer &local, std::vector<Buffer> &all);

   virtual void abort(const std::string &reason);

private:
   LocalCluster::ShPtr itsCluster;
   const int itsRank;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_THREADED_EXECUTION_CONTEXT_H
