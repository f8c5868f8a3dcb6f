/// @file
///
/// @brief Execution context with workers running as threads of one process
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

#include <vissim/parallel/ThreadedExecutionContext.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>
#include <askap/askap/AskapLogging.h>

#include <boost/thread/thread.hpp>
#include <boost/bind.hpp>

#include <exception>

ASKAP_LOGGER(logger, ".parallel.threadedcontext");

namespace vissim {

namespace simulation {

namespace {

/// @brief thread entry point, failures are reported to the cluster
void runRank(const LocalCluster::ShPtr &cluster, int rank, const LocalCluster::RankBody &body)
{
  try {
     ThreadedExecutionContext context(cluster, rank);
     body(context);
  }
  catch (const std::exception &ex) {
     ASKAPLOG_ERROR_STR(logger, "Rank "<<rank<<" failed: "<<ex.what());
     cluster->abort(ex.what());
  }
}

} // anonymous namespace

LocalCluster::LocalCluster(int nWorkers) : itsNWorkers(nWorkers), itsShardsReady(false),
     itsResults(nWorkers > 0 ? nWorkers : 0), itsNResults(0), itsAborted(false)
{
  ASKAPCHECK(nWorkers > 0, "Number of workers should be positive, you have "<<nWorkers);
}

void LocalCluster::run(int nWorkers, const RankBody &body)
{
  const LocalCluster::ShPtr cluster(new LocalCluster(nWorkers));
  ASKAPLOG_DEBUG_STR(logger, "Starting "<<nWorkers<<" worker threads");
  boost::thread_group threads;
  for (int rank = 0; rank < nWorkers; ++rank) {
       threads.create_thread(boost::bind(runRank, cluster, rank, body));
  }
  threads.join_all();
  if (cluster->aborted()) {
      ASKAPTHROW(DistributedFailure, "Threaded job failed: "<<cluster->abortReason());
  }
}

void LocalCluster::checkNotAborted() const
{
  if (itsAborted) {
      ASKAPTHROW(DistributedFailure, "Job has been aborted: "<<itsAbortReason);
  }
}

void LocalCluster::putShards(const std::vector<IExecutionContext::Buffer> &shards)
{
  boost::unique_lock<boost::mutex> lock(itsMutex);
  checkNotAborted();
  ASKAPCHECK(int(shards.size()) == itsNWorkers, "Expect one shard per worker, you have "<<shards.size()<<
             " shards for "<<itsNWorkers<<" workers");
  itsShards = shards;
  itsShardsReady = true;
  itsCondition.notify_all();
}

void LocalCluster::getShard(int rank, IExecutionContext::Buffer &local)
{
  boost::unique_lock<boost::mutex> lock(itsMutex);
  while (!itsShardsReady && !itsAborted) {
         itsCondition.wait(lock);
  }
  checkNotAborted();
  ASKAPDEBUGASSERT(rank >= 0 && rank < int(itsShards.size()));
  local = itsShards[rank];
}

void LocalCluster::putResult(int rank, const IExecutionContext::Buffer &local)
{
  boost::unique_lock<boost::mutex> lock(itsMutex);
  checkNotAborted();
  ASKAPDEBUGASSERT(rank >= 0 && rank < itsNWorkers);
  itsResults[rank] = local;
  ++itsNResults;
  itsCondition.notify_all();
}

void LocalCluster::getResults(std::vector<IExecutionContext::Buffer> &all)
{
  boost::unique_lock<boost::mutex> lock(itsMutex);
  while (itsNResults < itsNWorkers && !itsAborted) {
         itsCondition.wait(lock);
  }
  checkNotAborted();
  all = itsResults;
}

void LocalCluster::abort(const std::string &reason)
{
  boost::unique_lock<boost::mutex> lock(itsMutex);
  if (!itsAborted) {
      itsAborted = true;
      itsAbortReason = reason;
  }
  itsCondition.notify_all();
}

bool LocalCluster::aborted() const
{
  boost::unique_lock<boost::mutex> lock(itsMutex);
  return itsAborted;
}

std::string LocalCluster::abortReason() const
{
  boost::unique_lock<boost::mutex> lock(itsMutex);
  return itsAbortReason;
}

ThreadedExecutionContext::ThreadedExecutionContext(const LocalCluster::ShPtr &cluster, int rank) :
     itsCluster(cluster), itsRank(rank)
{
  ASKAPCHECK(itsCluster, "Cluster is not defined");
  ASKAPCHECK(rank >= 0 && rank < itsCluster->nWorkers(), "Rank "<<rank<<" is outside the cluster of "<<
             itsCluster->nWorkers()<<" workers");
}

int ThreadedExecutionContext::rank() const
{
  return itsRank;
}

int ThreadedExecutionContext::nWorkers() const
{
  return itsCluster->nWorkers();
}

void ThreadedExecutionContext::scatter(const std::vector<Buffer> &shards, Buffer &local)
{
  if (isCoordinator()) {
      itsCluster->putShards(shards);
  }
  itsCluster->getShard(itsRank, local);
}

void ThreadedExecutionContext::gather(const Buffer &local, std::vector<Buffer> &all)
{
  itsCluster->putResult(itsRank, local);
  all.clear();
  if (isCoordinator()) {
      itsCluster->getResults(all);
  }
}

void ThreadedExecutionContext::abort(const std::string &reason)
{
  ASKAPLOG_ERROR_STR(logger, "Rank "<<itsRank<<" aborts the job: "<<reason);
  itsCluster->abort(reason);
}

} // namespace simulation

} // namespace vissim
