/// @file
///
/// @brief Distributed execution of the simulation
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

#include <vissim/parallel/DistributedExecutor.h>
#include <vissim/messages/TaskShard.h>
#include <vissim/engine/UVEngine.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>
#include <askap/askap/AskapLogging.h>

#include <casacore/casa/OS/Timer.h>

#include <exception>

ASKAP_LOGGER(logger, ".parallel.distributedexecutor");

namespace vissim {

namespace simulation {

DistributedExecutor::DistributedExecutor(IExecutionContext &context) : itsContext(context), itsState(Idle)
{
  ASKAPCHECK(itsContext.nWorkers() > 0, "Number of workers should be positive");
}

std::string DistributedExecutor::stateName(State state)
{
  switch (state) {
     case Idle : return "Idle";
     case TasksBuilt : return "TasksBuilt";
     case Partitioned : return "Partitioned";
     case Computing : return "Computing";
     case LocallyReduced : return "LocallyReduced";
     case Gathered : return "Gathered";
     case Merged : return "Merged";
     case Done : return "Done";
  }
  ASKAPTHROW(askap::AskapError, "Unknown executor state "<<int(state));
}

void DistributedExecutor::setState(State state)
{
  ASKAPLOG_DEBUG_STR(logger, "Rank "<<itsContext.rank()<<": "<<stateName(itsState)<<" -> "<<stateName(state));
  itsState = state;
}

std::vector<size_t> DistributedExecutor::partitionSizes(size_t nTasks, int nWorkers)
{
  ASKAPCHECK(nWorkers > 0, "Number of workers should be positive, you have "<<nWorkers);
  const size_t base = nTasks / size_t(nWorkers);
  const size_t extra = nTasks % size_t(nWorkers);
  std::vector<size_t> sizes(nWorkers, base);
  for (size_t worker = 0; worker < extra; ++worker) {
       ++sizes[worker];
  }
  return sizes;
}

std::vector<std::vector<UVTask> > DistributedExecutor::partition(const std::vector<UVTask> &tasks, int nWorkers)
{
  const std::vector<size_t> sizes = partitionSizes(tasks.size(), nWorkers);
  std::vector<std::vector<UVTask> > shards(nWorkers);
  std::vector<UVTask>::const_iterator start = tasks.begin();
  for (int worker = 0; worker < nWorkers; ++worker) {
       const std::vector<UVTask>::const_iterator stop = start + sizes[worker];
       shards[worker].assign(start, stop);
       start = stop;
  }
  ASKAPDEBUGASSERT(start == tasks.end());
  return shards;
}

AccumulationTable DistributedExecutor::computeShard(std::vector<UVTask> &tasks)
{
  AccumulationTable table;
  for (std::vector<UVTask>::iterator it = tasks.begin(); it != tasks.end(); ++it) {
       UVEngine engine(*it);
       engine.updateTask();
       ASKAPDEBUGASSERT(it->visibility);
       table.add(it->destination, *(it->visibility));
  }
  return table;
}

boost::shared_ptr<VisibilityContainer> DistributedExecutor::run(const InstrumentGeometry &geometry,
                                                                const std::vector<Source::ShPtr> &sources,
                                                                const std::vector<IBeam::ShPtr> &beams,
                                                                const TaskBuilder::BeamAssignment &assignment)
{
  boost::shared_ptr<VisibilityContainer> result;
  if (itsContext.isCoordinator()) {
      result.reset(new VisibilityContainer(VisibilityContainer::fromGeometry(geometry)));
  }
  execute(geometry, sources, beams, assignment, result.get());
  return result;
}

void DistributedExecutor::run(const InstrumentGeometry &geometry, const std::vector<Source::ShPtr> &sources,
                              const std::vector<IBeam::ShPtr> &beams, const TaskBuilder::BeamAssignment &assignment,
                              VisibilityContainer &output)
{
  execute(geometry, sources, beams, assignment, &output);
}

void DistributedExecutor::execute(const InstrumentGeometry &geometry, const std::vector<Source::ShPtr> &sources,
                                  const std::vector<IBeam::ShPtr> &beams,
                                  const TaskBuilder::BeamAssignment &assignment, VisibilityContainer *output)
{
  try {
     doRun(geometry, sources, beams, assignment, output);
  }
  catch (const DistributedFailure &df) {
     // another rank has already aborted the job
     ASKAPLOG_ERROR_STR(logger, "Rank "<<itsContext.rank()<<" stops in state "<<stateName(itsState)<<": "<<df.what());
     throw;
  }
  catch (const std::exception &ex) {
     ASKAPLOG_ERROR_STR(logger, "Rank "<<itsContext.rank()<<" failed in state "<<stateName(itsState)<<": "<<ex.what());
     itsContext.abort(ex.what());
     ASKAPTHROW(DistributedFailure, "Rank "<<itsContext.rank()<<" failed in state "<<stateName(itsState)<<
                ": "<<ex.what());
  }
}

void DistributedExecutor::doRun(const InstrumentGeometry &geometry, const std::vector<Source::ShPtr> &sources,
                                const std::vector<IBeam::ShPtr> &beams, const TaskBuilder::BeamAssignment &assignment,
                                VisibilityContainer *output)
{
  itsState = Idle;
  const int nWorkers = itsContext.nWorkers();
  std::vector<IExecutionContext::Buffer> shardBuffers;
  if (itsContext.isCoordinator()) {
      ASKAPCHECK(output, "Output buffer is required on the coordinator");
      if (output->nRow() != geometry.nRow() || output->nSpw() != geometry.nSpw() ||
          output->nChan() != geometry.nChan()) {
          ASKAPTHROW(InvalidArgument, "Output buffer of "<<output->nRow()<<" rows, "<<output->nSpw()<<
                     " spectral windows and "<<output->nChan()<<" channels doesn't match the geometry of "<<
                     geometry.nRow()<<" rows, "<<geometry.nSpw()<<" spectral windows and "<<geometry.nChan()<<
                     " channels");
      }
      const std::vector<UVTask> tasks = TaskBuilder::buildTasks(geometry, sources, beams, assignment);
      setState(TasksBuilt);
      const std::vector<std::vector<UVTask> > shards = partition(tasks, nWorkers);
      shardBuffers.resize(shards.size());
      for (size_t worker = 0; worker < shards.size(); ++worker) {
           TaskShard(shards[worker]).encode(shardBuffers[worker]);
           ASKAPLOG_DEBUG_STR(logger, "Shard "<<worker<<" has "<<shards[worker].size()<<" tasks, "<<
                              shardBuffers[worker].size()<<" bytes");
      }
      setState(Partitioned);
  } else {
      setState(TasksBuilt);
  }

  // barrier 1
  IExecutionContext::Buffer localBuffer;
  itsContext.scatter(shardBuffers, localBuffer);
  shardBuffers.clear();
  setState(Computing);

  TaskShard shard;
  shard.decode(localBuffer);
  casacore::Timer timer;
  timer.mark();
  const AccumulationTable table = computeShard(shard.tasks());
  ASKAPLOG_INFO_STR(logger, "Rank "<<itsContext.rank()<<" computed "<<shard.tasks().size()<<" tasks in "<<
                    timer.real()<<" seconds, "<<table.size()<<" distinct samples");
  setState(LocallyReduced);

  // barrier 2
  IExecutionContext::Buffer tableBuffer;
  table.encode(tableBuffer);
  std::vector<IExecutionContext::Buffer> allTables;
  itsContext.gather(tableBuffer, allTables);
  setState(Gathered);

  if (itsContext.isCoordinator()) {
      ASKAPCHECK(int(allTables.size()) == nWorkers, "Expect results from "<<nWorkers<<" workers, got "<<allTables.size());
      // decode everything first, so a corrupted message leaves the buffer intact
      std::vector<AccumulationTable> workerTables(allTables.size());
      for (size_t worker = 0; worker < allTables.size(); ++worker) {
           workerTables[worker].decode(allTables[worker]);
      }
      for (size_t worker = 0; worker < workerTables.size(); ++worker) {
           workerTables[worker].addTo(*output);
      }
      setState(Merged);
  }
  setState(Done);
}

} // namespace simulation

} // namespace vissim
