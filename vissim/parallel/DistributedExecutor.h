/// @file
///
/// @brief Distributed execution of the simulation
/// @details The job goes through the following states on every rank:
/// Idle, TasksBuilt, Partitioned (coordinator only), Computing,
/// LocallyReduced, Gathered, Merged (coordinator only) and Done.
/// The coordinator builds the task list and splits it into contiguous
/// near-equal shards, one per worker including itself. Shards are scattered,
/// every worker computes the visibilities of its tasks and sums them by the
/// output position. The partial sums are gathered on the coordinator and
/// added to the visibility buffer in rank order. Any failure on any rank
/// aborts the whole job, no partial result is returned.
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

#ifndef VISSIM_DISTRIBUTED_EXECUTOR_H
#define VISSIM_DISTRIBUTED_EXECUTOR_H

#include <vissim/parallel/IExecutionContext.h>
#include <vissim/engine/TaskBuilder.h>
#include <vissim/engine/InstrumentGeometry.h>
#include <vissim/engine/VisibilityContainer.h>
#include <vissim/messages/AccumulationTable.h>

#include <boost/shared_ptr.hpp>

#include <string>
#include <vector>

namespace vissim {

namespace simulation {

/// @brief executor of the simulation
class DistributedExecutor {
public:
   /// @brief states of the job
   enum State {
      Idle,
      TasksBuilt,
      Partitioned,
      Computing,
      LocallyReduced,
      Gathered,
      Merged,
      Done
   };

   /// @brief set up the executor
   /// @param[in] context communication layer, should outlive the executor
   explicit DistributedExecutor(IExecutionContext &context);

   /// @brief run the whole job
   /// @details Has to be called on every rank. Inputs are used on the coordinator
   /// only. DistributedFailure is thrown if any rank fails.
   /// @param[in] geometry layout and sampling of the observation
   /// @param[in] sources sky model
   /// @param[in] beams beam models
   /// @param[in] assignment beam index for each antenna name
   /// @return visibility buffer on the coordinator, empty pointer elsewhere
   boost::shared_ptr<VisibilityContainer> run(const InstrumentGeometry &geometry,
                                              const std::vector<Source::ShPtr> &sources,
                                              const std::vector<IBeam::ShPtr> &beams,
                                              const TaskBuilder::BeamAssignment &assignment = TaskBuilder::BeamAssignment());

   /// @brief run the whole job and merge the result into the given buffer
   /// @details Has to be called on every rank. On the coordinator the buffer should
   /// match the geometry, visibilities are added to its current content. Other ranks
   /// leave the buffer untouched.
   /// @param[in] geometry layout and sampling of the observation
   /// @param[in] sources sky model
   /// @param[in] beams beam models
   /// @param[in] assignment beam index for each antenna name
   /// @param[in] output visibility buffer to accumulate into
   void run(const InstrumentGeometry &geometry, const std::vector<Source::ShPtr> &sources,
            const std::vector<IBeam::ShPtr> &beams, const TaskBuilder::BeamAssignment &assignment,
            VisibilityContainer &output);

   /// @return current state
   State state() const { return itsState; }

   /// @return state name for logging
   static std::string stateName(State state);

   /// @brief sizes of the contiguous shards
   /// @details The first nTasks % nWorkers shards get one task more than the rest
   /// @param[in] nTasks total number of tasks
   /// @param[in] nWorkers number of workers
   /// @return number of tasks in each shard
   static std::vector<size_t> partitionSizes(size_t nTasks, int nWorkers);

   /// @brief split tasks into contiguous shards
   /// @param[in] tasks task list
   /// @param[in] nWorkers number of workers
   /// @return one shard per worker, some may be empty
   static std::vector<std::vector<UVTask> > partition(const std::vector<UVTask> &tasks, int nWorkers);

   /// @brief compute visibilities of the tasks and sum them by the output position
   /// @param[in] tasks tasks to compute, results are stored in the tasks
   /// @return table of partial sums
   static AccumulationTable computeShard(std::vector<UVTask> &tasks);

private:
   /// @brief change state and log the transition
   void setState(State state);

   /// @brief run the job and turn any failure into a job-wide abort
   /// @param[in] output buffer to merge into, used on the coordinator only
   void execute(const InstrumentGeometry &geometry, const std::vector<Source::ShPtr> &sources,
                const std::vector<IBeam::ShPtr> &beams, const TaskBuilder::BeamAssignment &assignment,
                VisibilityContainer *output);

   /// @brief actual job sequence, exceptions are handled by execute
   void doRun(const InstrumentGeometry &geometry, const std::vector<Source::ShPtr> &sources,
              const std::vector<IBeam::ShPtr> &beams, const TaskBuilder::BeamAssignment &assignment,
              VisibilityContainer *output);

   IExecutionContext &itsContext;
   State itsState;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_DISTRIBUTED_EXECUTOR_H
