/// @file
///
/// @brief Portion of the task list sent to a single worker
/// @details Tasks share sources, baselines and the telescope. The shard
/// writes each shared object once and refers to it by index from the tasks,
/// so the message doesn't grow with the number of tasks per source. Decoding
/// creates new objects, therefore every worker gets its own copy of the beam
/// models and of the source position caches.
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

#ifndef VISSIM_TASK_SHARD_H
#define VISSIM_TASK_SHARD_H

#include <vissim/engine/UVTask.h>

#include <askap/scimath/fitting/ISerializable.h>
#include <Blob/BlobOStream.h>
#include <Blob/BlobIStream.h>

#include <stdint.h>
#include <vector>

namespace vissim {

namespace simulation {

/// @brief shard of the task list
class TaskShard : public askap::ISerializable {
public:
   /// @brief empty shard
   TaskShard();

   /// @brief shard with the given tasks
   /// @details All tasks have to refer to the same telescope
   explicit TaskShard(const std::vector<UVTask> &tasks);

   /// @return tasks of this shard
   std::vector<UVTask>& tasks() { return itsTasks; }

   /// @return tasks of this shard
   const std::vector<UVTask>& tasks() const { return itsTasks; }

   /// @brief write the object to a blob stream
   /// @param[in] os the output stream
   virtual void writeToBlob(LOFAR::BlobOStream& os) const;

   /// @brief read the object from a blob stream
   /// @param[in] is the input stream
   virtual void readFromBlob(LOFAR::BlobIStream& is);

   /// @brief serialise into a byte buffer
   /// @param[out] buf buffer to fill
   void encode(std::vector<int8_t> &buf) const;

   /// @brief deserialise from a byte buffer
   /// @param[in] buf buffer written by encode
   void decode(const std::vector<int8_t> &buf);

private:
   std::vector<UVTask> itsTasks;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_TASK_SHARD_H
