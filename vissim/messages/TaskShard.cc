/// @file
///
/// @brief Portion of the task list sent to a single worker
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

#include <vissim/messages/TaskShard.h>
#include <vissim/beams/BeamFactory.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>

#include <casacore/casa/Quanta/MVPosition.h>
#include <casacore/casa/Quanta/MVEpoch.h>
#include <casacore/measures/Measures/MCPosition.h>
#include <casacore/measures/Measures/MeasConvert.h>

#include <Blob/BlobIBufVector.h>
#include <Blob/BlobOBufVector.h>
#include <Common/LofarTypes.h>

#include <map>

namespace vissim {

namespace simulation {

// increment the number when format changes
#define VISSIM_TASK_SHARD_STREAM_VERSION 1

namespace {

/// @brief index of the object in the list of distinct objects, adds it if necessary
template<typename T>
LOFAR::TYPES::uint32 objectIndex(const boost::shared_ptr<T> &obj, std::map<const T*, LOFAR::TYPES::uint32> &known,
                                 std::vector<boost::shared_ptr<T> > &distinct)
{
  typename std::map<const T*, LOFAR::TYPES::uint32>::const_iterator ci = known.find(obj.get());
  if (ci != known.end()) {
      return ci->second;
  }
  const LOFAR::TYPES::uint32 index = static_cast<LOFAR::TYPES::uint32>(distinct.size());
  known[obj.get()] = index;
  distinct.push_back(obj);
  return index;
}

void writeEpoch(LOFAR::BlobOStream &os, const casacore::MEpoch &epoch)
{
  os << epoch.getValue().get() << static_cast<LOFAR::TYPES::uint32>(epoch.getRef().getType());
}

casacore::MEpoch readEpoch(LOFAR::BlobIStream &is)
{
  double mjd = 0.;
  LOFAR::TYPES::uint32 type = 0;
  is >> mjd >> type;
  return casacore::MEpoch(casacore::MVEpoch(mjd), casacore::MEpoch::Ref(type));
}

} // anonymous namespace

TaskShard::TaskShard() {}

TaskShard::TaskShard(const std::vector<UVTask> &tasks) : itsTasks(tasks)
{
  for (std::vector<UVTask>::const_iterator ci = itsTasks.begin(); ci != itsTasks.end(); ++ci) {
       ASKAPCHECK(ci->telescope == itsTasks.front().telescope, "All tasks of the shard should refer to the same telescope");
  }
}

void TaskShard::writeToBlob(LOFAR::BlobOStream& os) const
{
  os.putStart("TaskShard", VISSIM_TASK_SHARD_STREAM_VERSION);
  os << static_cast<LOFAR::TYPES::uint64>(itsTasks.size());
  if (itsTasks.size() > 0) {
      // telescope, location is passed in ITRF
      const Telescope &telescope = *itsTasks.front().telescope;
      const casacore::MPosition itrf = casacore::MPosition::Convert(telescope.location(), casacore::MPosition::ITRF)();
      const casacore::Vector<double> xyz = itrf.getValue().getValue();
      os << telescope.name() << xyz[0] << xyz[1] << xyz[2];
      os << static_cast<LOFAR::TYPES::uint32>(telescope.nBeams());
      for (size_t beam = 0; beam < telescope.nBeams(); ++beam) {
           BeamFactory::write(os, telescope.beam(int(beam)));
      }

      std::map<const Source*, LOFAR::TYPES::uint32> knownSources;
      std::vector<Source::ShPtr> sources;
      std::map<const Antenna*, LOFAR::TYPES::uint32> knownAntennas;
      std::vector<Antenna::ShPtr> antennas;
      std::map<const Baseline*, LOFAR::TYPES::uint32> knownBaselines;
      std::vector<Baseline::ShPtr> baselines;
      std::vector<LOFAR::TYPES::uint32> taskSources;
      std::vector<LOFAR::TYPES::uint32> taskBaselines;
      taskSources.reserve(itsTasks.size());
      taskBaselines.reserve(itsTasks.size());
      for (std::vector<UVTask>::const_iterator ci = itsTasks.begin(); ci != itsTasks.end(); ++ci) {
           taskSources.push_back(objectIndex(ci->source, knownSources, sources));
           taskBaselines.push_back(objectIndex(ci->baseline, knownBaselines, baselines));
      }
      std::vector<LOFAR::TYPES::uint32> baselineAnt1;
      std::vector<LOFAR::TYPES::uint32> baselineAnt2;
      for (std::vector<Baseline::ShPtr>::const_iterator ci = baselines.begin(); ci != baselines.end(); ++ci) {
           baselineAnt1.push_back(objectIndex((*ci)->antenna1Ptr(), knownAntennas, antennas));
           baselineAnt2.push_back(objectIndex((*ci)->antenna2Ptr(), knownAntennas, antennas));
      }

      os << static_cast<LOFAR::TYPES::uint32>(sources.size());
      for (std::vector<Source::ShPtr>::const_iterator ci = sources.begin(); ci != sources.end(); ++ci) {
           (*ci)->writeToBlob(os);
      }
      os << static_cast<LOFAR::TYPES::uint32>(antennas.size());
      for (std::vector<Antenna::ShPtr>::const_iterator ci = antennas.begin(); ci != antennas.end(); ++ci) {
           const casacore::Vector<double> &enu = (*ci)->positionENU();
           os << (*ci)->name() << static_cast<LOFAR::TYPES::int32>((*ci)->number()) << enu[0] << enu[1] << enu[2] <<
                 static_cast<LOFAR::TYPES::int32>((*ci)->beamId());
      }
      os << static_cast<LOFAR::TYPES::uint32>(baselines.size());
      for (size_t bl = 0; bl < baselines.size(); ++bl) {
           os << baselineAnt1[bl] << baselineAnt2[bl];
      }
      for (size_t task = 0; task < itsTasks.size(); ++task) {
           const UVTask &t = itsTasks[task];
           os << taskSources[task] << taskBaselines[task] << t.freq;
           writeEpoch(os, t.time);
           os << static_cast<LOFAR::TYPES::uint32>(t.destination.blt) << static_cast<LOFAR::TYPES::uint32>(t.destination.spw) <<
                 static_cast<LOFAR::TYPES::uint32>(t.destination.chan);
      }
  }
  os.putEnd();
}

void TaskShard::readFromBlob(LOFAR::BlobIStream& is)
{
  const int version = is.getStart("TaskShard");
  ASKAPCHECK(version == VISSIM_TASK_SHARD_STREAM_VERSION,
       "Attempting to read from a blob stream an object of the wrong version, expected "<<VISSIM_TASK_SHARD_STREAM_VERSION<<
       " got "<<version);
  itsTasks.clear();
  LOFAR::TYPES::uint64 nTasks = 0;
  is >> nTasks;
  if (nTasks > 0) {
      std::string name;
      double x = 0., y = 0., z = 0.;
      is >> name >> x >> y >> z;
      const casacore::MPosition location(casacore::MVPosition(x, y, z), casacore::MPosition::ITRF);
      LOFAR::TYPES::uint32 nBeams = 0;
      is >> nBeams;
      std::vector<IBeam::ShPtr> beams;
      for (LOFAR::TYPES::uint32 beam = 0; beam < nBeams; ++beam) {
           beams.push_back(BeamFactory::read(is));
      }
      const Telescope::ShPtr telescope(new Telescope(name, location, beams));

      LOFAR::TYPES::uint32 nSources = 0;
      is >> nSources;
      std::vector<Source::ShPtr> sources;
      for (LOFAR::TYPES::uint32 src = 0; src < nSources; ++src) {
           const Source::ShPtr source(new Source);
           source->readFromBlob(is);
           sources.push_back(source);
      }
      LOFAR::TYPES::uint32 nAntennas = 0;
      is >> nAntennas;
      std::vector<Antenna::ShPtr> antennas;
      for (LOFAR::TYPES::uint32 ant = 0; ant < nAntennas; ++ant) {
           std::string antName;
           LOFAR::TYPES::int32 number = 0;
           LOFAR::TYPES::int32 beamId = 0;
           casacore::Vector<double> enu(3, 0.);
           is >> antName >> number >> enu[0] >> enu[1] >> enu[2] >> beamId;
           antennas.push_back(Antenna::ShPtr(new Antenna(antName, number, enu, beamId)));
      }
      LOFAR::TYPES::uint32 nBaselines = 0;
      is >> nBaselines;
      std::vector<Baseline::ShPtr> baselines;
      for (LOFAR::TYPES::uint32 bl = 0; bl < nBaselines; ++bl) {
           LOFAR::TYPES::uint32 ant1 = 0;
           LOFAR::TYPES::uint32 ant2 = 0;
           is >> ant1 >> ant2;
           ASKAPCHECK(ant1 < antennas.size() && ant2 < antennas.size(), "Corrupted task shard, antenna index is out of range");
           baselines.push_back(Baseline::ShPtr(new Baseline(antennas[ant1], antennas[ant2])));
      }
      itsTasks.reserve(nTasks);
      for (LOFAR::TYPES::uint64 task = 0; task < nTasks; ++task) {
           LOFAR::TYPES::uint32 srcIndex = 0;
           LOFAR::TYPES::uint32 blIndex = 0;
           double freq = 0.;
           is >> srcIndex >> blIndex >> freq;
           const casacore::MEpoch time = readEpoch(is);
           LOFAR::TYPES::uint32 blt = 0, spw = 0, chan = 0;
           is >> blt >> spw >> chan;
           ASKAPCHECK(srcIndex < sources.size() && blIndex < baselines.size(),
                      "Corrupted task shard, source or baseline index is out of range");
           itsTasks.push_back(UVTask(sources[srcIndex], time, freq, baselines[blIndex], telescope,
                                     DestinationIndex(blt, spw, chan)));
      }
  }
  is.getEnd();
}

void TaskShard::encode(std::vector<int8_t> &buf) const
{
  buf.clear();
  LOFAR::BlobOBufVector<int8_t> bv(buf);
  LOFAR::BlobOStream out(bv);
  out.putStart("Message", 1);
  writeToBlob(out);
  out.putEnd();
}

void TaskShard::decode(const std::vector<int8_t> &buf)
{
  LOFAR::BlobIBufVector<int8_t> bv(buf);
  LOFAR::BlobIStream in(bv);
  const int version = in.getStart("Message");
  ASKAPCHECK(version == 1, "Unexpected version of the task shard message: "<<version);
  readFromBlob(in);
  in.getEnd();
}

} // namespace simulation

} // namespace vissim
