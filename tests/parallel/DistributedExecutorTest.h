/// @file
///
/// @brief Tests of the distributed execution of the simulation
/// @details The threaded context is used to emulate several ranks in one process.
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

#ifndef VISSIM_DISTRIBUTED_EXECUTOR_TEST_H
#define VISSIM_DISTRIBUTED_EXECUTOR_TEST_H

#include <vissim/parallel/DistributedExecutor.h>
#include <vissim/parallel/SerialExecutionContext.h>
#include <vissim/parallel/ThreadedExecutionContext.h>
#include <vissim/beams/UniformBeam.h>
#include <vissim/beams/GaussianBeam.h>
#include <vissim/beams/TabulatedBeam.h>
#include <vissim/errors/SimulationErrors.h>
#include <SimulationTestHelpers.h>

#include <cppunit/extensions/HelperMacros.h>

#include <casacore/casa/Arrays/IPosition.h>
#include <casacore/casa/BasicSL/Constants.h>

#include <boost/shared_ptr.hpp>
#include <boost/optional.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace vissim {

namespace simulation {

/// @brief body executed by every rank of the threaded cluster
struct ExecutorJob {
   ExecutorJob(const InstrumentGeometry &geometry, const std::vector<Source::ShPtr> &sources,
               const std::vector<IBeam::ShPtr> &beams) :
       itsGeometry(geometry), itsSources(sources), itsBeams(beams),
       itsResult(new boost::shared_ptr<VisibilityContainer>()) {}

   void operator()(IExecutionContext &context)
   {
      DistributedExecutor executor(context);
      const boost::shared_ptr<VisibilityContainer> result = executor.run(itsGeometry, itsSources, itsBeams);
      if (context.isCoordinator()) {
          *itsResult = result;
      }
   }

   const InstrumentGeometry &itsGeometry;
   const std::vector<Source::ShPtr> &itsSources;
   const std::vector<IBeam::ShPtr> &itsBeams;
   boost::shared_ptr<boost::shared_ptr<VisibilityContainer> > itsResult;
};

/// @brief rank body merging into a buffer allocated up front
struct BufferJob {
   BufferJob(const InstrumentGeometry &geometry, const std::vector<Source::ShPtr> &sources,
             const std::vector<IBeam::ShPtr> &beams) :
       itsGeometry(geometry), itsSources(sources), itsBeams(beams),
       itsOutput(new VisibilityContainer(VisibilityContainer::fromGeometry(geometry))) {}

   void operator()(IExecutionContext &context)
   {
      DistributedExecutor executor(context);
      executor.run(itsGeometry, itsSources, itsBeams, TaskBuilder::BeamAssignment(), *itsOutput);
   }

   const InstrumentGeometry &itsGeometry;
   const std::vector<Source::ShPtr> &itsSources;
   const std::vector<IBeam::ShPtr> &itsBeams;
   boost::shared_ptr<VisibilityContainer> itsOutput;
};

class DistributedExecutorTest : public CppUnit::TestFixture
{
   CPPUNIT_TEST_SUITE(DistributedExecutorTest);
   CPPUNIT_TEST(testPartitionSizes);
   CPPUNIT_TEST(testPartition);
   CPPUNIT_TEST(testSerialRun);
   CPPUNIT_TEST(testOrderIndependence);
   CPPUNIT_TEST(testThreadedRun);
   CPPUNIT_TEST(testMoreWorkersThanTasks);
   CPPUNIT_TEST(testWorkersNormaliseOwnBeams);
   CPPUNIT_TEST(testMergeIntoSuppliedBuffer);
   CPPUNIT_TEST(testThreadedMergeIntoSuppliedBuffer);
   CPPUNIT_TEST_EXCEPTION(testSuppliedBufferMismatch, DistributedFailure);
   CPPUNIT_TEST(testStateNames);
   CPPUNIT_TEST(testSerialFailure);
   CPPUNIT_TEST_EXCEPTION(testThreadedFailure, DistributedFailure);
   CPPUNIT_TEST_EXCEPTION(testConfigurationFailure, DistributedFailure);
   CPPUNIT_TEST_SUITE_END();
public:

   void setUp() {
      itsSources.clear();
      itsSources.push_back(testutils::zenithSource("first"));
      itsSources.push_back(testutils::horizonSource("second", 1., 1., 2., 0.1, 0.2, 0.3));
      itsSources.push_back(testutils::horizonSource("third", 4., 0.5, 0.5));
      itsSources.push_back(testutils::horizonSource("set", 4., -0.5, 10.));
      itsBeams.assign(1, IBeam::ShPtr(new GaussianBeam(0.5, boost::none)));
   }

   /// @brief beam table which covers the first two channels of the test geometry only
   static IBeam::ShPtr narrowBandBeam() {
      casacore::Vector<double> az(1, 0.);
      casacore::Vector<double> za(2);
      za[0] = 0.;
      za[1] = casacore::C::pi_2;
      casacore::Vector<double> freq(2);
      freq[0] = 150e6;
      freq[1] = 151e6;
      casacore::Array<casacore::DComplex> values(casacore::IPosition(5, 2, 2, 1, 2, 2), casacore::DComplex(0., 0.));
      for (int z = 0; z < 2; ++z) {
           for (int f = 0; f < 2; ++f) {
                values(casacore::IPosition(5, 0, 0, 0, z, f)) = casacore::DComplex(1., 0.);
                values(casacore::IPosition(5, 1, 1, 0, z, f)) = casacore::DComplex(1., 0.);
           }
      }
      return IBeam::ShPtr(new TabulatedBeam(az, za, freq, values));
   }

   /// @brief flat beam table with the feed response of 2, not normalised
   static IBeam::ShPtr flatBeam() {
      casacore::Vector<double> az(1, 0.);
      casacore::Vector<double> za(2);
      za[0] = 0.;
      za[1] = casacore::C::pi_2;
      casacore::Vector<double> freq(2);
      freq[0] = 100e6;
      freq[1] = 200e6;
      casacore::Array<casacore::DComplex> values(casacore::IPosition(5, 2, 2, 1, 2, 2), casacore::DComplex(0., 0.));
      for (int z = 0; z < 2; ++z) {
           for (int f = 0; f < 2; ++f) {
                values(casacore::IPosition(5, 0, 0, 0, z, f)) = casacore::DComplex(2., 0.);
                values(casacore::IPosition(5, 1, 1, 0, z, f)) = casacore::DComplex(2., 0.);
           }
      }
      return IBeam::ShPtr(new TabulatedBeam(az, za, freq, values));
   }

   void testPartitionSizes() {
      std::vector<size_t> sizes = DistributedExecutor::partitionSizes(10, 3);
      CPPUNIT_ASSERT_EQUAL(size_t(3), sizes.size());
      CPPUNIT_ASSERT_EQUAL(size_t(4), sizes[0]);
      CPPUNIT_ASSERT_EQUAL(size_t(3), sizes[1]);
      CPPUNIT_ASSERT_EQUAL(size_t(3), sizes[2]);
      sizes = DistributedExecutor::partitionSizes(2, 4);
      CPPUNIT_ASSERT_EQUAL(size_t(4), sizes.size());
      CPPUNIT_ASSERT_EQUAL(size_t(1), sizes[0]);
      CPPUNIT_ASSERT_EQUAL(size_t(1), sizes[1]);
      CPPUNIT_ASSERT_EQUAL(size_t(0), sizes[2]);
      CPPUNIT_ASSERT_EQUAL(size_t(0), sizes[3]);
      sizes = DistributedExecutor::partitionSizes(0, 2);
      CPPUNIT_ASSERT_EQUAL(size_t(0), sizes[0] + sizes[1]);
   }

   void testPartition() {
      const std::vector<UVTask> tasks = TaskBuilder::buildTasks(testutils::testGeometry(3, 1, 2), itsSources, itsBeams);
      const std::vector<std::vector<UVTask> > shards = DistributedExecutor::partition(tasks, 5);
      CPPUNIT_ASSERT_EQUAL(size_t(5), shards.size());
      // contiguous slices in the original order
      size_t index = 0;
      for (size_t worker = 0; worker < shards.size(); ++worker) {
           CPPUNIT_ASSERT_EQUAL(DistributedExecutor::partitionSizes(tasks.size(), 5)[worker], shards[worker].size());
           for (size_t i = 0; i < shards[worker].size(); ++i, ++index) {
                CPPUNIT_ASSERT(shards[worker][i].destination == tasks[index].destination);
                CPPUNIT_ASSERT(shards[worker][i].source == tasks[index].source);
           }
      }
      CPPUNIT_ASSERT_EQUAL(tasks.size(), index);
   }

   void testSerialRun() {
      const InstrumentGeometry geometry = testutils::testGeometry(3, 2, 2);
      SerialExecutionContext context;
      DistributedExecutor executor(context);
      CPPUNIT_ASSERT(executor.state() == DistributedExecutor::Idle);
      const boost::shared_ptr<VisibilityContainer> result = executor.run(geometry, itsSources, itsBeams);
      CPPUNIT_ASSERT(executor.state() == DistributedExecutor::Done);
      CPPUNIT_ASSERT(result);
      CPPUNIT_ASSERT_EQUAL(geometry.nRow(), result->nRow());
      CPPUNIT_ASSERT_EQUAL(geometry.nChan(), result->nChan());

      // the same sum computed directly
      std::vector<UVTask> tasks = TaskBuilder::buildTasks(geometry, itsSources, itsBeams);
      VisibilityContainer expected = VisibilityContainer::fromGeometry(geometry);
      DistributedExecutor::computeShard(tasks).addTo(expected);
      compare(expected, *result, 1e-12);
      // the zenith source dominates, the one below the horizon contributes nothing
      CPPUNIT_ASSERT(std::abs(result->visibility(DestinationIndex(0, 0, 0))(0)) > 0.1);
      CPPUNIT_ASSERT(!context.aborted());
   }

   void testOrderIndependence() {
      const InstrumentGeometry geometry = testutils::testGeometry(3, 2, 2);
      std::vector<UVTask> tasks = TaskBuilder::buildTasks(geometry, itsSources, itsBeams);
      VisibilityContainer forward = VisibilityContainer::fromGeometry(geometry);
      DistributedExecutor::computeShard(tasks).addTo(forward);

      std::vector<UVTask> reversed = TaskBuilder::buildTasks(geometry, itsSources, itsBeams);
      std::reverse(reversed.begin(), reversed.end());
      VisibilityContainer backward = VisibilityContainer::fromGeometry(geometry);
      // two halves reduced separately and merged in the opposite order
      std::vector<std::vector<UVTask> > halves = DistributedExecutor::partition(reversed, 2);
      AccumulationTable table = DistributedExecutor::computeShard(halves[1]);
      table.merge(DistributedExecutor::computeShard(halves[0]));
      table.addTo(backward);
      compare(forward, backward, 1e-12);
   }

   void testThreadedRun() {
      const InstrumentGeometry geometry = testutils::testGeometry(4, 3, 3);
      SerialExecutionContext context;
      const boost::shared_ptr<VisibilityContainer> serial = DistributedExecutor(context).run(geometry, itsSources,
                                                                                              itsBeams);
      CPPUNIT_ASSERT(serial);

      ExecutorJob job(geometry, itsSources, itsBeams);
      LocalCluster::run(3, job);
      CPPUNIT_ASSERT(*job.itsResult);
      compare(*serial, **job.itsResult, 1e-12);
   }

   void testMoreWorkersThanTasks() {
      const InstrumentGeometry geometry = testutils::testGeometry(2, 1, 1);
      std::vector<Source::ShPtr> sources(1, testutils::zenithSource());
      ExecutorJob job(geometry, sources, itsBeams);
      LocalCluster::run(4, job);
      CPPUNIT_ASSERT(*job.itsResult);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(0.5, (*job.itsResult)->visibility(DestinationIndex(0, 0, 0))(0).real(), 1e-3);
   }

   void testWorkersNormaliseOwnBeams() {
      const InstrumentGeometry geometry = testutils::testGeometry(3, 2, 2);
      // normalised flat table is the identity, i.e. the same as the uniform beam
      const std::vector<IBeam::ShPtr> uniform(1, IBeam::ShPtr(new UniformBeam));
      SerialExecutionContext reference;
      const boost::shared_ptr<VisibilityContainer> expected = DistributedExecutor(reference).run(geometry,
                                                                  itsSources, uniform);
      CPPUNIT_ASSERT(expected);

      const std::vector<IBeam::ShPtr> beams(1, flatBeam());
      SerialExecutionContext context;
      const boost::shared_ptr<VisibilityContainer> serial = DistributedExecutor(context).run(geometry, itsSources,
                                                                                              beams);
      CPPUNIT_ASSERT(serial);
      compare(*expected, *serial, 1e-12);

      ExecutorJob job(geometry, itsSources, beams);
      LocalCluster::run(3, job);
      CPPUNIT_ASSERT(*job.itsResult);
      compare(*expected, **job.itsResult, 1e-12);

      // workers normalised their own copies, the beam of the caller is intact
      CPPUNIT_ASSERT(!beams[0]->isPeakNormalised());
      CPPUNIT_ASSERT_DOUBLES_EQUAL(2., beams[0]->evaluate(0., 0.3, 150e6)(0, 0).real(), 1e-12);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(2., beams[0]->evaluate(0., 0.3, 150e6)(1, 1).real(), 1e-12);
   }

   void testMergeIntoSuppliedBuffer() {
      const InstrumentGeometry geometry = testutils::testGeometry(3, 2, 2);
      SerialExecutionContext reference;
      const boost::shared_ptr<VisibilityContainer> expected = DistributedExecutor(reference).run(geometry,
                                                                  itsSources, itsBeams);
      CPPUNIT_ASSERT(expected);

      VisibilityContainer output = VisibilityContainer::fromGeometry(geometry);
      const DestinationIndex index(1, 0, 1);
      Visibility offset;
      offset(0) = casacore::DComplex(1., 2.);
      offset(1) = casacore::DComplex(-3., 0.5);
      offset(2) = casacore::DComplex(0., 0.);
      offset(3) = casacore::DComplex(0.25, -1.);
      output.add(index, offset);

      SerialExecutionContext context;
      DistributedExecutor executor(context);
      executor.run(geometry, itsSources, itsBeams, TaskBuilder::BeamAssignment(), output);
      CPPUNIT_ASSERT(executor.state() == DistributedExecutor::Done);
      // previous content is kept, simulated visibilities are added to it
      expected->add(index, offset);
      compare(*expected, output, 1e-12);
   }

   void testThreadedMergeIntoSuppliedBuffer() {
      const InstrumentGeometry geometry = testutils::testGeometry(4, 2, 2);
      SerialExecutionContext reference;
      const boost::shared_ptr<VisibilityContainer> expected = DistributedExecutor(reference).run(geometry,
                                                                  itsSources, itsBeams);
      CPPUNIT_ASSERT(expected);

      BufferJob job(geometry, itsSources, itsBeams);
      LocalCluster::run(3, job);
      compare(*expected, *job.itsOutput, 1e-12);
   }

   void testSuppliedBufferMismatch() {
      const InstrumentGeometry geometry = testutils::testGeometry(3, 2, 2);
      VisibilityContainer output(geometry.nRow(), 1, geometry.nChan() + 1);
      SerialExecutionContext context;
      DistributedExecutor(context).run(geometry, itsSources, itsBeams, TaskBuilder::BeamAssignment(), output);
   }

   void testStateNames() {
      CPPUNIT_ASSERT_EQUAL(std::string("Idle"), DistributedExecutor::stateName(DistributedExecutor::Idle));
      CPPUNIT_ASSERT_EQUAL(std::string("LocallyReduced"),
                           DistributedExecutor::stateName(DistributedExecutor::LocallyReduced));
      CPPUNIT_ASSERT_EQUAL(std::string("Done"), DistributedExecutor::stateName(DistributedExecutor::Done));
   }

   void testSerialFailure() {
      itsBeams.assign(1, narrowBandBeam());
      SerialExecutionContext context;
      DistributedExecutor executor(context);
      bool failed = false;
      try {
         executor.run(testutils::testGeometry(2, 1, 3), itsSources, itsBeams);
      }
      catch (const DistributedFailure &) {
         failed = true;
      }
      CPPUNIT_ASSERT(failed);
      CPPUNIT_ASSERT(context.aborted());
      CPPUNIT_ASSERT(executor.state() == DistributedExecutor::Computing);
   }

   void testThreadedFailure() {
      itsBeams.assign(1, narrowBandBeam());
      const InstrumentGeometry geometry = testutils::testGeometry(3, 2, 3);
      ExecutorJob job(geometry, itsSources, itsBeams);
      // the last channel goes to the last rank
      LocalCluster::run(3, job);
   }

   void testConfigurationFailure() {
      // two beams without assignment
      itsBeams.push_back(IBeam::ShPtr(new UniformBeam));
      SerialExecutionContext context;
      DistributedExecutor(context).run(testutils::testGeometry(), itsSources, itsBeams);
   }

private:
   static void compare(const VisibilityContainer &expected, const VisibilityContainer &result, double tolerance) {
      CPPUNIT_ASSERT_EQUAL(expected.nRow(), result.nRow());
      CPPUNIT_ASSERT_EQUAL(expected.nChan(), result.nChan());
      CPPUNIT_ASSERT_EQUAL(expected.nSpw(), result.nSpw());
      for (casacore::uInt row = 0; row < expected.nRow(); ++row) {
           for (casacore::uInt chan = 0; chan < expected.nChan(); ++chan) {
                const DestinationIndex index(row, 0, chan);
                const Visibility vis1 = expected.visibility(index);
                const Visibility vis2 = result.visibility(index);
                for (casacore::Int pol = 0; pol < 4; ++pol) {
                     CPPUNIT_ASSERT_DOUBLES_EQUAL(vis1(pol).real(), vis2(pol).real(), tolerance);
                     CPPUNIT_ASSERT_DOUBLES_EQUAL(vis1(pol).imag(), vis2(pol).imag(), tolerance);
                }
           }
      }
   }

   std::vector<Source::ShPtr> itsSources;
   std::vector<IBeam::ShPtr> itsBeams;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_DISTRIBUTED_EXECUTOR_TEST_H
