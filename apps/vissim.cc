/// @file vissim.cc
///
/// @brief Simulation of interferometer visibilities for a point source sky model
/// @details Reads the observation, sky model and beams from the parset, runs
/// the distributed simulation and reports the result. Run under mpirun to use
/// several MPI ranks, otherwise executor.mode selects a single process or
/// a number of threads.
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

// Include package level header file
#include <vissim/askap_vissim.h>

// System includes
#include <string>
#include <iostream>
#include <exception>

// Boost includes
#include <boost/shared_ptr.hpp>

// ASKAPsoft includes
#include <askap/askap/Application.h>
#include <askap/askap/AskapLogging.h>
#include <askap/askap/AskapError.h>
#include <askap/askapparallel/AskapParallel.h>
#include <Common/ParameterSet.h>

// Local package includes
#include <vissim/config/SimulationParset.h>
#include <vissim/parallel/DistributedExecutor.h>
#include <vissim/parallel/SerialExecutionContext.h>
#include <vissim/parallel/ThreadedExecutionContext.h>
#include <vissim/parallel/MPIExecutionContext.h>

using namespace askap;
using namespace vissim::simulation;

ASKAP_LOGGER(logger, ".vissim");

namespace {

/// @brief inputs and output of the job shared by all threads
struct ThreadedJob {
   ThreadedJob(const InstrumentGeometry &geometry, const std::vector<Source::ShPtr> &sources,
               const std::vector<IBeam::ShPtr> &beams, const TaskBuilder::BeamAssignment &assignment) :
       itsGeometry(geometry), itsSources(sources), itsBeams(beams), itsAssignment(assignment) {}

   void operator()(IExecutionContext &context)
   {
      DistributedExecutor executor(context);
      const boost::shared_ptr<VisibilityContainer> result = executor.run(itsGeometry, itsSources, itsBeams,
                                                                         itsAssignment);
      if (context.isCoordinator()) {
          *itsResult = result;
      }
   }

   const InstrumentGeometry &itsGeometry;
   const std::vector<Source::ShPtr> &itsSources;
   const std::vector<IBeam::ShPtr> &itsBeams;
   const TaskBuilder::BeamAssignment &itsAssignment;
   boost::shared_ptr<boost::shared_ptr<VisibilityContainer> > itsResult;
};

/// @brief log per channel summary of the simulated data
void logSummary(const VisibilityContainer &vis)
{
  for (casacore::uInt spw = 0; spw < vis.nSpw(); ++spw) {
       const casacore::Cube<casacore::DComplex> &data = vis.data(spw);
       for (casacore::uInt chan = 0; chan < vis.nChan(); ++chan) {
            double sumXX = 0.;
            double sumYY = 0.;
            for (casacore::uInt row = 0; row < vis.nRow(); ++row) {
                 sumXX += std::abs(data(row, chan, 0));
                 sumYY += std::abs(data(row, chan, 1));
            }
            const double norm = vis.nRow() > 0 ? 1. / vis.nRow() : 0.;
            ASKAPLOG_INFO_STR(logger, "spw "<<spw<<" channel "<<chan<<": mean |XX| = "<<sumXX * norm<<
                              ", mean |YY| = "<<sumYY * norm);
       }
  }
}

} // anonymous namespace

class VisSimApp : public askap::Application
{
    public:
        virtual int run(int argc, char* argv[])
        {
            askap::askapparallel::AskapParallel comms(argc, const_cast<const char **>(argv));

            try {
                const LOFAR::ParameterSet subset(config().makeSubset("Vissim."));
                const SimulationParset setup(subset);

                const InstrumentGeometry geometry = setup.geometry();
                const std::vector<Source::ShPtr> sources = setup.sources();
                const std::vector<IBeam::ShPtr> beams = setup.beams();
                const TaskBuilder::BeamAssignment assignment = setup.beamAssignment();

                boost::shared_ptr<VisibilityContainer> result;
                std::string mode = setup.executorMode();
                if (comms.isParallel()) {
                    mode = "mpi";
                }
                ASKAPLOG_INFO_STR(logger, "Running the simulation in "<<mode<<" mode");
                if (mode == "mpi") {
                    MPIExecutionContext context(comms);
                    DistributedExecutor executor(context);
                    result = executor.run(geometry, sources, beams, assignment);
                } else if (mode == "threads") {
                    ThreadedJob job(geometry, sources, beams, assignment);
                    job.itsResult.reset(new boost::shared_ptr<VisibilityContainer>());
                    LocalCluster::run(setup.nThreads(), job);
                    result = *job.itsResult;
                } else {
                    SerialExecutionContext context;
                    DistributedExecutor executor(context);
                    result = executor.run(geometry, sources, beams, assignment);
                }

                if (result) {
                    logSummary(*result);
                }
            } catch (const askap::AskapError& e) {
                ASKAPLOG_FATAL_STR(logger, "Askap error in " << argv[0] << ": " << e.what());
                std::cerr << "Askap error in " << argv[0] << ": " << e.what() << std::endl;
                comms.abort();
                return 1;
            } catch (const std::exception& e) {
                ASKAPLOG_FATAL_STR(logger, "Unexpected exception in " << argv[0] << ": " << e.what());
                std::cerr << "Unexpected exception in " << argv[0] << ": " << e.what()
                    << std::endl;
                comms.abort();
                return 1;
            }

            return 0;
        }

    private:
        std::string getVersion() const override {
            const std::string pkgVersion = std::string("vissim:") + ASKAP_PACKAGE_VERSION;
            return pkgVersion;
        }
};

int main(int argc, char *argv[])
{
    VisSimApp app;
    return app.main(argc, argv);
}
