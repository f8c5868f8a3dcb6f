/// @file
///
/// @brief Helper functions shared by the unit tests
/// @details Array location and epoch roughly correspond to HERA, the zenith
/// source is obtained by converting the local zenith to ICRS.
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

#ifndef VISSIM_SIMULATION_TEST_HELPERS_H
#define VISSIM_SIMULATION_TEST_HELPERS_H

#include <vissim/sky/Source.h>
#include <vissim/engine/InstrumentGeometry.h>

#include <casacore/casa/BasicSL/Constants.h>
#include <casacore/casa/Quanta/Quantum.h>
#include <casacore/casa/Quanta/MVPosition.h>
#include <casacore/measures/Measures/MDirection.h>
#include <casacore/measures/Measures/MCDirection.h>
#include <casacore/measures/Measures/MEpoch.h>
#include <casacore/measures/Measures/MPosition.h>
#include <casacore/measures/Measures/MeasConvert.h>
#include <casacore/measures/Measures/MeasFrame.h>

#include <string>

namespace vissim {

namespace simulation {

namespace testutils {

/// @brief array location, latitude -30.72 deg
inline casacore::MPosition testLocation()
{
  return casacore::MPosition(casacore::MVPosition(casacore::Quantity(1073., "m"), casacore::Quantity(21.4283, "deg"),
                             casacore::Quantity(-30.7215, "deg")), casacore::MPosition::Ref(casacore::MPosition::WGS84));
}

/// @brief observation epoch, UTC
inline casacore::MEpoch testEpoch(double offsetInSeconds = 0.)
{
  return casacore::MEpoch(casacore::Quantity(58178.5 + offsetInSeconds / 86400., "d"),
                          casacore::MEpoch::Ref(casacore::MEpoch::UTC));
}

/// @brief ICRS direction of the given horizontal position
/// @param[in] az azimuth, radians
/// @param[in] el elevation, radians
inline casacore::MVDirection horizonToICRS(double az, double el, const casacore::MEpoch &epoch,
                                           const casacore::MPosition &location)
{
  casacore::MeasFrame frame(location, epoch);
  return casacore::MDirection::Convert(casacore::MDirection(casacore::MVDirection(az, el),
             casacore::MDirection::Ref(casacore::MDirection::AZEL, frame)),
             casacore::MDirection::Ref(casacore::MDirection::ICRS))().getValue();
}

/// @brief source at the given horizontal position
inline Source::ShPtr horizonSource(const std::string &name, double az, double el, double flux = 1.,
                                   double q = 0., double u = 0., double v = 0.)
{
  const casacore::MVDirection dir = horizonToICRS(az, el, testEpoch(), testLocation());
  casacore::Vector<double> stokes(4);
  stokes[0] = flux;
  stokes[1] = q;
  stokes[2] = u;
  stokes[3] = v;
  return Source::ShPtr(new Source(name, casacore::Quantity(dir.getLong(), "rad"), casacore::Quantity(dir.getLat(), "rad"),
                                  casacore::Quantity(150., "MHz"), stokes));
}

/// @brief unpolarised source at zenith of the test location at the test epoch
inline Source::ShPtr zenithSource(const std::string &name = "zenith", double flux = 1.)
{
  return horizonSource(name, 0., casacore::C::pi_2, flux);
}

/// @brief east-west position vector
inline casacore::Vector<double> enu(double east, double north = 0., double up = 0.)
{
  casacore::Vector<double> result(3);
  result[0] = east;
  result[1] = north;
  result[2] = up;
  return result;
}

/// @brief small array with cross-correlations only
/// @param[in] nAnt number of antennas, spaced by 5 m to the East
/// @param[in] nTimes number of integrations, 10 s apart
/// @param[in] nChan number of channels starting from 150 MHz, 1 MHz apart
inline InstrumentGeometry testGeometry(int nAnt = 2, int nTimes = 1, int nChan = 1)
{
  InstrumentGeometry geometry("test", testLocation());
  for (int ant = 0; ant < nAnt; ++ant) {
       geometry.addAntenna("ant" + std::string(1, char('0' + ant)), ant, enu(5. * ant));
  }
  for (int time = 0; time < nTimes; ++time) {
       for (int ant1 = 0; ant1 < nAnt; ++ant1) {
            for (int ant2 = ant1 + 1; ant2 < nAnt; ++ant2) {
                 geometry.addRow(testEpoch(10. * time), ant1, ant2);
            }
       }
  }
  casacore::Vector<double> freqs(nChan);
  for (int chan = 0; chan < nChan; ++chan) {
       freqs[chan] = 150e6 + 1e6 * chan;
  }
  geometry.setFrequencies(freqs);
  return geometry;
}

} // namespace testutils

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_SIMULATION_TEST_HELPERS_H
