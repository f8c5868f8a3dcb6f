/// @file
///
/// @brief Tests of the point source
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

#ifndef VISSIM_SOURCE_TEST_H
#define VISSIM_SOURCE_TEST_H

#include <vissim/sky/Source.h>
#include <vissim/coordinates/CoordinateUtils.h>
#include <vissim/errors/SimulationErrors.h>
#include <SimulationTestHelpers.h>

#include <cppunit/extensions/HelperMacros.h>

#include <casacore/casa/BasicSL/Constants.h>

#include <boost/optional.hpp>

#include <cmath>

namespace vissim {

namespace simulation {

class SourceTest : public CppUnit::TestFixture
{
   CPPUNIT_TEST_SUITE(SourceTest);
   CPPUNIT_TEST_EXCEPTION(testWrongAngleUnits, InvalidArgument);
   CPPUNIT_TEST_EXCEPTION(testWrongFrequencyUnits, InvalidArgument);
   CPPUNIT_TEST(testCoherency);
   CPPUNIT_TEST(testZenithDirectionCosines);
   CPPUNIT_TEST(testBelowHorizon);
   CPPUNIT_TEST(testPositionCache);
   CPPUNIT_TEST(testUnpolarisedLocalCoherency);
   CPPUNIT_TEST(testPolarisedLocalCoherency);
   CPPUNIT_TEST_SUITE_END();
public:
   void setUp() {
      itsStokes.resize(4);
      itsStokes[0] = 1.;
      itsStokes[1] = 0.2;
      itsStokes[2] = 0.3;
      itsStokes[3] = 0.1;
   }

   void testWrongAngleUnits() {
      Source src("bad", casacore::Quantity(1., "Hz"), casacore::Quantity(0., "rad"), casacore::Quantity(150., "MHz"),
                 itsStokes);
   }

   void testWrongFrequencyUnits() {
      Source src("bad", casacore::Quantity(1., "rad"), casacore::Quantity(0., "rad"), casacore::Quantity(150., "deg"),
                 itsStokes);
   }

   void testCoherency() {
      const Source src("pol", casacore::Quantity(10., "deg"), casacore::Quantity(-20., "deg"),
                       casacore::Quantity(150., "MHz"), itsStokes);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(10. * casacore::C::degree, src.ra(), 1e-15);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(-20. * casacore::C::degree, src.dec(), 1e-15);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(150e6, src.frequency(), 1e-6);
      CPPUNIT_ASSERT(src.isPolarised());
      const casacore::Matrix<casacore::DComplex> &c = src.coherency();
      CPPUNIT_ASSERT(std::abs(c(0, 0) - casacore::DComplex(0.6, 0.)) < 1e-15);
      CPPUNIT_ASSERT(std::abs(c(1, 1) - casacore::DComplex(0.4, 0.)) < 1e-15);
      CPPUNIT_ASSERT(std::abs(c(0, 1) - casacore::DComplex(0.15, -0.05)) < 1e-15);
      CPPUNIT_ASSERT(std::abs(c(1, 0) - casacore::DComplex(0.15, 0.05)) < 1e-15);
   }

   void testZenithDirectionCosines() {
      const Source::ShPtr src = testutils::zenithSource();
      const boost::optional<DirectionCosines> lmn = src->directionCosines(testutils::testEpoch(),
                                                                         testutils::testLocation());
      CPPUNIT_ASSERT(lmn);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(0., lmn->l, 1e-5);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(0., lmn->m, 1e-5);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(1., lmn->n, 1e-5);
   }

   void testBelowHorizon() {
      const Source::ShPtr src = testutils::horizonSource("nadir", 0., -casacore::C::pi_2);
      CPPUNIT_ASSERT(!src->azZa(testutils::testEpoch(), testutils::testLocation()));
      CPPUNIT_ASSERT(!src->directionCosines(testutils::testEpoch(), testutils::testLocation()));
   }

   void testPositionCache() {
      const Source::ShPtr src = testutils::horizonSource("east", casacore::C::pi_2, casacore::C::pi / 4.);
      const casacore::MPosition location = testutils::testLocation();
      const boost::optional<HorizonPosition> first = src->azZa(testutils::testEpoch(), location);
      CPPUNIT_ASSERT(first);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(casacore::C::pi / 4., first->za, 1e-6);
      // one hour later the source is higher up, the cache has to be refreshed
      const boost::optional<HorizonPosition> later = src->azZa(testutils::testEpoch(3600.), location);
      CPPUNIT_ASSERT(later);
      CPPUNIT_ASSERT(later->za < first->za - 0.1);
      // and back again
      const boost::optional<HorizonPosition> again = src->azZa(testutils::testEpoch(), location);
      CPPUNIT_ASSERT(again);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(first->za, again->za, 1e-12);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(first->az, again->az, 1e-12);
   }

   void testUnpolarisedLocalCoherency() {
      const Source::ShPtr src = testutils::zenithSource("zenith", 2.);
      CPPUNIT_ASSERT(!src->isPolarised());
      const casacore::Matrix<casacore::DComplex> local = src->localCoherency(testutils::testEpoch(),
                                                                            testutils::testLocation());
      for (casacore::uInt i = 0; i < 2; ++i) {
           for (casacore::uInt j = 0; j < 2; ++j) {
                CPPUNIT_ASSERT(std::abs(local(i, j) - src->coherency()(i, j)) < 1e-15);
           }
      }
   }

   void testPolarisedLocalCoherency() {
      const Source::ShPtr src = testutils::horizonSource("pol", 1., 0.7, 1., 0.2, 0.3, 0.1);
      const casacore::Matrix<casacore::DComplex> local = src->localCoherency(testutils::testEpoch(),
                                                                            testutils::testLocation());
      // rotation with a real matrix keeps the coherency hermitian
      CPPUNIT_ASSERT(std::abs(local(0, 1) - std::conj(local(1, 0))) < 1e-12);
      CPPUNIT_ASSERT(std::abs(local(0, 0).imag()) < 1e-12);
      CPPUNIT_ASSERT(std::abs(local(1, 1).imag()) < 1e-12);
      // and the rotated matrix differs from the equatorial one
      CPPUNIT_ASSERT(std::abs(local(0, 0) - src->coherency()(0, 0)) > 1e-6);
      // rotation uses the apparent hour angle and the catalogue declination
      const double ha = hourAngle(src->ra(), src->dec(), testutils::testEpoch(), testutils::testLocation());
      const casacore::Matrix<double> rot = parallacticRotation(src->dec(), ha,
                                                               geodeticLatitude(testutils::testLocation()));
      const casacore::Matrix<casacore::DComplex> expected = rotateCoherency(src->coherency(), rot);
      for (casacore::uInt i = 0; i < 2; ++i) {
           for (casacore::uInt j = 0; j < 2; ++j) {
                CPPUNIT_ASSERT(std::abs(local(i, j) - expected(i, j)) < 1e-12);
           }
      }
   }

private:
   casacore::Vector<double> itsStokes;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_SOURCE_TEST_H
