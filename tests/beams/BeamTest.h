/// @file
///
/// @brief Tests of the analytic and tabulated beam models
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

#ifndef VISSIM_BEAM_TEST_H
#define VISSIM_BEAM_TEST_H

#include <vissim/beams/UniformBeam.h>
#include <vissim/beams/GaussianBeam.h>
#include <vissim/beams/AiryBeam.h>
#include <vissim/beams/TabulatedBeam.h>
#include <vissim/errors/SimulationErrors.h>

#include <cppunit/extensions/HelperMacros.h>

#include <casacore/casa/BasicSL/Constants.h>
#include <casacore/casa/Arrays/IPosition.h>

#include <boost/optional.hpp>

#include <cmath>
#include <vector>

namespace vissim {

namespace simulation {

class BeamTest : public CppUnit::TestFixture
{
   CPPUNIT_TEST_SUITE(BeamTest);
   CPPUNIT_TEST(testUniform);
   CPPUNIT_TEST(testGaussianSigma);
   CPPUNIT_TEST(testGaussianDiameter);
   CPPUNIT_TEST_EXCEPTION(testGaussianNoParameters, MissingParameter);
   CPPUNIT_TEST_EXCEPTION(testGaussianTooSmallDish, InvalidArgument);
   CPPUNIT_TEST(testAiry);
   CPPUNIT_TEST_EXCEPTION(testAiryNoDiameter, MissingParameter);
   CPPUNIT_TEST_EXCEPTION(testAiryBadDiameter, InvalidArgument);
   CPPUNIT_TEST(testVectorised);
   CPPUNIT_TEST_EXCEPTION(testVectorisedMismatch, InvalidArgument);
   CPPUNIT_TEST(testTabulatedInterpolation);
   CPPUNIT_TEST(testTabulatedAzimuthWrap);
   CPPUNIT_TEST(testTabulatedBeyondGrid);
   CPPUNIT_TEST_EXCEPTION(testTabulatedFrequencyRange, InvalidArgument);
   CPPUNIT_TEST_EXCEPTION(testTabulatedBadShape, InvalidArgument);
   CPPUNIT_TEST(testTabulatedPeakNormalise);
   CPPUNIT_TEST(testTabulatedCloneIsIndependent);
   CPPUNIT_TEST_SUITE_END();
public:

   /// @brief table with 2 points along each axis
   /// @details diagonal terms grow by 1 per zenith angle step and by 2 per
   /// frequency step, the (0,1) term is 10 times the azimuth index
   static TabulatedBeam makeTable() {
      casacore::Vector<double> az(2);
      az[0] = 0.;
      az[1] = casacore::C::pi;
      casacore::Vector<double> za(2);
      za[0] = 0.;
      za[1] = 0.5;
      casacore::Vector<double> freq(2);
      freq[0] = 100e6;
      freq[1] = 200e6;
      casacore::Array<casacore::DComplex> values(casacore::IPosition(5, 2, 2, 2, 2, 2), casacore::DComplex(0., 0.));
      for (int a = 0; a < 2; ++a) {
           for (int z = 0; z < 2; ++z) {
                for (int f = 0; f < 2; ++f) {
                     const casacore::DComplex diag(1. + z + 2. * f, 0.);
                     values(casacore::IPosition(5, 0, 0, a, z, f)) = diag;
                     values(casacore::IPosition(5, 1, 1, a, z, f)) = diag;
                     values(casacore::IPosition(5, 0, 1, a, z, f)) = casacore::DComplex(10. * a, 0.);
                }
           }
      }
      return TabulatedBeam(az, za, freq, values);
   }

   void testUniform() {
      UniformBeam beam;
      const IBeam::Jones jones = beam.evaluate(1., 1.2, 150e6);
      CPPUNIT_ASSERT(std::abs(jones(0, 0) - casacore::DComplex(1., 0.)) < 1e-15);
      CPPUNIT_ASSERT(std::abs(jones(1, 1) - casacore::DComplex(1., 0.)) < 1e-15);
      CPPUNIT_ASSERT(std::abs(jones(0, 1)) < 1e-15);
      CPPUNIT_ASSERT(std::abs(jones(1, 0)) < 1e-15);
      CPPUNIT_ASSERT(beam.isPeakNormalised());
      CPPUNIT_ASSERT_EQUAL(std::string("uniform"), beam.kind());
   }

   void testGaussianSigma() {
      const double sigma = 0.1;
      GaussianBeam beam(sigma, boost::none);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(1., beam.evaluate(0., 0., 150e6)(0, 0).real(), 1e-15);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(exp(-0.5), beam.evaluate(2., sigma, 150e6)(1, 1).real(), 1e-12);
      CPPUNIT_ASSERT(std::abs(beam.evaluate(2., sigma, 150e6)(0, 1)) < 1e-15);
      // width derived from the diameter is used if both are given
      GaussianBeam both(sigma, 14.);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(GaussianBeam::diameterToSigma(14., 100e6), both.sigma(100e6), 1e-15);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(GaussianBeam::diameterToSigma(14., 200e6), both.sigma(200e6), 1e-15);
      CPPUNIT_ASSERT(std::abs(both.sigma(100e6) - both.sigma(200e6)) > 1e-3);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(exp(-0.5), both.evaluate(0., both.sigma(150e6), 150e6)(0, 0).real(), 1e-12);
   }

   void testGaussianDiameter() {
      const double diameter = 14.;
      const double freq = 150e6;
      GaussianBeam beam(boost::none, diameter);
      const double expected = asin(2.2150894 * casacore::C::c / freq / (casacore::C::pi * diameter)) * 2. / 2.355;
      CPPUNIT_ASSERT_DOUBLES_EQUAL(expected, beam.sigma(freq), 1e-12);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(expected, GaussianBeam::diameterToSigma(diameter, freq), 1e-12);
      // beam gets narrower with frequency
      CPPUNIT_ASSERT(beam.sigma(2. * freq) < beam.sigma(freq));
      CPPUNIT_ASSERT_DOUBLES_EQUAL(exp(-0.5), beam.evaluate(0., expected, freq)(0, 0).real(), 1e-12);
   }

   void testGaussianNoParameters() {
      GaussianBeam beam(boost::none, boost::none);
   }

   void testGaussianTooSmallDish() {
      GaussianBeam beam(boost::none, 1.);
      beam.evaluate(0., 0.1, 100e6);
   }

   void testAiry() {
      CPPUNIT_ASSERT_DOUBLES_EQUAL(1., AiryBeam::airy(0.), 1e-15);
      // first null of J1
      CPPUNIT_ASSERT_DOUBLES_EQUAL(0., AiryBeam::airy(3.8317059702), 1e-9);
      CPPUNIT_ASSERT(AiryBeam::airy(1.) < 1.);
      const double diameter = 14.;
      const double freq = 150e6;
      AiryBeam beam(diameter);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(1., beam.evaluate(0., 0., freq)(0, 0).real(), 1e-15);
      const double za = asin(3.8317059702 * casacore::C::c / (casacore::C::pi * diameter * freq));
      CPPUNIT_ASSERT_DOUBLES_EQUAL(0., beam.evaluate(1., za, freq)(1, 1).real(), 1e-9);
      CPPUNIT_ASSERT(std::abs(beam.evaluate(1., 0.05, freq)(1, 0)) < 1e-15);
   }

   void testAiryNoDiameter() {
      AiryBeam beam((boost::optional<double>()));
   }

   void testAiryBadDiameter() {
      AiryBeam beam(-2.);
   }

   void testVectorised() {
      GaussianBeam beam(0.2, boost::none);
      casacore::Vector<double> az(3, 0.);
      casacore::Vector<double> za(3);
      za[0] = 0.;
      za[1] = 0.1;
      za[2] = 0.2;
      const std::vector<IBeam::Jones> result = beam.evaluate(az, za, 150e6);
      CPPUNIT_ASSERT_EQUAL(size_t(3), result.size());
      for (casacore::uInt i = 0; i < 3; ++i) {
           CPPUNIT_ASSERT(std::abs(result[i](0, 0) - beam.evaluate(az[i], za[i], 150e6)(0, 0)) < 1e-15);
      }
   }

   void testVectorisedMismatch() {
      UniformBeam beam;
      beam.evaluate(casacore::Vector<double>(3, 0.), casacore::Vector<double>(2, 0.), 150e6);
   }

   void testTabulatedInterpolation() {
      const TabulatedBeam beam = makeTable();
      CPPUNIT_ASSERT(beam.gridShape().isEqual(casacore::IPosition(3, 2, 2, 2)));
      CPPUNIT_ASSERT_EQUAL(std::string("tabulated"), beam.kind());
      CPPUNIT_ASSERT(!beam.isPeakNormalised());
      // grid points are reproduced exactly
      CPPUNIT_ASSERT_DOUBLES_EQUAL(1., beam.evaluate(0., 0., 100e6)(0, 0).real(), 1e-12);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(4., beam.evaluate(0., 0.5, 200e6)(1, 1).real(), 1e-12);
      // trilinear interpolation in the middle
      const IBeam::Jones mid = beam.evaluate(casacore::C::pi_2, 0.25, 150e6);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(2.5, mid(0, 0).real(), 1e-12);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(2.5, mid(1, 1).real(), 1e-12);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(5., mid(0, 1).real(), 1e-12);
      CPPUNIT_ASSERT(std::abs(mid(1, 0)) < 1e-15);
   }

   void testTabulatedAzimuthWrap() {
      const TabulatedBeam beam = makeTable();
      // the cell between pi and 2pi wraps to the first grid point
      CPPUNIT_ASSERT_DOUBLES_EQUAL(5., beam.evaluate(1.5 * casacore::C::pi, 0., 100e6)(0, 1).real(), 1e-12);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(5., beam.evaluate(-0.5 * casacore::C::pi, 0., 100e6)(0, 1).real(), 1e-12);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(0., beam.evaluate(casacore::C::_2pi, 0., 100e6)(0, 1).real(), 1e-12);
   }

   void testTabulatedBeyondGrid() {
      const TabulatedBeam beam = makeTable();
      const IBeam::Jones jones = beam.evaluate(0., 1., 150e6);
      for (casacore::uInt i = 0; i < 2; ++i) {
           for (casacore::uInt j = 0; j < 2; ++j) {
                CPPUNIT_ASSERT(std::abs(jones(i, j)) < 1e-15);
           }
      }
   }

   void testTabulatedFrequencyRange() {
      const TabulatedBeam beam = makeTable();
      beam.evaluate(0., 0., 250e6);
   }

   void testTabulatedBadShape() {
      casacore::Vector<double> axis(2);
      axis[0] = 0.;
      axis[1] = 1.;
      casacore::Array<casacore::DComplex> values(casacore::IPosition(5, 2, 2, 2, 3, 2), casacore::DComplex(1., 0.));
      TabulatedBeam beam(axis, axis, axis, values);
   }

   void testTabulatedPeakNormalise() {
      const TabulatedBeam beam = makeTable();
      IBeam::ShPtr copy = beam.clone();
      copy->peakNormalise();
      CPPUNIT_ASSERT(copy->isPeakNormalised());
      // each frequency plane is normalised separately
      CPPUNIT_ASSERT_DOUBLES_EQUAL(0.5, copy->evaluate(0., 0., 100e6)(0, 0).real(), 1e-12);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(1., copy->evaluate(0., 0.5, 100e6)(0, 0).real(), 1e-12);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(0.75, copy->evaluate(0., 0., 200e6)(1, 1).real(), 1e-12);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(1., copy->evaluate(0., 0.5, 200e6)(1, 1).real(), 1e-12);
      // the original is not affected
      CPPUNIT_ASSERT(!beam.isPeakNormalised());
      CPPUNIT_ASSERT_DOUBLES_EQUAL(1., beam.evaluate(0., 0., 100e6)(0, 0).real(), 1e-12);
   }

   void testTabulatedCloneIsIndependent() {
      TabulatedBeam beam = makeTable();
      const IBeam::ShPtr copy = beam.clone();
      beam.peakNormalise();
      CPPUNIT_ASSERT_DOUBLES_EQUAL(0.5, beam.evaluate(0., 0., 100e6)(0, 0).real(), 1e-12);
      CPPUNIT_ASSERT(!copy->isPeakNormalised());
      CPPUNIT_ASSERT_DOUBLES_EQUAL(1., copy->evaluate(0., 0., 100e6)(0, 0).real(), 1e-12);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(4., copy->evaluate(0., 0.5, 200e6)(1, 1).real(), 1e-12);
      CPPUNIT_ASSERT_DOUBLES_EQUAL(10., copy->evaluate(casacore::C::pi, 0., 100e6)(0, 1).real(), 1e-12);
      // a clone of a normalised beam keeps the flag
      CPPUNIT_ASSERT(beam.clone()->isPeakNormalised());
   }
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_BEAM_TEST_H
