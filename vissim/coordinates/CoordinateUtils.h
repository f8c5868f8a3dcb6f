/// @file
///
/// @brief Coordinate and polarisation frame utilities
/// @details Conversion of the equatorial source position to the local
/// horizontal frame of the array, hour angle and parallactic rotation of
/// the coherency matrix. All conversions go through casacore measures, so
/// every worker of a distributed job uses the same astrometric model.
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

#ifndef VISSIM_COORDINATE_UTILS_H
#define VISSIM_COORDINATE_UTILS_H

#include <casacore/casa/aips.h>
#include <casacore/casa/Arrays/Matrix.h>
#include <casacore/measures/Measures/MEpoch.h>
#include <casacore/measures/Measures/MPosition.h>

namespace vissim {

namespace simulation {

/// @brief position of the source in the local horizontal frame
/// @details azimuth is counted from North through East, zenith angle
/// from the local vertical. Both are in radians.
struct HorizonPosition {
   double az;
   double za;
};

/// @brief apparent hour angle and declination, radians
struct ApparentPosition {
   double ha;
   double dec;
};

/// @brief convert ICRS direction to azimuth and zenith angle
/// @param[in] ra right ascension (radians, ICRS)
/// @param[in] dec declination (radians, ICRS)
/// @param[in] epoch time of observation
/// @param[in] location array reference position
/// @return azimuth (North through East, in [0,2pi)) and zenith angle
HorizonPosition equatorialToHorizon(double ra, double dec, const casacore::MEpoch &epoch,
                                    const casacore::MPosition &location);

/// @brief apparent hour angle and declination
/// @details ICRS direction is converted to the HADEC frame at the given epoch and
/// location, i.e. the hour angle is the local apparent sidereal time minus the
/// apparent right ascension.
/// @param[in] ra right ascension (radians, ICRS)
/// @param[in] dec declination (radians, ICRS)
/// @param[in] epoch time of observation
/// @param[in] location array reference position
/// @return apparent hour angle and declination, radians
ApparentPosition apparentHourAngleDec(double ra, double dec, const casacore::MEpoch &epoch,
                                      const casacore::MPosition &location);

/// @brief apparent hour angle
/// @details see apparentHourAngleDec, declination is required for the apparent place
double hourAngle(double ra, double dec, const casacore::MEpoch &epoch,
                 const casacore::MPosition &location);

/// @brief geodetic (WGS84) latitude of the location in radians
double geodeticLatitude(const casacore::MPosition &location);

/// @brief geodetic (WGS84) longitude of the location in radians
double geodeticLongitude(const casacore::MPosition &location);

/// @brief rotation from the equatorial to the local polarisation frame
/// @details Returns [[cosX, sinX], [-sinX, cosX]] with sinX = sin(ha) and
/// cosX = tan(lat) cos(dec) - sin(dec) cos(ha). The matrix is not normalised,
/// so it is only approximately orthonormal.
/// @param[in] dec apparent declination (radians)
/// @param[in] ha apparent hour angle (radians)
/// @param[in] latitude geodetic latitude of the array (radians)
/// @return 2x2 real matrix
casacore::Matrix<double> parallacticRotation(double dec, double ha, double latitude);

/// @brief 2x2 identity used for unpolarised sources
casacore::Matrix<double> unitRotation();

/// @brief rotate coherency matrix
/// @param[in] coherency 2x2 coherency in the equatorial frame
/// @param[in] rotation 2x2 rotation matrix R
/// @return R^T C R
casacore::Matrix<casacore::DComplex> rotateCoherency(const casacore::Matrix<casacore::DComplex> &coherency,
                                                     const casacore::Matrix<double> &rotation);

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_COORDINATE_UTILS_H
