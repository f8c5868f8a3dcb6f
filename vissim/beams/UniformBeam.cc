/// @file
///
/// @brief Beam with unit response in all directions
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

#include <vissim/beams/UniformBeam.h>

#include <askap/askap/AskapError.h>

namespace vissim {

namespace simulation {

// increment the number when format changes
#define VISSIM_UNIFORM_BEAM_STREAM_VERSION 1

IBeam::Jones UniformBeam::evaluate(double, double, double) const
{
  return diagonalJones(1.);
}

bool UniformBeam::isPeakNormalised() const
{
  return true;
}

void UniformBeam::peakNormalise() {}

IBeam::ShPtr UniformBeam::clone() const
{
  return IBeam::ShPtr(new UniformBeam(*this));
}

std::string UniformBeam::kind() const
{
  return "uniform";
}

void UniformBeam::writeToBlob(LOFAR::BlobOStream& os) const
{
  os.putStart("UniformBeam", VISSIM_UNIFORM_BEAM_STREAM_VERSION);
  os.putEnd();
}

void UniformBeam::readFromBlob(LOFAR::BlobIStream& is)
{
  const int version = is.getStart("UniformBeam");
  ASKAPCHECK(version == VISSIM_UNIFORM_BEAM_STREAM_VERSION,
       "Attempting to read from a blob stream an object of the wrong version, expected "<<VISSIM_UNIFORM_BEAM_STREAM_VERSION<<
       " got "<<version);
  is.getEnd();
}

} // namespace simulation

} // namespace vissim
