/// @file
///
/// @brief Partial sums of visibilities keyed by the output position
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

#include <vissim/messages/AccumulationTable.h>

#include <askap/askap/AskapError.h>

#include <Blob/BlobIBufVector.h>
#include <Blob/BlobOBufVector.h>
#include <Common/LofarTypes.h>

namespace vissim {

namespace simulation {

// increment the number when format changes
#define VISSIM_ACCUMULATION_TABLE_STREAM_VERSION 1

void AccumulationTable::add(const DestinationIndex &index, const Visibility &vis)
{
  MapType::iterator it = itsTable.find(index);
  if (it == itsTable.end()) {
      itsTable.insert(std::make_pair(index, vis));
  } else {
      it->second += vis;
  }
}

void AccumulationTable::merge(const AccumulationTable &other)
{
  for (MapType::const_iterator ci = other.itsTable.begin(); ci != other.itsTable.end(); ++ci) {
       add(ci->first, ci->second);
  }
}

void AccumulationTable::addTo(VisibilityContainer &container) const
{
  for (MapType::const_iterator ci = itsTable.begin(); ci != itsTable.end(); ++ci) {
       container.add(ci->first, ci->second);
  }
}

void AccumulationTable::writeToBlob(LOFAR::BlobOStream& os) const
{
  os.putStart("AccumulationTable", VISSIM_ACCUMULATION_TABLE_STREAM_VERSION);
  os << static_cast<LOFAR::TYPES::uint64>(itsTable.size());
  for (MapType::const_iterator ci = itsTable.begin(); ci != itsTable.end(); ++ci) {
       os << static_cast<LOFAR::TYPES::uint32>(ci->first.blt) << static_cast<LOFAR::TYPES::uint32>(ci->first.spw) <<
             static_cast<LOFAR::TYPES::uint32>(ci->first.chan);
       for (casacore::Int pol = 0; pol < 4; ++pol) {
            os << ci->second(pol);
       }
  }
  os.putEnd();
}

void AccumulationTable::readFromBlob(LOFAR::BlobIStream& is)
{
  const int version = is.getStart("AccumulationTable");
  ASKAPCHECK(version == VISSIM_ACCUMULATION_TABLE_STREAM_VERSION,
       "Attempting to read from a blob stream an object of the wrong version, expected "<<VISSIM_ACCUMULATION_TABLE_STREAM_VERSION<<
       " got "<<version);
  itsTable.clear();
  LOFAR::TYPES::uint64 nEntries = 0;
  is >> nEntries;
  for (LOFAR::TYPES::uint64 entry = 0; entry < nEntries; ++entry) {
       LOFAR::TYPES::uint32 blt = 0, spw = 0, chan = 0;
       is >> blt >> spw >> chan;
       Visibility vis;
       for (casacore::Int pol = 0; pol < 4; ++pol) {
            is >> vis(pol);
       }
       itsTable[DestinationIndex(blt, spw, chan)] = vis;
  }
  is.getEnd();
}

void AccumulationTable::encode(std::vector<int8_t> &buf) const
{
  buf.clear();
  LOFAR::BlobOBufVector<int8_t> bv(buf);
  LOFAR::BlobOStream out(bv);
  out.putStart("Message", 1);
  writeToBlob(out);
  out.putEnd();
}

void AccumulationTable::decode(const std::vector<int8_t> &buf)
{
  LOFAR::BlobIBufVector<int8_t> bv(buf);
  LOFAR::BlobIStream in(bv);
  const int version = in.getStart("Message");
  ASKAPCHECK(version == 1, "Unexpected version of the accumulation table message: "<<version);
  readFromBlob(in);
  in.getEnd();
}

} // namespace simulation

} // namespace vissim
