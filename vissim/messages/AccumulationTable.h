/// @file
///
/// @brief Partial sums of visibilities keyed by the output position
/// @details Every worker accumulates the visibilities of its tasks in such a
/// table, so only one value per touched sample has to be sent back to the
/// coordinator.
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

#ifndef VISSIM_ACCUMULATION_TABLE_H
#define VISSIM_ACCUMULATION_TABLE_H

#include <vissim/engine/VisTypes.h>
#include <vissim/engine/VisibilityContainer.h>

#include <askap/scimath/fitting/ISerializable.h>
#include <Blob/BlobOStream.h>
#include <Blob/BlobIStream.h>

#include <stdint.h>
#include <map>
#include <vector>

namespace vissim {

namespace simulation {

/// @brief table of partial sums
class AccumulationTable : public askap::ISerializable {
public:
   typedef std::map<DestinationIndex, Visibility> MapType;

   /// @brief add visibility to the entry, the entry is created if necessary
   void add(const DestinationIndex &index, const Visibility &vis);

   /// @brief add all entries of another table
   void merge(const AccumulationTable &other);

   /// @brief add all entries to the visibility buffer
   void addTo(VisibilityContainer &container) const;

   /// @return number of entries
   size_t size() const { return itsTable.size(); }

   /// @return entries
   const MapType& entries() const { return itsTable; }

   /// @brief write the object to a blob stream
   /// @param[in] os the output stream
   virtual void writeToBlob(LOFAR::BlobOStream& os) const;

   /// @brief read the object from a blob stream
   /// @param[in] is the input stream
   virtual void readFromBlob(LOFAR::BlobIStream& is);

   /// @brief serialise into a byte buffer
   void encode(std::vector<int8_t> &buf) const;

   /// @brief deserialise from a byte buffer
   void decode(const std::vector<int8_t> &buf);

private:
   MapType itsTable;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_ACCUMULATION_TABLE_H
