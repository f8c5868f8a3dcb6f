/// @file
///
/// @brief Layout and sampling of the simulated observation
/// @details Holds the antenna table, the baseline-time rows (time and
/// antenna pair of every row) and the frequency grid. This is the input
/// normally read from a telescope layout and an observation template.
/// A single spectral window is supported.
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

#ifndef VISSIM_INSTRUMENT_GEOMETRY_H
#define VISSIM_INSTRUMENT_GEOMETRY_H

#include <casacore/casa/aips.h>
#include <casacore/casa/Arrays/Vector.h>
#include <casacore/measures/Measures/MEpoch.h>
#include <casacore/measures/Measures/MPosition.h>

#include <string>
#include <vector>

namespace vissim {

namespace simulation {

/// @brief antenna entry of the layout
struct AntennaRecord {
   std::string name;
   int number;
   /// @brief East, North, Up offsets in metres
   casacore::Vector<double> enu;
};

/// @brief geometry of the observation
class InstrumentGeometry {
public:
   /// @brief construct empty geometry
   /// @param[in] telescopeName telescope name
   /// @param[in] location array reference position
   InstrumentGeometry(const std::string &telescopeName, const casacore::MPosition &location);

   /// @brief add antenna to the layout
   /// @param[in] name antenna name
   /// @param[in] number antenna number
   /// @param[in] enu East, North, Up offsets in metres
   void addAntenna(const std::string &name, int number, const casacore::Vector<double> &enu);

   /// @brief add a baseline-time row
   /// @param[in] time time of the row
   /// @param[in] ant1 number of the first antenna
   /// @param[in] ant2 number of the second antenna
   void addRow(const casacore::MEpoch &time, int ant1, int ant2);

   /// @brief set frequency grid of the (only) spectral window
   /// @param[in] freqs channel frequencies in Hz
   void setFrequencies(const casacore::Vector<double> &freqs);

   /// @return telescope name
   const std::string& telescopeName() const { return itsTelescopeName; }

   /// @return array reference position
   const casacore::MPosition& location() const { return itsLocation; }

   /// @return antenna table
   const std::vector<AntennaRecord>& antennas() const { return itsAntennas; }

   /// @return number of baseline-time rows
   casacore::uInt nRow() const { return casacore::uInt(itsTimes.size()); }

   /// @return time of the given row
   const casacore::MEpoch& time(casacore::uInt row) const;

   /// @return first antenna number of the given row
   int antenna1(casacore::uInt row) const;

   /// @return second antenna number of the given row
   int antenna2(casacore::uInt row) const;

   /// @return channel frequencies in Hz
   const casacore::Vector<double>& frequencies() const { return itsFrequencies; }

   /// @return number of channels
   casacore::uInt nChan() const { return itsFrequencies.nelements(); }

   /// @return number of spectral windows, always 1
   casacore::uInt nSpw() const { return 1; }

   /// @brief index of the antenna with the given number in the antenna table
   /// @return index or -1 if there is no such antenna
   int antennaIndex(int number) const;

   /// @brief check consistency
   /// @details ConfigurationError is thrown if the layout is empty, antenna names
   /// or numbers are duplicated, a row refers to an unknown antenna or the frequency
   /// grid is empty or has non-positive values
   void check() const;

private:
   std::string itsTelescopeName;
   casacore::MPosition itsLocation;
   std::vector<AntennaRecord> itsAntennas;
   std::vector<casacore::MEpoch> itsTimes;
   std::vector<int> itsAntenna1;
   std::vector<int> itsAntenna2;
   casacore::Vector<double> itsFrequencies;
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_INSTRUMENT_GEOMETRY_H
