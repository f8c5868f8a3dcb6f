/// @file
///
/// @brief Layout and sampling of the simulated observation
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

#include <vissim/engine/InstrumentGeometry.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>

#include <set>

namespace vissim {

namespace simulation {

InstrumentGeometry::InstrumentGeometry(const std::string &telescopeName, const casacore::MPosition &location) :
     itsTelescopeName(telescopeName), itsLocation(location) {}

void InstrumentGeometry::addAntenna(const std::string &name, int number, const casacore::Vector<double> &enu)
{
  if (enu.nelements() != 3) {
      ASKAPTHROW(ConfigurationError, "Antenna "<<name<<": position should have 3 elements, you have "<<enu.nelements());
  }
  AntennaRecord record;
  record.name = name;
  record.number = number;
  record.enu = enu.copy();
  itsAntennas.push_back(record);
}

void InstrumentGeometry::addRow(const casacore::MEpoch &time, int ant1, int ant2)
{
  itsTimes.push_back(time);
  itsAntenna1.push_back(ant1);
  itsAntenna2.push_back(ant2);
}

void InstrumentGeometry::setFrequencies(const casacore::Vector<double> &freqs)
{
  itsFrequencies.resize(freqs.nelements());
  itsFrequencies = freqs;
}

const casacore::MEpoch& InstrumentGeometry::time(casacore::uInt row) const
{
  ASKAPCHECK(row < itsTimes.size(), "Row "<<row<<" is outside the range of "<<itsTimes.size()<<" rows");
  return itsTimes[row];
}

int InstrumentGeometry::antenna1(casacore::uInt row) const
{
  ASKAPCHECK(row < itsAntenna1.size(), "Row "<<row<<" is outside the range of "<<itsAntenna1.size()<<" rows");
  return itsAntenna1[row];
}

int InstrumentGeometry::antenna2(casacore::uInt row) const
{
  ASKAPCHECK(row < itsAntenna2.size(), "Row "<<row<<" is outside the range of "<<itsAntenna2.size()<<" rows");
  return itsAntenna2[row];
}

int InstrumentGeometry::antennaIndex(int number) const
{
  for (size_t i = 0; i < itsAntennas.size(); ++i) {
       if (itsAntennas[i].number == number) {
           return int(i);
       }
  }
  return -1;
}

void InstrumentGeometry::check() const
{
  if (itsAntennas.size() == 0) {
      ASKAPTHROW(ConfigurationError, "No antennas defined for telescope "<<itsTelescopeName);
  }
  std::set<std::string> names;
  std::set<int> numbers;
  for (std::vector<AntennaRecord>::const_iterator ci = itsAntennas.begin(); ci != itsAntennas.end(); ++ci) {
       if (!names.insert(ci->name).second) {
           ASKAPTHROW(ConfigurationError, "Antenna name "<<ci->name<<" is duplicated");
       }
       if (!numbers.insert(ci->number).second) {
           ASKAPTHROW(ConfigurationError, "Antenna number "<<ci->number<<" is duplicated");
       }
  }
  if (itsTimes.size() == 0) {
      ASKAPTHROW(ConfigurationError, "No baseline-time rows defined");
  }
  ASKAPDEBUGASSERT(itsTimes.size() == itsAntenna1.size());
  ASKAPDEBUGASSERT(itsTimes.size() == itsAntenna2.size());
  for (size_t row = 0; row < itsTimes.size(); ++row) {
       if (numbers.find(itsAntenna1[row]) == numbers.end() || numbers.find(itsAntenna2[row]) == numbers.end()) {
           ASKAPTHROW(ConfigurationError, "Row "<<row<<" refers to unknown antenna, antenna numbers are "<<
                      itsAntenna1[row]<<" and "<<itsAntenna2[row]);
       }
  }
  if (itsFrequencies.nelements() == 0) {
      ASKAPTHROW(ConfigurationError, "Frequency grid is empty");
  }
  for (casacore::uInt chan = 0; chan < itsFrequencies.nelements(); ++chan) {
       if (itsFrequencies[chan] <= 0.) {
           ASKAPTHROW(ConfigurationError, "Frequency of channel "<<chan<<" should be positive, you have "<<
                      itsFrequencies[chan]);
       }
  }
}

} // namespace simulation

} // namespace vissim
