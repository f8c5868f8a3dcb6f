/// @file
///
/// @brief Construction of beam models
/// @details Beams can be defined in a parset, by a short descriptor string
/// (e.g. analytic_gaussian_sig_0.1) or read back from a blob stream written
/// by BeamFactory::write. The blob carries the beam kind in front of the
/// model parameters, so the right type is reconstructed on the receiving side.
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

#ifndef VISSIM_BEAM_FACTORY_H
#define VISSIM_BEAM_FACTORY_H

#include <vissim/beams/IBeam.h>

#include <Common/ParameterSet.h>
#include <Blob/BlobOStream.h>
#include <Blob/BlobIStream.h>

#include <string>

namespace vissim {

namespace simulation {

/// @brief factory of beam models
class BeamFactory {
public:
   /// @brief make a beam from the parset
   /// @details Recognised parameters are type (uniform, gaussian or airy),
   /// sigma (angle, e.g. 5deg) and diameter (length, e.g. 12m).
   /// @param[in] parset parset with the description of a single beam
   /// @return shared pointer to the new beam
   static IBeam::ShPtr make(const LOFAR::ParameterSet &parset);

   /// @brief make a beam from the descriptor string
   /// @details Valid descriptors are analytic_uniform, analytic_gaussian_sig_<rad>,
   /// analytic_gaussian_diam_<m> and analytic_airy_diam_<m>.
   /// @param[in] descriptor beam descriptor
   /// @return shared pointer to the new beam
   static IBeam::ShPtr make(const std::string &descriptor);

   /// @brief make an empty beam of the given kind
   /// @details The beam is expected to be filled from a blob stream
   /// @param[in] kind beam kind as returned by IBeam::kind
   static IBeam::ShPtr makeEmpty(const std::string &kind);

   /// @brief write a beam of any kind to the blob stream
   /// @param[in] os output stream
   /// @param[in] beam beam to write
   static void write(LOFAR::BlobOStream &os, const IBeam &beam);

   /// @brief read a beam written by write
   /// @param[in] is input stream
   /// @return shared pointer to the new beam
   static IBeam::ShPtr read(LOFAR::BlobIStream &is);
};

} // namespace simulation

} // namespace vissim

#endif // #ifndef VISSIM_BEAM_FACTORY_H
