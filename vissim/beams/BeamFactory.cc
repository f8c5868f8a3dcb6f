/// @file
///
/// @brief Construction of beam models
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

#include <vissim/askap_vissim.h>

#include <vissim/beams/BeamFactory.h>
#include <vissim/beams/UniformBeam.h>
#include <vissim/beams/GaussianBeam.h>
#include <vissim/beams/AiryBeam.h>
#include <vissim/beams/TabulatedBeam.h>
#include <vissim/errors/SimulationErrors.h>

#include <askap/askap/AskapError.h>
#include <askap/askap/AskapLogging.h>
#include <askap/askap/AskapUtil.h>

#include <boost/optional.hpp>

ASKAP_LOGGER(logger, ".beams.beamfactory");

namespace vissim {

namespace simulation {

IBeam::ShPtr BeamFactory::make(const LOFAR::ParameterSet &parset)
{
  const std::string type = parset.getString("type", "uniform");
  boost::optional<double> sigma;
  if (parset.isDefined("sigma")) {
      sigma = askap::asQuantity(parset.getString("sigma"), "rad").getValue("rad");
  }
  boost::optional<double> diameter;
  if (parset.isDefined("diameter")) {
      diameter = askap::asQuantity(parset.getString("diameter"), "m").getValue("m");
  }
  ASKAPLOG_DEBUG_STR(logger, "Making beam of type "<<type);
  if (type == "uniform") {
      return IBeam::ShPtr(new UniformBeam);
  }
  if (type == "gaussian") {
      return IBeam::ShPtr(new GaussianBeam(sigma, diameter));
  }
  if (type == "airy") {
      return IBeam::ShPtr(new AiryBeam(diameter));
  }
  ASKAPTHROW(ConfigurationError, "Unknown beam type "<<type<<", only uniform, gaussian and airy can be defined in the parset");
}

IBeam::ShPtr BeamFactory::make(const std::string &descriptor)
{
  const std::string prefix = "analytic_";
  if (descriptor.compare(0, prefix.size(), prefix) != 0) {
      ASKAPTHROW(InvalidArgument, "Beam descriptor "<<descriptor<<" is not recognised, it should start with "<<prefix);
  }
  const std::string model = descriptor.substr(prefix.size());
  if (model == "uniform") {
      return IBeam::ShPtr(new UniformBeam);
  }
  const std::string sigKey = "gaussian_sig_";
  const std::string gaussDiamKey = "gaussian_diam_";
  const std::string airyDiamKey = "airy_diam_";
  try {
     if (model.compare(0, sigKey.size(), sigKey) == 0) {
         const double sigma = askap::utility::fromString<double>(model.substr(sigKey.size()));
         return IBeam::ShPtr(new GaussianBeam(sigma, boost::none));
     }
     if (model.compare(0, gaussDiamKey.size(), gaussDiamKey) == 0) {
         const double diameter = askap::utility::fromString<double>(model.substr(gaussDiamKey.size()));
         return IBeam::ShPtr(new GaussianBeam(boost::none, diameter));
     }
     if (model.compare(0, airyDiamKey.size(), airyDiamKey) == 0) {
         const double diameter = askap::utility::fromString<double>(model.substr(airyDiamKey.size()));
         return IBeam::ShPtr(new AiryBeam(diameter));
     }
  }
  catch (const InvalidArgument &) {
     throw;
  }
  catch (const askap::AskapError &ae) {
     ASKAPTHROW(InvalidArgument, "Unable to parse beam descriptor "<<descriptor<<": "<<ae.what());
  }
  ASKAPTHROW(InvalidArgument, "Beam descriptor "<<descriptor<<" is not recognised");
}

IBeam::ShPtr BeamFactory::makeEmpty(const std::string &kind)
{
  if (kind == "uniform") {
      return IBeam::ShPtr(new UniformBeam);
  }
  if (kind == "gaussian") {
      return IBeam::ShPtr(new GaussianBeam);
  }
  if (kind == "airy") {
      return IBeam::ShPtr(new AiryBeam);
  }
  if (kind == "tabulated") {
      return IBeam::ShPtr(new TabulatedBeam);
  }
  ASKAPTHROW(InvalidArgument, "Unknown beam kind "<<kind);
}

void BeamFactory::write(LOFAR::BlobOStream &os, const IBeam &beam)
{
  os << beam.kind();
  beam.writeToBlob(os);
}

IBeam::ShPtr BeamFactory::read(LOFAR::BlobIStream &is)
{
  std::string kind;
  is >> kind;
  IBeam::ShPtr beam = makeEmpty(kind);
  beam->readFromBlob(is);
  return beam;
}

} // namespace simulation

} // namespace vissim
