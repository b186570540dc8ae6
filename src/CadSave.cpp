/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#include "CadIo.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <ostream>

namespace cadastre {

const char* Name(OutputFormat x) noexcept {
  switch (x) {
    case OutputFormat::Shp: return "shp";
    case OutputFormat::Wkt: return "wkt";
    default: return nullptr;
  }
} // Name(OutputFormat)

OutputFormat FormatFor(const std::filesystem::path& path)
  { return (path.extension() == ".shp") ? OutputFormat::Shp : OutputFormat::Wkt; }

SaveStatus SaveOrDump(const Layer& layer, const std::filesystem::path& path,
                      OutputFormat format, std::ostream& fallback)
{
  try {
    log::Logger().info("saving {} features to {} ({})",
                       layer.size(), path.generic_string(), Name(format));
    if (format == OutputFormat::Shp)
      WriteShp(layer, path);
    else
      WriteWkt(layer, path);
    return SaveStatus::Saved;
  } catch (const IoError& x) {
    log::Logger().warn("could not save to file ({})", x.what());
    log::Logger().warn("writing the layer as WKT to the fallback stream");
  }
  WriteWkt(layer, fallback);
  return SaveStatus::Dumped;
} // SaveOrDump

int ExitStatus(SaveStatus x) noexcept
  { return (x == SaveStatus::Saved) ? ExitSuccess : ExitSaveError; }

} // cadastre
