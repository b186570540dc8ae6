/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#pragma once
#include "CadLayer.hpp"

#include <filesystem>
#include <iosfwd>

namespace cadastre {

enum class OutputFormat { Shp = 1, Wkt };

const char* Name(OutputFormat x) noexcept;

template<>
struct EnumValues<OutputFormat>
  : EnumList<OutputFormat, OutputFormat::Shp, OutputFormat::Wkt> { };

/// Shp for a ".shp" path, Wkt for anything else.
OutputFormat FormatFor(const std::filesystem::path& path);

/// Reads an ESRI shapefile (.shp with sibling .shx and .dbf) into a layer
/// named after the file stem, with every DBF field read as a string.
/// Point, multi-point, polyline and polygon shapes (and their Z and M
/// variants) are accepted; `crs` is the CRS of the stored coordinates.
/// Throws IoError.
RawLayer ReadShp(const std::filesystem::path& path, const Crs& crs);

/// Writes a polygon layer as a shapefile with string DBF fields.
/// Throws IoError.
void WriteShp(const Layer& layer, const std::filesystem::path& path);

/// Writes one "index<TAB>area<TAB>WKT" line per feature.
/// Throws IoError.
void WriteWkt(const Layer& layer, const std::filesystem::path& path);
void WriteWkt(const Layer& layer, std::ostream& os);

enum class SaveStatus { Saved = 1, Dumped };

/// Writes `layer` to `path` in `format`.  If that fails, the failure is
/// logged and the WKT dump goes to `fallback` instead.  Throws IoError only
/// if the fallback cannot be written either.
SaveStatus SaveOrDump(const Layer& layer, const std::filesystem::path& path,
                      OutputFormat format, std::ostream& fallback);

/// ExitSuccess when saved, ExitSaveError when dumped.
int ExitStatus(SaveStatus x) noexcept;

} // cadastre
