// Copyright (c) 2024-2025 the terraprep developers

// This file is part of terraprep

// terraprep is free software: you can redistribute it and/or modify it under
// the terms of the GNU General Public License as published by the Free Software
// Foundation, either version 3 of the License, or (at your option) any later
// version. terraprep is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more
// details. You should have received a copy of the GNU General Public License
// along with terraprep. If not, see <https://www.gnu.org/licenses/>.

#pragma once
#include <memory>
#include <terraprep/common/datastructures.hpp>
#include <terraprep/io/RasterWriter.hpp>

namespace terraprep::pipeline {

  // US survey foot to metre.
  constexpr double US_SURVEY_FOOT = 0.3048006096012192;
  // International foot to metre.
  constexpr double INTERNATIONAL_FOOT = 0.3048;

  // Matches "foot", "feet", "ft", "US survey foot", "ftUS", ...
  bool is_feet_unit(const std::string& unit);

  // US_SURVEY_FOOT for US survey units ("US survey foot", "ftUS", "us-ft"),
  // INTERNATIONAL_FOOT for any other feet unit.
  double feet_to_metre_factor(const std::string& unit);

  struct UnitNormalizerInterface {
    virtual ~UnitNormalizerInterface() = default;

    // First match wins: band unit, vertical CRS unit, file naming of the
    // federal 1 meter DEM product line. Never throws, an unreadable file
    // gives UnitSource::error.
    virtual VerticalUnitInfo detect_vertical_unit(
        const fs::path& raster_path) = 0;

    // Writes <stem>_converted.tif next to raster_path with all valid cells
    // multiplied by factor and returns its path.
    virtual fs::path convert_to_meters(const fs::path& raster_path,
                                       double factor = US_SURVEY_FOOT) = 0;

    // Converts when the detected unit is feet based, returns the converted
    // path or nullopt when the file is used as is.
    virtual std::optional<fs::path> normalize(const fs::path& raster_path) = 0;
  };

  std::unique_ptr<UnitNormalizerInterface> createUnitNormalizer(
      io::RasterWriterInterface& writer);
}  // namespace terraprep::pipeline
