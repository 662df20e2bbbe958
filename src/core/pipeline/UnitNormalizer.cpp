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

#include <terraprep/io/RasterDataset.hpp>
#include <terraprep/logger/logger.h>
#include <terraprep/pipeline/UnitNormalizer.hpp>

namespace terraprep::pipeline {

  bool is_feet_unit(const std::string& unit) {
    auto u = to_lower(unit);
    if (u.find("foot") != std::string::npos ||
        u.find("feet") != std::string::npos) {
      return true;
    }
    return u == "ft" || u == "ftus" || u == "us-ft" || u == "us_ft" ||
           u == "international foot";
  }

  double feet_to_metre_factor(const std::string& unit) {
    auto u = to_lower(unit);
    if (u.find("survey") != std::string::npos ||
        u.find("us") != std::string::npos) {
      return US_SURVEY_FOOT;
    }
    return INTERNATIONAL_FOOT;
  }

  struct UnitNormalizer : public UnitNormalizerInterface {
    io::RasterWriterInterface& writer;

    UnitNormalizer(io::RasterWriterInterface& writer) : writer(writer){};

    // USGS 1 meter DEM tiles are delivered in metres but carry no unit.
    static bool is_one_meter_product(const fs::path& path) {
      auto name = to_lower(path.filename().string());
      return name.find("usgs_1m") != std::string::npos ||
             name.find("usgs_one_meter") != std::string::npos;
    }

    VerticalUnitInfo detect_vertical_unit(
        const fs::path& raster_path) override {
      VerticalUnitInfo info;
      auto ds = io::createRasterDatasetGDAL();
      try {
        ds->open(raster_path);
        if (auto unit = ds->band_unit(); !unit.empty()) {
          info.unit = unit;
          info.source = UnitSource::band;
          info.details = "band 1 unit type";
        } else if (auto vunit = ds->vertical_crs_unit(); !vunit.empty()) {
          info.unit = vunit;
          info.source = UnitSource::vertical_crs;
          info.details = "vertical part of the compound CRS";
        } else if (is_one_meter_product(raster_path)) {
          info.unit = "metre";
          info.source = UnitSource::heuristic;
          info.details = "USGS 1 meter DEM naming convention";
        } else {
          info.source = UnitSource::unknown;
          info.details = "no vertical unit metadata";
        }
      } catch (const InvalidInputError& e) {
        info.unit.reset();
        info.source = UnitSource::error;
        info.details = e.what();
      }
      return info;
    }

    fs::path convert_to_meters(const fs::path& raster_path,
                               double factor) override {
      auto target = raster_path.parent_path() /
                    (raster_path.stem().string() + "_converted.tif");
      writer.write_scaled(raster_path, target, factor, "metre");
      return target;
    }

    std::optional<fs::path> normalize(const fs::path& raster_path) override {
      auto& logger = logger::Logger::get_logger();
      auto info = detect_vertical_unit(raster_path);
      if (!info.unit.has_value()) {
        logger.warning(
            "Vertical unit of {} is unknown ({}), assuming metres",
            raster_path.filename().string(), info.details);
        return std::nullopt;
      }
      if (!is_feet_unit(*info.unit)) {
        logger.debug("Vertical unit of {} is {} (from {})",
                     raster_path.filename().string(), *info.unit,
                     name_of(info.source));
        return std::nullopt;
      }
      auto factor = feet_to_metre_factor(*info.unit);
      logger.info("Converting {} from {} to metres (factor {})",
                  raster_path.filename().string(), *info.unit, factor);
      return convert_to_meters(raster_path, factor);
    }
  };

  std::unique_ptr<UnitNormalizerInterface> createUnitNormalizer(
      io::RasterWriterInterface& writer) {
    return std::make_unique<UnitNormalizer>(writer);
  }
}  // namespace terraprep::pipeline
