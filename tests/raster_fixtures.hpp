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

#include <cpl_string.h>
#include <gdal_priv.h>
#include <ogr_spatialref.h>

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_helpers.hpp"

namespace terraprep::test {

  struct RasterSpec {
    int width = 10;
    int height = 10;
    int epsg = 26917;
    // upper left corner and pixel size in CRS units
    double origin_x = 500000;
    double origin_y = 3900000;
    double pixel_size = 1;
    std::optional<double> nodata = -9999;
    std::string unit;
    std::function<double(int, int)> value = [](int col, int row) {
      return 100.0 + col + row;
    };
  };

  // Writes a single band Float32 GeoTIFF.
  inline fs::path make_raster(const fs::path& path,
                              const RasterSpec& spec = RasterSpec()) {
    GDALAllRegister();
    fs::create_directories(path.parent_path());
    auto driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    if (!driver) throw std::runtime_error("GTiff driver missing");
    GDALDataset* ds =
        driver->Create(path.string().c_str(), spec.width, spec.height, 1,
                       GDT_Float32, nullptr);
    if (!ds) throw std::runtime_error("Could not create " + path.string());

    double gt[6] = {spec.origin_x, spec.pixel_size, 0,
                    spec.origin_y, 0,               -spec.pixel_size};
    ds->SetGeoTransform(gt);
    if (spec.epsg) {
      OGRSpatialReference srs;
      srs.importFromEPSG(spec.epsg);
      ds->SetSpatialRef(&srs);
    }

    std::vector<float> cells(size_t(spec.width) * spec.height);
    for (int row = 0; row < spec.height; ++row) {
      for (int col = 0; col < spec.width; ++col) {
        cells[size_t(row) * spec.width + col] = float(spec.value(col, row));
      }
    }
    auto band = ds->GetRasterBand(1);
    if (spec.nodata) band->SetNoDataValue(*spec.nodata);
    if (!spec.unit.empty()) band->SetUnitType(spec.unit.c_str());
    if (band->RasterIO(GF_Write, 0, 0, spec.width, spec.height, cells.data(),
                       spec.width, spec.height, GDT_Float32, 0,
                       0) != CE_None) {
      GDALClose(ds);
      throw std::runtime_error("Could not write " + path.string());
    }
    GDALClose(ds);
    return path;
  }

  inline std::vector<double> read_band(const fs::path& path) {
    GDALAllRegister();
    auto ds = static_cast<GDALDataset*>(
        GDALOpen(path.string().c_str(), GA_ReadOnly));
    if (!ds) throw std::runtime_error("Could not open " + path.string());
    int w = ds->GetRasterXSize(), h = ds->GetRasterYSize();
    std::vector<double> cells(size_t(w) * h);
    auto err = ds->GetRasterBand(1)->RasterIO(
        GF_Read, 0, 0, w, h, cells.data(), w, h, GDT_Float64, 0, 0);
    GDALClose(ds);
    if (err != CE_None) {
      throw std::runtime_error("Could not read " + path.string());
    }
    return cells;
  }

}  // namespace terraprep::test
