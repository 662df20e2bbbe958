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

#include <terraprep/logger/logger.h>
#include <terraprep/io/RasterDataset.hpp>
#include <terraprep/io/SpatialReferenceSystem.hpp>

#include <cpl_error.h>
#include <gdal_priv.h>

namespace terraprep::io {

  struct GDALDatasetDeleter {
    void operator()(GDALDataset* ds) const {
      GDALClose(static_cast<GDALDatasetH>(ds));
    }
  };

  struct RasterDatasetGDAL : public RasterDatasetInterface {
    std::unique_ptr<GDALDataset, GDALDatasetDeleter> dataset_;
    fs::path source_;

    RasterDatasetGDAL() { GDALAllRegister(); }

    void open(const fs::path& source) override {
      close();
      if (!fs::exists(source)) {
        throw InvalidInputError("Raster file " + source.string() +
                                " not found.");
      }
      dataset_.reset(static_cast<GDALDataset*>(
          GDALOpenEx(source.string().c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY,
                     nullptr, nullptr, nullptr)));
      if (!dataset_) {
        throw InvalidInputError("Could not open " + source.string() + ". " +
                                CPLGetLastErrorMsg());
      }
      if (dataset_->GetRasterCount() < 1) {
        dataset_.reset();
        throw InvalidInputError("Could not open " + source.string() +
                                ", it has no raster bands.");
      }
      source_ = source;
    }

    void close() override {
      dataset_.reset();
      source_.clear();
    }

    bool is_open() const override { return dataset_ != nullptr; }

    GDALDataset& ds() const {
      if (!dataset_) throw InvalidInputError("No raster dataset is open.");
      return *dataset_;
    }

    int width() const override { return ds().GetRasterXSize(); }
    int height() const override { return ds().GetRasterYSize(); }

    std::array<double, 6> geotransform() const override {
      std::array<double, 6> gt = {0, 1, 0, 0, 0, 1};
      if (ds().GetGeoTransform(gt.data()) != CE_None) {
        logger::Logger::get_logger().debug("{} has no geotransform",
                                           source_.string());
      }
      return gt;
    }

    std::string projection_wkt() const override {
      auto wkt = ds().GetProjectionRef();
      return wkt ? wkt : "";
    }

    std::string authority_code() const override {
      auto wkt = projection_wkt();
      if (wkt.empty()) return "";
      auto srs = createSpatialReferenceSystemOGR();
      srs->import_wkt(wkt);
      return srs->authority_code();
    }

    std::string band_unit() const override {
      auto unit = ds().GetRasterBand(1)->GetUnitType();
      return unit ? unit : "";
    }

    std::string vertical_crs_unit() const override {
      auto wkt = projection_wkt();
      if (wkt.empty()) return "";
      auto srs = createSpatialReferenceSystemOGR();
      srs->import_wkt(wkt);
      return srs->vertical_unit();
    }

    std::optional<double> nodata() const override {
      int has_nodata = FALSE;
      double value = ds().GetRasterBand(1)->GetNoDataValue(&has_nodata);
      if (has_nodata) return value;
      return std::nullopt;
    }

    std::pair<double, double> min_max() override {
      double minmax[2] = {0, 0};
      if (ds().GetRasterBand(1)->ComputeRasterMinMax(FALSE, minmax) !=
          CE_None) {
        throw InvalidInputError("Could not compute the value range of " +
                                source_.string() + ". " +
                                CPLGetLastErrorMsg());
      }
      return {minmax[0], minmax[1]};
    }

    RasterArtifact describe() override {
      RasterArtifact artifact;
      artifact.path = source_;
      artifact.width = width();
      artifact.height = height();
      artifact.authority_code = authority_code();
      if (auto unit = band_unit(); !unit.empty()) {
        artifact.vertical_unit = unit;
      } else if (auto vunit = vertical_crs_unit(); !vunit.empty()) {
        artifact.vertical_unit = vunit;
      }
      auto [min, max] = min_max();
      artifact.min = min;
      artifact.max = max;
      return artifact;
    }
  };

  std::unique_ptr<RasterDatasetInterface> createRasterDatasetGDAL() {
    return std::make_unique<RasterDatasetGDAL>();
  }

  void require_driver(const std::string& driver_name) {
    GDALAllRegister();
    if (GetGDALDriverManager()->GetDriverByName(driver_name.c_str()) ==
        nullptr) {
      throw DriverUnavailableError("GDAL driver " + driver_name +
                                   " is not available.");
    }
  }
}  // namespace terraprep::io
