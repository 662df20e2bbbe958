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
#include <terraprep/io/RasterWriter.hpp>

#include <cmath>
#include <fmt/format.h>
#include <cpl_error.h>
#include <cpl_string.h>
#include <gdal_priv.h>
#include <gdal_utils.h>

namespace terraprep::io {

  struct RasterWriterGDAL : public RasterWriterInterface {
    RasterWriterGDAL() { GDALAllRegister(); }

    static GDALDataset* open_source(const fs::path& source) {
      if (!fs::exists(source)) {
        throw InvalidInputError("Raster file " + source.string() +
                                " not found.");
      }
      auto ds = static_cast<GDALDataset*>(
          GDALOpenEx(source.string().c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY,
                     nullptr, nullptr, nullptr));
      if (ds == nullptr) {
        throw InvalidInputError("Could not open " + source.string() + ". " +
                                CPLGetLastErrorMsg());
      }
      return ds;
    }

    void write_scaled(const fs::path& source, const fs::path& target,
                      double factor, const std::string& unit) override {
      auto& logger = logger::Logger::get_logger();
      require_driver("GTiff");
      GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");

      GDALDataset* src = open_source(source);
      const int width = src->GetRasterXSize();
      const int height = src->GetRasterYSize();
      GDALRasterBand* src_band = src->GetRasterBand(1);

      std::vector<double> values(size_t(width) * size_t(height));
      if (src_band->RasterIO(GF_Read, 0, 0, width, height, values.data(),
                             width, height, GDT_Float64, 0, 0) != CE_None) {
        GDALClose(src);
        throw InvalidInputError("Could not read band 1 of " + source.string() +
                                ". " + CPLGetLastErrorMsg());
      }

      int has_nodata = FALSE;
      const double nodata = src_band->GetNoDataValue(&has_nodata);
      size_t n_scaled = 0;
      for (auto& v : values) {
        if (has_nodata && (v == nodata || (std::isnan(nodata) && std::isnan(v))))
          continue;
        v *= factor;
        ++n_scaled;
      }

      char** options = nullptr;
      options = CSLSetNameValue(options, "COMPRESS", "DEFLATE");
      GDALDataset* dst =
          driver->Create(target.string().c_str(), width, height, 1,
                         GDT_Float32, options);
      CSLDestroy(options);
      if (dst == nullptr) {
        GDALClose(src);
        throw terraprepException("Failed to create " + target.string() +
                                 ". " + CPLGetLastErrorMsg());
      }

      double gt[6];
      if (src->GetGeoTransform(gt) == CE_None) dst->SetGeoTransform(gt);
      dst->SetProjection(src->GetProjectionRef());
      GDALClose(src);

      GDALRasterBand* dst_band = dst->GetRasterBand(1);
      if (has_nodata) dst_band->SetNoDataValue(nodata);
      dst_band->SetUnitType(unit.c_str());
      CPLErr err = dst_band->RasterIO(GF_Write, 0, 0, width, height,
                                      values.data(), width, height,
                                      GDT_Float64, 0, 0);
      GDALClose(dst);
      if (err != CE_None) {
        throw terraprepException("Failed to write " + target.string() + ". " +
                                 CPLGetLastErrorMsg());
      }
      logger.info("Scaled {} of {} cells by {} into {}", n_scaled,
                  values.size(), factor, target.string());
    }

    void encode(const fs::path& source, const fs::path& target,
                OutputFormat format, int precision, double min,
                double max) override {
      std::string driver_name, data_type;
      int out_max = 65535;
      switch (format) {
        case OutputFormat::png:
          driver_name = "PNG";
          data_type = precision == 8 ? "Byte" : "UInt16";
          out_max = precision == 8 ? 255 : 65535;
          break;
        case OutputFormat::r16:
          driver_name = "ENVI";
          data_type = "UInt16";
          break;
        case OutputFormat::tif:
          return;
      }
      require_driver(driver_name);
      // a flat raster maps to 0
      if (!(max > min)) max = min + 1;

      GDALDataset* src = open_source(source);

      char** argv = nullptr;
      argv = CSLAddString(argv, "-of");
      argv = CSLAddString(argv, driver_name.c_str());
      argv = CSLAddString(argv, "-ot");
      argv = CSLAddString(argv, data_type.c_str());
      argv = CSLAddString(argv, "-scale");
      argv = CSLAddString(argv, fmt::format("{:.17g}", min).c_str());
      argv = CSLAddString(argv, fmt::format("{:.17g}", max).c_str());
      argv = CSLAddString(argv, "0");
      argv = CSLAddString(argv, std::to_string(out_max).c_str());
      GDALTranslateOptions* options = GDALTranslateOptionsNew(argv, nullptr);
      CSLDestroy(argv);

      int usage_error = FALSE;
      GDALDatasetH dst =
          GDALTranslate(target.string().c_str(),
                        static_cast<GDALDatasetH>(src), options, &usage_error);
      GDALTranslateOptionsFree(options);
      GDALClose(static_cast<GDALDatasetH>(src));
      if (dst == nullptr || usage_error) {
        if (dst) GDALClose(dst);
        throw terraprepException("Failed to encode " + source.string() +
                                 " as " + driver_name + ". " +
                                 CPLGetLastErrorMsg());
      }
      GDALClose(dst);
    }
  };

  std::unique_ptr<RasterWriterInterface> createRasterWriterGDAL() {
    return std::make_unique<RasterWriterGDAL>();
  }
}  // namespace terraprep::io
