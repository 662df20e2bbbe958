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
#include <terraprep/io/RasterWarper.hpp>

#include <fmt/format.h>

#include <cpl_error.h>
#include <cpl_string.h>
#include <gdal_priv.h>
#include <gdal_utils.h>

namespace terraprep::io {

  // Owns the argument list handed to the gdal_utils option parsers.
  struct GDALArgs {
    char** argv = nullptr;
    GDALArgs(std::initializer_list<std::string> args) {
      for (auto& a : args) add(a);
    }
    ~GDALArgs() { CSLDestroy(argv); }
    GDALArgs(const GDALArgs&) = delete;
    GDALArgs& operator=(const GDALArgs&) = delete;
    void add(const std::string& a) { argv = CSLAddString(argv, a.c_str()); }
  };

  struct RasterWarperGDAL : public RasterWarperInterface {
    RasterWarperGDAL() { GDALAllRegister(); }

    static GDALDatasetH open(const fs::path& path) {
      GDALDatasetH ds =
          GDALOpenEx(path.string().c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY,
                     nullptr, nullptr, nullptr);
      if (ds == nullptr) {
        throw InvalidInputError("Could not open " + path.string() + ". " +
                                CPLGetLastErrorMsg());
      }
      return ds;
    }

    static void close_all(std::vector<GDALDatasetH>& datasets) {
      for (auto ds : datasets) GDALClose(ds);
      datasets.clear();
    }

    void warp(const vec1p& inputs, const fs::path& output,
              const std::string& target_crs) {
      require_driver("GTiff");
      std::vector<GDALDatasetH> sources;
      try {
        for (auto& input : inputs) sources.push_back(open(input));
      } catch (const InvalidInputError& e) {
        close_all(sources);
        throw MergeError(std::string("Input became unreadable during warp. ") +
                         e.what());
      }

      GDALArgs args{"-of", "GTiff", "-t_srs", target_crs, "-r", "cubic",
                    "-overwrite"};
      GDALWarpAppOptions* options = GDALWarpAppOptionsNew(args.argv, nullptr);
      int usage_error = FALSE;
      GDALDatasetH dst =
          GDALWarp(output.string().c_str(), nullptr, int(sources.size()),
                   sources.data(), options, &usage_error);
      GDALWarpAppOptionsFree(options);
      close_all(sources);
      if (dst == nullptr || usage_error) {
        if (dst) GDALClose(dst);
        throw MergeError("Warping " + std::to_string(inputs.size()) +
                         " raster(s) into " + output.string() +
                         " failed. " + CPLGetLastErrorMsg());
      }
      GDALClose(dst);
    }

    void mosaic(const vec1p& inputs, const fs::path& output,
                const std::string& target_crs) override {
      if (inputs.empty()) {
        throw MergeError("No input rasters to merge into " + output.string() +
                         ".");
      }
      warp(inputs, output, target_crs);
      logger::Logger::get_logger().info("Merged {} raster(s) into {}",
                                        inputs.size(), output.string());
    }

    void reproject(const fs::path& input, const fs::path& output,
                   const std::string& target_crs) override {
      warp({input}, output, target_crs);
    }

    void extract_window(const fs::path& input, const fs::path& output,
                        const Box& window,
                        std::optional<arr2i> size) override {
      require_driver("GTiff");
      GDALDatasetH src = open(input);

      // -projwin takes the upper left corner first, rows run top-down
      GDALArgs args{"-of",
                    "GTiff",
                    "-r",
                    "cubic",
                    "-projwin",
                    fmt::format("{:.17g}", window.pmin[0]),
                    fmt::format("{:.17g}", window.pmax[1]),
                    fmt::format("{:.17g}", window.pmax[0]),
                    fmt::format("{:.17g}", window.pmin[1])};
      if (size.has_value()) {
        args.add("-outsize");
        args.add(std::to_string((*size)[0]));
        args.add(std::to_string((*size)[1]));
      }
      GDALTranslateOptions* options = GDALTranslateOptionsNew(args.argv, nullptr);
      int usage_error = FALSE;
      GDALDatasetH dst =
          GDALTranslate(output.string().c_str(), src, options, &usage_error);
      GDALTranslateOptionsFree(options);
      GDALClose(src);
      if (dst == nullptr || usage_error) {
        if (dst) GDALClose(dst);
        throw terraprepException("Extracting window " + window.wkt() +
                                 " from " + input.string() + " failed. " +
                                 CPLGetLastErrorMsg());
      }
      GDALClose(dst);
    }
  };

  std::unique_ptr<RasterWarperInterface> createRasterWarperGDAL() {
    return std::make_unique<RasterWarperGDAL>();
  }
}  // namespace terraprep::io
