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

#include <algorithm>
#include <cmath>
#include <limits>
#include <terraprep/io/RasterDataset.hpp>
#include <terraprep/logger/logger.h>
#include <terraprep/misc/projHelper.hpp>
#include <terraprep/pipeline/RasterMergeEngine.hpp>

namespace terraprep::pipeline {

  arr2i get_resolution(int width, int height, const TargetResolution& target) {
    switch (target.mode) {
      case ResolutionMode::none:
        return {width, height};
      case ResolutionMode::fixed:
        return {target.size, target.size};
      case ResolutionMode::automatic:
        break;
    }
    int best = RESOLUTION_CANDIDATES.front();
    double best_distance = std::numeric_limits<double>::max();
    for (int c : RESOLUTION_CANDIDATES) {
      double dx = double(c) - width;
      double dy = double(c) - height;
      double distance = std::sqrt(dx * dx + dy * dy);
      if (distance < best_distance) {
        best_distance = distance;
        best = c;
      }
    }
    return {best, best};
  }

  namespace {
    const std::string WGS84 = "EPSG:4326";

    fs::path filtered_name(const fs::path& raster) {
      return raster.parent_path() / (raster.stem().string() + "_filtered.tif");
    }
  }  // namespace

  struct RasterMergeEngine : public RasterMergeEngineInterface {
    CrsReconcilerInterface& reconciler;
    io::RasterWarperInterface& warper;
    io::RasterWriterInterface& writer;
    RetentionPolicyInterface& retention;
    ProvenanceLedger* ledger;

    RasterMergeEngine(CrsReconcilerInterface& reconciler,
                      io::RasterWarperInterface& warper,
                      io::RasterWriterInterface& writer,
                      RetentionPolicyInterface& retention,
                      ProvenanceLedger* ledger)
        : reconciler(reconciler),
          warper(warper),
          writer(writer),
          retention(retention),
          ledger(ledger){};

    void record(const fs::path& path, FileRole role) {
      if (ledger) ledger->record(path, role);
    }

    // Crop, then encode. Returns the written paths; size is filled with the
    // size of the crop, or used as the crop size when already set.
    vec1p finish(const fs::path& raster, const std::string& authority_code,
                 const MergeRequest& request, std::optional<arr2i>& size) {
      vec1p outputs;
      vec1p tifs{raster};
      if (request.crop_enabled) {
        auto filtered = filtered_name(raster);
        size = crop_to(raster, filtered, authority_code,
                       *request.area_of_interest, request.target_resolution,
                       size, FileRole::filtered);
        tifs.push_back(filtered);
        outputs.push_back(filtered);
      }
      if (request.output_format != OutputFormat::tif) {
        for (auto& tif : tifs) {
          outputs.push_back(
              convert(tif, request.output_format, request.precision));
        }
      }
      return outputs;
    }

    arr2i crop_to(const fs::path& raster, const fs::path& output,
                  const std::string& authority_code, const Box& aoi,
                  const TargetResolution& target, std::optional<arr2i> size,
                  FileRole role) {
      auto& logger = logger::Logger::get_logger();
      auto window = misc::transform_box(aoi, WGS84, authority_code);

      auto warped = output.parent_path() / "warped.tif";
      record(warped, FileRole::intermediate);
      auto remove_warped = [&]() {
        std::error_code ec;
        fs::remove(warped, ec);
        if (ec) {
          logger.warning("Could not remove {}: {}", warped.string(),
                         ec.message());
        }
        if (ledger) ledger->forget(warped);
      };

      try {
        warper.reproject(raster, warped, authority_code);

        if (!size.has_value()) {
          auto ds = io::createRasterDatasetGDAL();
          ds->open(warped);
          auto gt = ds->geotransform();
          ds->close();
          int native_w = std::max(
              1, int(std::lround(window.size_x() / std::abs(gt[1]))));
          int native_h = std::max(
              1, int(std::lround(window.size_y() / std::abs(gt[5]))));
          if (target.mode == ResolutionMode::none) {
            size = arr2i{native_w, native_h};
          } else {
            size = get_resolution(native_w, native_h, target);
          }
          logger.debug("Native window of {} is {}x{} px", raster.string(),
                       native_w, native_h);
        }
        warper.extract_window(warped, output, window, size);
      } catch (...) {
        remove_warped();
        throw;
      }
      remove_warped();
      record(output, role);

      auto [w, h] = *size;
      logger.info(
          "Cropped {} to {} ({}x{} px, {:.3f} x {:.3f} {} units per px)",
          raster.filename().string(), output.filename().string(), w, h,
          window.size_x() / w, window.size_y() / h, authority_code);
      return *size;
    }

    arr2i crop(const fs::path& raster, const fs::path& output,
               const std::string& authority_code, const Box& aoi,
               const TargetResolution& target,
               std::optional<arr2i> size) override {
      if (!is_valid_area_of_interest(aoi)) {
        throw ConfigError("Area of interest " + aoi.wkt() +
                          " is not a valid lon/lat box.");
      }
      return crop_to(raster, output, authority_code, aoi, target, size,
                     FileRole::filtered);
    }

    void encode_as(const fs::path& tif_path, const fs::path& target,
                   OutputFormat format, int precision, FileRole role) {
      auto& logger = logger::Logger::get_logger();
      auto ds = io::createRasterDatasetGDAL();
      ds->open(tif_path);
      auto [min, max] = ds->min_max();
      ds->close();

      writer.encode(tif_path, target, format, precision, min, max);
      record(target, role);
      for (auto sidecar :
           {fs::path(target.string() + ".aux.xml"),
            fs::path(target).replace_extension(".hdr"),
            fs::path(target.string() + ".hdr")}) {
        if (fs::exists(sidecar)) record(sidecar, FileRole::sidecar);
      }

      int bits = format == OutputFormat::png ? precision : 16;
      logger.info("Saved {} (height range {:.3f} to {:.3f} m as {} bit)",
                  target.string(), min, max, bits);
      // Z scale for a landscape import where 1 unit is 1 cm and the full
      // 16 bit range spans 512 units.
      logger.info("Real world Z scale for {} is {:.4f}",
                  target.filename().string(), (max - min) * 100.0 / 512.0);
    }

    fs::path convert(const fs::path& tif_path, OutputFormat format,
                     int precision) override {
      if (format == OutputFormat::tif) return tif_path;
      auto target = tif_path.parent_path() /
                    (tif_path.stem().string() + "." + extension_of(format));
      FileRole role = FileRole::tile;
      if (ledger) role = ledger->role_of(tif_path).value_or(FileRole::tile);
      if (role == FileRole::original) role = FileRole::tile;
      encode_as(tif_path, target, format, precision, role);
      return target;
    }

    std::string authority_code_of(const fs::path& raster) {
      auto ds = io::createRasterDatasetGDAL();
      ds->open(raster);
      auto code = ds->authority_code();
      ds->close();
      if (code.empty()) {
        throw MissingMetadataError("Could not determine the CRS of " +
                                   raster.string() + ".");
      }
      return code;
    }

    vec1p prepare_tiles(const ProjectGroup& group,
                        const MergeRequest& request) override {
      auto& logger = logger::Logger::get_logger();
      vec1p outputs;
      size_t index = 0;
      for (auto& tile : group.files) {
        ++index;
        logger.progress("prepare_tiles", index, group.size());
        auto stem = "heightmap" + std::to_string(index);
        try {
          if (request.output_format != OutputFormat::tif) {
            auto target = group.directory /
                          (stem + "." + extension_of(request.output_format));
            encode_as(tile, target, request.output_format, request.precision,
                      FileRole::tile);
            outputs.push_back(target);
          }
          if (request.crop_enabled) {
            auto filtered = group.directory / (stem + "_filtered.tif");
            crop_to(tile, filtered, authority_code_of(tile),
                    *request.area_of_interest, request.target_resolution,
                    std::nullopt, FileRole::tile);
            outputs.push_back(filtered);
            if (request.output_format != OutputFormat::tif) {
              outputs.push_back(
                  convert(filtered, request.output_format, request.precision));
            }
          }
        } catch (const InvalidInputError& e) {
          logger.warning("Skipping tile {}: {}", tile.string(), e.what());
        } catch (const MissingMetadataError& e) {
          logger.warning("Skipping tile {}: {}", tile.string(), e.what());
        }
      }
      return outputs;
    }

    // Crop and encode of a single-tile group. The tile itself stays. size
    // forces the crop size, as for the per-project outputs of scope both.
    vec1p finish_single(const ProjectGroup& group, const MergeRequest& request,
                        std::string& authority_code,
                        std::optional<arr2i> size = std::nullopt) {
      auto& logger = logger::Logger::get_logger();
      auto& tile = group.files.front();
      logger.info("Only 1 file in {}, no merging", group.id);

      vec1p outputs;
      try {
        auto code = authority_code_of(tile);
        if (authority_code.empty()) authority_code = code;

        if (request.output_format != OutputFormat::tif) {
          auto target = group.directory /
                        ("heightmap1." + extension_of(request.output_format));
          // already written by prepare_tiles in this run
          bool prepared = ledger && ledger->role_of(target).has_value() &&
                          fs::exists(target);
          if (!prepared) {
            encode_as(tile, target, request.output_format, request.precision,
                      FileRole::tile);
          }
          outputs.push_back(target);
        }
        if (!request.crop_enabled) return outputs;

        auto filtered = group.directory / "heightmap1_filtered.tif";
        crop_to(tile, filtered, code, *request.area_of_interest,
                request.target_resolution, size, FileRole::filtered);
        outputs.push_back(filtered);
        if (request.output_format != OutputFormat::tif) {
          outputs.push_back(
              convert(filtered, request.output_format, request.precision));
        }
      } catch (const InvalidInputError& e) {
        logger.warning("Skipping {}: {}", tile.string(), e.what());
      } catch (const MissingMetadataError& e) {
        logger.warning("Skipping {}: {}", tile.string(), e.what());
      }
      return outputs;
    }

    void clean_directory(const fs::path& directory,
                         const MergeRequest& request) {
      auto removable = retention.files_to_remove(
          directory, extension_of(request.output_format), true);
      auto n = retention.remove(removable);
      logger::Logger::get_logger().info("Removed {} of {} file(s) from {}", n,
                                        removable.size(), directory.string());
    }

    MergeResult merge_projects(const ProjectGroupMap& groups,
                               const MergeRequest& request) {
      auto& logger = logger::Logger::get_logger();
      MergeResult result;
      std::string single_code;
      size_t done = 0;
      for (auto& [id, group] : groups) {
        logger.progress("merge_projects", done++, groups.size());
        if (group.empty()) continue;
        if (group.is_single()) {
          for (auto& p : finish_single(group, request, single_code)) {
            result.outputs.push_back(p);
          }
          continue;
        }

        auto merged = group.directory / "merged.tif";
        auto warp = reconciler.warp_and_merge(group.files, merged);
        if (result.authority_code.empty()) {
          result.authority_code = warp.authority_code;
        }
        result.outputs.push_back(merged);

        std::optional<arr2i> size;
        for (auto& p : finish(merged, warp.authority_code, request, size)) {
          result.outputs.push_back(p);
        }
        if (!request.keep_originals) clean_directory(group.directory, request);
      }
      if (result.authority_code.empty()) result.authority_code = single_code;
      return result;
    }

    MergeResult merge_all(const ProjectGroupMap& groups,
                          const MergeRequest& request) {
      auto& logger = logger::Logger::get_logger();
      MergeResult result;
      vec1p all_files;
      for (auto& [id, group] : groups) {
        all_files.insert(all_files.end(), group.files.begin(),
                         group.files.end());
      }
      if (all_files.empty()) {
        logger.info("No DEM files to merge");
        return result;
      }

      auto top = groups.begin()->second.directory.parent_path();
      auto merged = top / "merged.tif";
      logger.info("Merging {} DEM file(s) from {} project(s) into {}",
                  all_files.size(), groups.size(), merged.string());
      auto warp = reconciler.warp_and_merge(all_files, merged);
      result.authority_code = warp.authority_code;
      result.outputs.push_back(merged);

      std::optional<arr2i> size;
      for (auto& p : finish(merged, warp.authority_code, request, size)) {
        result.outputs.push_back(p);
      }

      if (!request.keep_originals) {
        for (auto& [id, group] : groups) {
          auto n = retention.remove_tree(group.directory);
          logger.info("Removed project {} ({} entries)", id, n);
        }
        clean_directory(top, request);
      }
      return result;
    }

    MergeResult merge_both(const ProjectGroupMap& groups,
                           const MergeRequest& request) {
      auto& logger = logger::Logger::get_logger();
      MergeResult result;

      struct ProjectMerge {
        const ProjectGroup* group;
        fs::path merged;
        std::string authority_code;
      };
      std::vector<ProjectMerge> project_merges;
      std::vector<const ProjectGroup*> singles;
      vec1p representatives;
      // CRS of the original tiles, the per-project merges are in EPSG:4326
      std::vector<std::string> source_codes;

      for (auto& [id, group] : groups) {
        if (group.empty()) continue;
        if (group.is_single()) {
          auto& tile = group.files.front();
          try {
            source_codes.push_back(authority_code_of(tile));
          } catch (const InvalidInputError& e) {
            logger.warning("Skipping {}: {}", tile.string(), e.what());
            continue;
          } catch (const MissingMetadataError& e) {
            logger.warning("{}", e.what());
          }
          singles.push_back(&group);
          representatives.push_back(tile);
          continue;
        }
        auto merged = group.directory / "merged.tif";
        auto warp = reconciler.warp_and_merge(group.files, merged);
        source_codes.insert(source_codes.end(), warp.codes.begin(),
                            warp.codes.end());
        project_merges.push_back({&group, merged, warp.authority_code});
        representatives.push_back(merged);
        result.outputs.push_back(merged);
      }
      if (representatives.empty()) {
        logger.info("No DEM files to merge");
        return result;
      }

      auto top = groups.begin()->second.directory.parent_path();
      auto merged = top / "merged.tif";
      logger.info("Merging {} project representative(s) into {}",
                  representatives.size(), merged.string());
      CrsReconcilerConfig config;
      config.source_codes = source_codes;
      auto warp = reconciler.warp_and_merge(representatives, merged, config);
      result.authority_code = warp.authority_code;
      result.outputs.push_back(merged);

      std::optional<arr2i> size;
      for (auto& p : finish(merged, warp.authority_code, request, size)) {
        result.outputs.push_back(p);
      }
      for (auto& pm : project_merges) {
        auto project_size = size;
        for (auto& p : finish(pm.merged, pm.authority_code, request,
                              project_size)) {
          result.outputs.push_back(p);
        }
      }
      for (auto* group : singles) {
        std::string code;
        for (auto& p : finish_single(*group, request, code, size)) {
          result.outputs.push_back(p);
        }
      }

      if (!request.keep_originals) {
        for (auto& pm : project_merges) {
          clean_directory(pm.group->directory, request);
        }
        clean_directory(top, request);
      }
      return result;
    }

    MergeResult merge(const ProjectGroupMap& groups,
                      const MergeRequest& request) override {
      request.validate();
      auto& logger = logger::Logger::get_logger();
      size_t n_files = 0;
      for (auto& [id, group] : groups) n_files += group.size();
      logger.info("Merging {} DEM file(s) in {} project(s), scope {}",
                  n_files, groups.size(), name_of(request.merge_scope));

      switch (request.merge_scope) {
        case MergeScope::project:
          return merge_projects(groups, request);
        case MergeScope::all:
          return merge_all(groups, request);
        case MergeScope::both:
          return merge_both(groups, request);
      }
      return MergeResult();
    }
  };

  std::unique_ptr<RasterMergeEngineInterface> createRasterMergeEngine(
      CrsReconcilerInterface& reconciler, io::RasterWarperInterface& warper,
      io::RasterWriterInterface& writer, RetentionPolicyInterface& retention,
      ProvenanceLedger* ledger) {
    return std::make_unique<RasterMergeEngine>(reconciler, warper, writer,
                                               retention, ledger);
  }
}  // namespace terraprep::pipeline
