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

#include <set>
#include <terraprep/io/RasterWarper.hpp>
#include <terraprep/io/RasterWriter.hpp>
#include <terraprep/logger/logger.h>
#include <terraprep/pipeline/CrsReconciler.hpp>
#include <terraprep/pipeline/Pipeline.hpp>
#include <terraprep/pipeline/PointCloudMergeEngine.hpp>
#include <terraprep/pipeline/ProjectGrouper.hpp>
#include <terraprep/pipeline/RasterMergeEngine.hpp>
#include <terraprep/pipeline/RetentionPolicy.hpp>
#include <terraprep/pipeline/UnitNormalizer.hpp>

namespace terraprep::pipeline {

  DemFilter parse_dem_filter(const std::string& s) {
    auto v = to_lower(s);
    if (v == "none") return DemFilter::none;
    if (v == "merge") return DemFilter::merge;
    if (v == "all") return DemFilter::all;
    throw ConfigError("Unknown DEM filter type '" + s +
                      "', expected one of none, merge, all.");
  }

  std::string name_of(DemFilter filter) {
    switch (filter) {
      case DemFilter::none:
        return "none";
      case DemFilter::merge:
        return "merge";
      case DemFilter::all:
        return "all";
    }
    return "";
  }

  void PipelineConfig::validate() const {
    bool needs_aoi = (process_dem && dem_filter != DemFilter::none) ||
                     (process_lidar && merge_lidar && filter_lidar);
    if (needs_aoi && !area_of_interest.has_value()) {
      throw ConfigError(
          "Cropping is enabled but no area of interest (aoi) is set.");
    }
    if (area_of_interest && !is_valid_area_of_interest(*area_of_interest)) {
      throw ConfigError("Area of interest " + area_of_interest->wkt() +
                        " is not a valid lon/lat box.");
    }
    if (process_dem) dem_merge_request().validate();
  }

  MergeRequest PipelineConfig::dem_merge_request() const {
    MergeRequest request;
    request.merge_scope = dem_merge_scope;
    request.keep_originals = keep_dem_originals;
    request.output_format = dem_output;
    request.precision = png_precision;
    request.crop_enabled = dem_filter != DemFilter::none;
    request.area_of_interest = area_of_interest;
    request.target_resolution = dem_resolution;
    return request;
  }

  namespace {
    // Engines and the provenance ledger shared by both stages.
    struct Stages {
      ProvenanceLedger ledger;
      std::unique_ptr<ProjectGrouperInterface> grouper =
          createProjectGrouper();
      std::unique_ptr<io::RasterWarperInterface> warper =
          io::createRasterWarperGDAL();
      std::unique_ptr<io::RasterWriterInterface> writer =
          io::createRasterWriterGDAL();
      std::unique_ptr<RetentionPolicyInterface> retention =
          createRetentionPolicy(&ledger);
      std::unique_ptr<UnitNormalizerInterface> normalizer =
          createUnitNormalizer(*writer);
    };

    void run_dem_stage(const PipelineConfig& cfg,
                       CrsDecisionPolicyInterface& crs_policy, Stages& stages,
                       PipelineReport& report) {
      auto& logger = logger::Logger::get_logger();
      auto groups = stages.grouper->group(cfg.output_directory, DataKind::dem);
      if (groups.empty()) {
        logger.info("No DEM projects found in {}",
                    cfg.output_directory.string());
        return;
      }
      for (auto& [id, group] : groups) {
        for (auto& file : group.files) {
          stages.ledger.record(file, FileRole::original);
        }
      }

      auto reconciler =
          createCrsReconciler(crs_policy, *stages.normalizer, *stages.warper,
                              &stages.ledger);
      auto engine = createRasterMergeEngine(*reconciler, *stages.warper,
                                            *stages.writer, *stages.retention,
                                            &stages.ledger);

      auto request = cfg.dem_merge_request();
      if (cfg.dem_output != OutputFormat::tif ||
          cfg.dem_filter == DemFilter::all) {
        auto tile_request = request;
        tile_request.crop_enabled = cfg.dem_filter == DemFilter::all;
        for (auto& [id, group] : groups) {
          auto tiles = engine->prepare_tiles(group, tile_request);
          report.dem_tiles.insert(report.dem_tiles.end(), tiles.begin(),
                                  tiles.end());
        }
        logger.info("Prepared {} tile artifact(s)", report.dem_tiles.size());
      }

      if (!cfg.merge_dem) {
        logger.info("DEM merging is disabled");
        return;
      }
      report.dem = engine->merge(groups, request);
      logger.info("DEM stage wrote {} artifact(s), authority code {}",
                  report.dem.outputs.size(),
                  report.dem.authority_code.empty()
                      ? "unknown"
                      : report.dem.authority_code);
    }

    // Groups of reprojected files, in place of the originals they replace.
    // A group without any reprojected file keeps its originals, files that
    // were not reprojected in a partially reprojected group are left out
    // since they are in another CRS.
    ProjectGroupMap reprojected_groups(
        const ProjectGroupMap& groups,
        const std::map<std::string, vec1p>& reprojected) {
      auto& logger = logger::Logger::get_logger();
      ProjectGroupMap result;
      for (auto& [id, group] : groups) {
        auto it = reprojected.find(id);
        if (it == reprojected.end() || it->second.empty()) {
          if (!group.empty()) {
            logger.info("No reprojected point clouds in {}, merging its {} "
                        "original file(s)",
                        id, group.size());
          }
          result.emplace(id, group);
          continue;
        }
        std::set<std::string> done;
        for (auto& p : it->second) done.insert(path_key(p));
        for (auto& file : group.files) {
          auto expected = file.parent_path() /
                          (file.stem().string() + "_reprojected.laz");
          if (!done.count(path_key(expected))) {
            logger.warning("{} was not reprojected and is left out of the "
                           "merge of {}",
                           file.filename().string(), id);
          }
        }
        ProjectGroup g;
        g.id = id;
        g.directory = group.directory;
        g.files = it->second;
        result.emplace(id, std::move(g));
      }
      return result;
    }

    void run_lidar_stage(const PipelineConfig& cfg, const MergeResult& dem,
                         Stages& stages, PipelineReport& report) {
      auto& logger = logger::Logger::get_logger();
      auto groups =
          stages.grouper->group(cfg.output_directory, DataKind::lidar);
      if (groups.empty()) {
        logger.info("No LiDAR projects found in {}",
                    cfg.output_directory.string());
        return;
      }
      for (auto& [id, group] : groups) {
        for (auto& file : group.files) {
          stages.ledger.record(file, FileRole::original);
        }
      }

      PointCloudMergeConfig merge_cfg;
      merge_cfg.merge_single_file_groups = cfg.merge_single_lidar;
      auto engine = createPointCloudMergeEngine(*stages.retention,
                                                &stages.ledger, merge_cfg);

      if (cfg.reproject_lidar) {
        if (dem.authority_code.empty()) {
          logger.warning(
              "LiDAR reprojection skipped, the DEM stage produced no "
              "authority code");
        } else {
          report.lidar_reprojected =
              engine->reproject(groups, dem.authority_code);
          groups = reprojected_groups(groups, report.lidar_reprojected);
        }
      }

      if (!cfg.merge_lidar) {
        logger.info("LiDAR merging is disabled");
        return;
      }
      report.lidar_merged = engine->merge(groups, cfg.keep_lidar_originals);
      if (cfg.filter_lidar && !report.lidar_merged.empty()) {
        report.lidar_filtered =
            engine->crop(report.lidar_merged, cfg.lidar_filtered_name,
                         *cfg.area_of_interest);
      }
      logger.info("LiDAR stage merged {} and cropped {} project(s)",
                  report.lidar_merged.size(), report.lidar_filtered.size());
    }
  }  // namespace

  PipelineReport run_pipeline(const PipelineConfig& config,
                              CrsDecisionPolicyInterface& crs_policy) {
    auto& logger = logger::Logger::get_logger();
    config.validate();

    PipelineReport report;
    Stages stages;

    if (config.process_dem) {
      try {
        run_dem_stage(config, crs_policy, stages, report);
      } catch (const CrsMismatchAbort&) {
        throw;
      } catch (const terraprepException& e) {
        logger.error("DEM stage failed. {}", e.what());
        report.failed_stages.push_back("dem");
      } catch (const fs::filesystem_error& e) {
        logger.error("DEM stage failed. {}", e.what());
        report.failed_stages.push_back("dem");
      }
    }

    if (config.process_lidar) {
      try {
        run_lidar_stage(config, report.dem, stages, report);
      } catch (const terraprepException& e) {
        logger.error("LiDAR stage failed. {}", e.what());
        report.failed_stages.push_back("lidar");
      } catch (const fs::filesystem_error& e) {
        logger.error("LiDAR stage failed. {}", e.what());
        report.failed_stages.push_back("lidar");
      }
    }
    return report;
  }
}  // namespace terraprep::pipeline
