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
#include <map>
#include <terraprep/common/datastructures.hpp>
#include <terraprep/pipeline/CrsDecisionPolicy.hpp>

namespace terraprep::pipeline {

  // Which DEM rasters are cropped to the area of interest.
  enum class DemFilter { none, merge, all };

  DemFilter parse_dem_filter(const std::string& s);
  std::string name_of(DemFilter filter);

  struct PipelineConfig {
    fs::path output_directory;
    bool process_dem = true;
    bool process_lidar = false;
    // Required for any cropping.
    std::optional<Box> area_of_interest;

    bool merge_dem = true;
    bool keep_dem_originals = true;
    MergeScope dem_merge_scope = MergeScope::all;
    DemFilter dem_filter = DemFilter::none;
    TargetResolution dem_resolution;
    OutputFormat dem_output = OutputFormat::tif;
    int png_precision = 16;

    bool merge_lidar = true;
    bool keep_lidar_originals = true;
    bool filter_lidar = true;
    // Reproject point clouds to the CRS of the DEM merge before merging.
    bool reproject_lidar = false;
    bool merge_single_lidar = true;
    std::string lidar_filtered_name = "merged_filtered.laz";

    // Throws ConfigError.
    void validate() const;
    // The DEM part as a merge request for the raster engine.
    MergeRequest dem_merge_request() const;
  };

  struct PipelineReport {
    MergeResult dem;
    vec1p dem_tiles;
    std::map<std::string, vec1p> lidar_reprojected;
    std::map<std::string, fs::path> lidar_merged;
    std::map<std::string, fs::path> lidar_filtered;
    // "dem" and/or "lidar" when that stage failed.
    vec1s failed_stages;

    bool ok() const { return failed_stages.empty(); }
  };

  /**
   * @brief Runs the DEM stage, then the LiDAR stage, over the project
   * directories found in config.output_directory.
   *
   * A failure in one stage is logged and does not stop the other. A declined
   * CRS mismatch ends the run with CrsMismatchAbort.
   */
  PipelineReport run_pipeline(const PipelineConfig& config,
                              CrsDecisionPolicyInterface& crs_policy);
}  // namespace terraprep::pipeline
