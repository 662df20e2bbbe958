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
#include <memory>
#include <terraprep/common/datastructures.hpp>
#include <terraprep/pipeline/RetentionPolicy.hpp>

namespace terraprep::pipeline {

  struct PointCloudMergeConfig {
    // Run groups with a single file through the merge as well, so that
    // every project ends up with the same output name.
    bool merge_single_file_groups = true;
    std::string output_name = "merged.laz";
  };

  // Last EPSG authority tag in a WKT text, AUTHORITY["EPSG","n"] (WKT1) or
  // ID["EPSG",n] (WKT2), as "EPSG:n".
  std::optional<std::string> find_epsg_tag(const std::string& wkt);

  // Horizontal CRS of a point cloud as "EPSG:n", from the OGC WKT record,
  // then the raw WKT text, then the GeoTIFF keys. Throws
  // InvalidPointCloudError for unreadable files and MissingMetadataError
  // when none of them carries a code.
  std::string detect_epsg(const fs::path& path);

  struct PointCloudMergeEngineInterface {
    virtual ~PointCloudMergeEngineInterface() = default;

    // Concatenates the files of each group into <directory>/merged.laz.
    // Invalid files are skipped, a group that fails is logged and left out
    // of the result. Keyed by group id.
    virtual std::map<std::string, fs::path> merge(
        const ProjectGroupMap& groups, bool keep_originals) = 0;

    // Writes <stem>_reprojected.laz for every file whose CRS is known.
    // Files of legacy projects are skipped. Keyed by group id, groups
    // without output are absent.
    virtual std::map<std::string, vec1p> reproject(
        const ProjectGroupMap& groups, const std::string& target_crs) = 0;

    // Crops each point cloud to bbox (lon/lat) into output_name next to it.
    virtual std::map<std::string, fs::path> crop(
        const std::map<std::string, fs::path>& point_clouds,
        const std::string& output_name, const Box& bbox) = 0;
  };

  std::unique_ptr<PointCloudMergeEngineInterface> createPointCloudMergeEngine(
      RetentionPolicyInterface& retention, ProvenanceLedger* ledger = nullptr,
      PointCloudMergeConfig config = PointCloudMergeConfig());
}  // namespace terraprep::pipeline
