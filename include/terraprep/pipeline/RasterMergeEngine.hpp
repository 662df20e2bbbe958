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
#include <terraprep/io/RasterWarper.hpp>
#include <terraprep/io/RasterWriter.hpp>
#include <terraprep/pipeline/CrsReconciler.hpp>
#include <terraprep/pipeline/RetentionPolicy.hpp>

namespace terraprep::pipeline {

  // Landscape sizes accepted by common terrain import tooling.
  constexpr std::array<int, 4> RESOLUTION_CANDIDATES = {1009, 2017, 4033,
                                                        8129};

  // Output {width, height} for a raster of native size width x height.
  arr2i get_resolution(int width, int height, const TargetResolution& target);

  struct RasterMergeEngineInterface {
    virtual ~RasterMergeEngineInterface() = default;

    /**
     * @brief Merges the DEM tiles of groups according to request.merge_scope.
     *
     * Groups with a single tile are never merged. The authority code of the
     * result is that of the first merge, outputs lists every artifact that
     * was written (merged, cropped and encoded). Throws CrsMismatchAbort when
     * the CRS decision policy declines a merge and ConfigError on an invalid
     * request.
     */
    virtual MergeResult merge(const ProjectGroupMap& groups,
                              const MergeRequest& request) = 0;

    // Crops raster to aoi (lon/lat) in authority_code and writes output.
    // size overrides the resolution policy. Returns the output size.
    virtual arr2i crop(const fs::path& raster, const fs::path& output,
                       const std::string& authority_code, const Box& aoi,
                       const TargetResolution& target,
                       std::optional<arr2i> size = std::nullopt) = 0;

    // Encodes a GeoTIFF as <stem>.<ext> next to it, returns the new path.
    // tif returns tif_path unchanged.
    virtual fs::path convert(const fs::path& tif_path, OutputFormat format,
                             int precision) = 0;

    // Per tile crop and encode of a group to heightmap<N>[_filtered].<ext>.
    // Unreadable tiles are skipped.
    virtual vec1p prepare_tiles(const ProjectGroup& group,
                                const MergeRequest& request) = 0;
  };

  std::unique_ptr<RasterMergeEngineInterface> createRasterMergeEngine(
      CrsReconcilerInterface& reconciler, io::RasterWarperInterface& warper,
      io::RasterWriterInterface& writer, RetentionPolicyInterface& retention,
      ProvenanceLedger* ledger = nullptr);
}  // namespace terraprep::pipeline
