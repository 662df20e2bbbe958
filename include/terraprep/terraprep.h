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

#include <terraprep/common/common.hpp>
#include <terraprep/common/datastructures.hpp>
#include <terraprep/logger/logger.h>
#include <terraprep/pipeline/CrsDecisionPolicy.hpp>
#include <terraprep/pipeline/CrsReconciler.hpp>
#include <terraprep/pipeline/Pipeline.hpp>
#include <terraprep/pipeline/PointCloudMergeEngine.hpp>
#include <terraprep/pipeline/ProjectGrouper.hpp>
#include <terraprep/pipeline/RasterMergeEngine.hpp>
#include <terraprep/pipeline/RetentionPolicy.hpp>
#include <terraprep/pipeline/UnitNormalizer.hpp>

namespace terraprep {

  /**
   * @brief Merges the DEM projects below output_directory/dem.
   *
   * Convenience wrapper that wires the GDAL backed engines together with a
   * shared provenance ledger. See RasterMergeEngineInterface::merge for the
   * meaning of the request fields.
   *
   * @param output_directory Directory that holds the dem/ project folders
   * @param request Scope, retention, crop and encoding of the merge
   * @param crs_policy Decides on merges of rasters with different CRS
   *
   * @return MergeResult with the authority code for aligning point clouds
   */
  inline MergeResult merge_dem(
      const fs::path& output_directory, const MergeRequest& request,
      pipeline::CrsDecisionPolicyInterface& crs_policy) {
    ProvenanceLedger ledger;
    auto groups =
        pipeline::createProjectGrouper()->group(output_directory, DataKind::dem);
    auto warper = io::createRasterWarperGDAL();
    auto writer = io::createRasterWriterGDAL();
    auto normalizer = pipeline::createUnitNormalizer(*writer);
    auto retention = pipeline::createRetentionPolicy(&ledger);
    auto reconciler = pipeline::createCrsReconciler(crs_policy, *normalizer,
                                                    *warper, &ledger);
    auto engine = pipeline::createRasterMergeEngine(
        *reconciler, *warper, *writer, *retention, &ledger);
    return engine->merge(groups, request);
  }
}  // namespace terraprep
