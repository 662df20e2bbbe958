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
#include <terraprep/pipeline/CrsDecisionPolicy.hpp>
#include <terraprep/pipeline/UnitNormalizer.hpp>

namespace terraprep::pipeline {

  struct CrsReconcilerConfig {
    std::string target_crs = "EPSG:4326";
    bool normalize_units = true;
    // CRS of the original tiles behind the inputs. When set, the mismatch
    // check and the reported authority code use these instead of the CRS
    // read from the inputs, which may be intermediates in target_crs.
    std::vector<std::string> source_codes;
  };

  struct WarpResult {
    fs::path output;
    // Authority code of the first input with a detectable CRS, the target
    // CRS when none was detectable.
    std::string authority_code;
    // Distinct authority codes in input order.
    std::vector<std::string> codes;
    std::string vertical_unit = "metre";
    size_t n_inputs = 0;
  };

  struct CrsReconcilerInterface {
    virtual ~CrsReconcilerInterface() = default;

    // Mosaics inputs into output. Unreadable inputs are skipped, throws
    // MergeError when none are left and CrsMismatchAbort when the decision
    // policy declines differing input CRS.
    virtual WarpResult warp_and_merge(
        const vec1p& inputs, const fs::path& output,
        CrsReconcilerConfig config = CrsReconcilerConfig()) = 0;
  };

  std::unique_ptr<CrsReconcilerInterface> createCrsReconciler(
      CrsDecisionPolicyInterface& policy, UnitNormalizerInterface& normalizer,
      io::RasterWarperInterface& warper, ProvenanceLedger* ledger = nullptr);
}  // namespace terraprep::pipeline
