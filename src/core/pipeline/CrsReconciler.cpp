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
#include <terraprep/io/RasterDataset.hpp>
#include <terraprep/logger/logger.h>
#include <terraprep/pipeline/CrsReconciler.hpp>

namespace terraprep::pipeline {

  struct CrsReconciler : public CrsReconcilerInterface {
    CrsDecisionPolicyInterface& policy;
    UnitNormalizerInterface& normalizer;
    io::RasterWarperInterface& warper;
    ProvenanceLedger* ledger;

    CrsReconciler(CrsDecisionPolicyInterface& policy,
                  UnitNormalizerInterface& normalizer,
                  io::RasterWarperInterface& warper, ProvenanceLedger* ledger)
        : policy(policy),
          normalizer(normalizer),
          warper(warper),
          ledger(ledger){};

    static void remove_temporaries(const vec1p& temporaries,
                                   ProvenanceLedger* ledger) {
      for (auto& tmp : temporaries) {
        std::error_code ec;
        fs::remove(tmp, ec);
        if (ec) {
          logger::Logger::get_logger().warning("Could not remove {}: {}",
                                               tmp.string(), ec.message());
        }
        if (ledger) ledger->forget(tmp);
      }
    }

    WarpResult warp_and_merge(const vec1p& inputs, const fs::path& output,
                              CrsReconcilerConfig config) override {
      auto& logger = logger::Logger::get_logger();
      auto ds = io::createRasterDatasetGDAL();

      vec1p usable, temporaries;
      std::vector<std::string> codes_in_order;
      std::set<std::string> codes;

      for (auto& input : inputs) {
        try {
          ds->open(input);
        } catch (const InvalidInputError& e) {
          logger.warning("Skipping {}: {}", input.string(), e.what());
          continue;
        }
        auto code = ds->authority_code();
        ds->close();
        if (code.empty()) {
          logger.warning("Could not determine the CRS of {}",
                         input.filename().string());
        } else if (codes.insert(code).second) {
          codes_in_order.push_back(code);
        }

        if (!config.normalize_units) {
          usable.push_back(input);
          continue;
        }
        try {
          if (auto converted = normalizer.normalize(input)) {
            if (ledger) ledger->record(*converted, FileRole::converted);
            temporaries.push_back(*converted);
            usable.push_back(*converted);
          } else {
            usable.push_back(input);
          }
        } catch (const InvalidInputError& e) {
          logger.warning("Skipping {}: {}", input.string(), e.what());
        } catch (...) {
          remove_temporaries(temporaries, ledger);
          throw;
        }
      }

      if (usable.empty()) {
        throw MergeError("None of the " + std::to_string(inputs.size()) +
                         " input raster(s) for " + output.string() +
                         " could be opened.");
      }

      if (!config.source_codes.empty()) {
        codes.clear();
        codes_in_order.clear();
        for (auto& code : config.source_codes) {
          if (codes.insert(code).second) codes_in_order.push_back(code);
        }
      }

      if (codes.size() > 1) {
        if (policy.resolve(codes) == CrsDecision::abort) {
          remove_temporaries(temporaries, ledger);
          throw CrsMismatchAbort("Merge of " + output.string() +
                                 " declined because the inputs use " +
                                 std::to_string(codes.size()) +
                                 " different coordinate reference systems.");
        }
      } else if (codes.size() == 1) {
        logger.debug("All inputs for {} are in {}", output.string(),
                     *codes.begin());
      }

      try {
        warper.mosaic(usable, output, config.target_crs);
      } catch (...) {
        remove_temporaries(temporaries, ledger);
        throw;
      }
      remove_temporaries(temporaries, ledger);
      if (ledger) ledger->record(output, FileRole::merged);

      WarpResult result;
      result.output = output;
      result.authority_code =
          codes_in_order.empty() ? config.target_crs : codes_in_order.front();
      result.codes = codes_in_order;
      result.n_inputs = usable.size();
      return result;
    }
  };

  std::unique_ptr<CrsReconcilerInterface> createCrsReconciler(
      CrsDecisionPolicyInterface& policy, UnitNormalizerInterface& normalizer,
      io::RasterWarperInterface& warper, ProvenanceLedger* ledger) {
    return std::make_unique<CrsReconciler>(policy, normalizer, warper, ledger);
  }
}  // namespace terraprep::pipeline
