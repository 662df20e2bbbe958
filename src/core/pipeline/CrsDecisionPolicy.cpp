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

#include <cctype>
#include <iostream>
#include <terraprep/common/datastructures.hpp>
#include <terraprep/logger/logger.h>
#include <terraprep/pipeline/CrsDecisionPolicy.hpp>

namespace terraprep::pipeline {

  static std::string join(const std::set<std::string>& codes) {
    std::string s;
    for (auto& c : codes) {
      if (!s.empty()) s += ", ";
      s += c;
    }
    return s;
  }

  struct AutoConfirmPolicy : public CrsDecisionPolicyInterface {
    CrsDecision resolve(const std::set<std::string>& candidates) override {
      logger::Logger::get_logger().warning(
          "Merging inputs in different CRS ({}), results may be distorted",
          join(candidates));
      return CrsDecision::proceed;
    }
  };

  struct AutoAbortPolicy : public CrsDecisionPolicyInterface {
    CrsDecision resolve(const std::set<std::string>& candidates) override {
      logger::Logger::get_logger().error(
          "Inputs are in different CRS ({}), refusing to merge. Use "
          "--crs-mismatch proceed to merge anyway",
          join(candidates));
      return CrsDecision::abort;
    }
  };

  struct PromptPolicy : public CrsDecisionPolicyInterface {
    std::istream& in;
    std::ostream& out;

    PromptPolicy(std::istream& in, std::ostream& out) : in(in), out(out){};

    CrsDecision resolve(const std::set<std::string>& candidates) override {
      out << "Input rasters use different coordinate reference systems: "
          << join(candidates) << "\n"
          << "Merging them may introduce spatial distortion. Proceed? [y/N] "
          << std::flush;
      std::string answer;
      if (!std::getline(in, answer)) return CrsDecision::abort;
      std::erase_if(answer, [](unsigned char c) { return std::isspace(c); });
      answer = to_lower(answer);
      if (answer == "y" || answer == "yes") return CrsDecision::proceed;
      return CrsDecision::abort;
    }
  };

  std::unique_ptr<CrsDecisionPolicyInterface> createAutoConfirmPolicy() {
    return std::make_unique<AutoConfirmPolicy>();
  }

  std::unique_ptr<CrsDecisionPolicyInterface> createAutoAbortPolicy() {
    return std::make_unique<AutoAbortPolicy>();
  }

  std::unique_ptr<CrsDecisionPolicyInterface> createPromptPolicy(
      std::istream& in, std::ostream& out) {
    return std::make_unique<PromptPolicy>(in, out);
  }

  std::unique_ptr<CrsDecisionPolicyInterface> createCrsDecisionPolicy(
      const std::string& mode) {
    if (mode == "abort") return createAutoAbortPolicy();
    if (mode == "proceed") return createAutoConfirmPolicy();
    if (mode == "prompt") return createPromptPolicy(std::cin, std::cout);
    throw ConfigError("Unknown CRS mismatch policy '" + mode +
                      "', expected abort, proceed or prompt.");
  }
}  // namespace terraprep::pipeline
