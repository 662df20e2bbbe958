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
#include <iosfwd>
#include <memory>
#include <set>
#include <string>

namespace terraprep::pipeline {

  enum class CrsDecision { proceed, abort };

  // Decides whether inputs with differing horizontal CRS may be merged.
  struct CrsDecisionPolicyInterface {
    virtual ~CrsDecisionPolicyInterface() = default;
    virtual CrsDecision resolve(const std::set<std::string>& candidates) = 0;
  };

  std::unique_ptr<CrsDecisionPolicyInterface> createAutoConfirmPolicy();
  std::unique_ptr<CrsDecisionPolicyInterface> createAutoAbortPolicy();
  // Asks on out and reads the answer from in. End of input declines.
  std::unique_ptr<CrsDecisionPolicyInterface> createPromptPolicy(
      std::istream& in, std::ostream& out);

  // "abort", "proceed" or "prompt" (on std::cin/std::cout).
  std::unique_ptr<CrsDecisionPolicyInterface> createCrsDecisionPolicy(
      const std::string& mode);
}  // namespace terraprep::pipeline
