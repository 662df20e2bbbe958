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

namespace terraprep::pipeline {

  // Name based rule for files without recorded provenance. XML sidecars are
  // never kept. With keep_merged a file is kept when its name contains both
  // "merged" and target_extension, otherwise when it contains
  // target_extension.
  bool should_keep(const std::string& filename,
                   const std::string& target_extension, bool keep_merged);

  // Rule for files with a recorded role: merged and filtered artifacts with
  // the target extension are kept (with keep_merged), or any non-sidecar
  // file with the target extension (without).
  bool should_keep(FileRole role, const fs::path& file,
                   const std::string& target_extension, bool keep_merged);

  struct RetentionPolicyInterface {
    virtual ~RetentionPolicyInterface() = default;

    // Regular files in directory (not recursive) that are not final
    // artifacts for target_extension.
    virtual vec1p files_to_remove(const fs::path& directory,
                                  const std::string& target_extension,
                                  bool keep_merged = true) = 0;

    // Best effort, failures are logged. Returns the number removed.
    virtual size_t remove(const vec1p& paths) = 0;

    // Removes a whole project directory tree, best effort.
    virtual size_t remove_tree(const fs::path& directory) = 0;
  };

  // ledger may be null, then only the name rule applies.
  std::unique_ptr<RetentionPolicyInterface> createRetentionPolicy(
      ProvenanceLedger* ledger = nullptr);
}  // namespace terraprep::pipeline
