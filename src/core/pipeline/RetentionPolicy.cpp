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

#include <algorithm>
#include <terraprep/logger/logger.h>
#include <terraprep/pipeline/RetentionPolicy.hpp>

namespace terraprep::pipeline {

  bool should_keep(const std::string& filename,
                   const std::string& target_extension, bool keep_merged) {
    if (contains_ci(filename, "xml")) return false;
    bool has_extension = contains_ci(filename, target_extension);
    if (keep_merged) return has_extension && contains_ci(filename, "merged");
    return has_extension;
  }

  bool should_keep(FileRole role, const fs::path& file,
                   const std::string& target_extension, bool keep_merged) {
    if (role == FileRole::sidecar) return false;
    if (lower_extension(file) != to_lower(target_extension)) return false;
    if (keep_merged) {
      return role == FileRole::merged || role == FileRole::filtered;
    }
    return true;
  }

  struct RetentionPolicy : public RetentionPolicyInterface {
    ProvenanceLedger* ledger;

    RetentionPolicy(ProvenanceLedger* ledger) : ledger(ledger){};

    vec1p files_to_remove(const fs::path& directory,
                          const std::string& target_extension,
                          bool keep_merged) override {
      vec1p removable;
      std::error_code ec;
      if (!fs::is_directory(directory, ec)) return removable;

      auto it = fs::directory_iterator(directory, ec);
      for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) continue;
        const auto& file = it->path();
        std::optional<FileRole> role;
        if (ledger) role = ledger->role_of(file);
        bool keep =
            role.has_value()
                ? should_keep(*role, file, target_extension, keep_merged)
                : should_keep(file.filename().string(), target_extension,
                              keep_merged);
        if (!keep) removable.push_back(file);
      }
      if (ec) {
        logger::Logger::get_logger().warning(
            "Could not list {}: {}", directory.string(), ec.message());
      }
      std::sort(removable.begin(), removable.end());
      return removable;
    }

    size_t remove(const vec1p& paths) override {
      auto& logger = logger::Logger::get_logger();
      size_t n_removed = 0;
      for (auto& path : paths) {
        std::error_code ec;
        if (fs::remove(path, ec)) {
          ++n_removed;
          logger.debug("Removed {}", path.string());
        } else if (ec) {
          logger.warning("Could not remove {}: {}", path.string(),
                         ec.message());
        } else {
          logger.warning("Could not remove {}: file does not exist",
                         path.string());
        }
        if (ledger) ledger->forget(path);
      }
      return n_removed;
    }

    size_t remove_tree(const fs::path& directory) override {
      std::error_code ec;
      auto n_removed = fs::remove_all(directory, ec);
      if (ec) {
        logger::Logger::get_logger().warning("Could not remove {}: {}",
                                             directory.string(), ec.message());
        return 0;
      }
      return size_t(n_removed);
    }
  };

  std::unique_ptr<RetentionPolicyInterface> createRetentionPolicy(
      ProvenanceLedger* ledger) {
    return std::make_unique<RetentionPolicy>(ledger);
  }
}  // namespace terraprep::pipeline
