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
#include <terraprep/pipeline/ProjectGrouper.hpp>

namespace terraprep::pipeline {

  std::string project_name_from_url(const std::string& url) {
    static const std::string marker = "Projects/";
    auto pos = url.find(marker);
    if (pos == std::string::npos) {
      throw MalformedUrlError("URL " + url + " has no '" + marker +
                              "' segment.");
    }
    auto name = split_string(url.substr(pos + marker.size()), "/").front();
    if (name.empty()) {
      throw MalformedUrlError("URL " + url + " has an empty project name.");
    }
    return name;
  }

  fs::path project_directory_for(const fs::path& output_dir, DataKind kind,
                                 const std::string& url) {
    return output_dir / dirname_of(kind) / project_name_from_url(url);
  }

  bool is_original_tile(const fs::path& file, DataKind kind) {
    const auto name = file.filename().string();
    const auto ext = lower_extension(file);
    if (kind == DataKind::dem) {
      if (ext != "tif") return false;
      for (auto marker : {"merged", "filtered", "warped", "_converted"}) {
        if (contains_ci(name, marker)) return false;
      }
      return true;
    }
    if (ext != "las" && ext != "laz") return false;
    for (auto marker : {"merged", "_reprojected", "_filtered"}) {
      if (contains_ci(name, marker)) return false;
    }
    return true;
  }

  struct ProjectGrouper : public ProjectGrouperInterface {
    // Original tiles in a project directory. An unreadable directory is
    // logged and yields what could be listed.
    static vec1p list_tiles(const fs::path& directory, DataKind kind) {
      vec1p tiles;
      std::error_code ec;
      auto it = fs::directory_iterator(directory, ec);
      for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) &&
            is_original_tile(it->path(), kind)) {
          tiles.push_back(it->path());
        }
      }
      if (ec) {
        logger::Logger::get_logger().warning(
            "Could not list {}: {}", directory.string(), ec.message());
      }
      return tiles;
    }

    ProjectGroupMap group(const fs::path& existing_output_dir,
                          DataKind kind) override {
      auto& logger = logger::Logger::get_logger();
      ProjectGroupMap groups;
      const auto kind_dir = existing_output_dir / dirname_of(kind);

      std::error_code ec;
      if (!fs::is_directory(kind_dir, ec)) {
        logger.debug("No {} directory at {}", dirname_of(kind),
                     kind_dir.string());
        return groups;
      }

      auto projects = fs::directory_iterator(kind_dir, ec);
      if (ec) {
        logger.warning("Could not list {}: {}", kind_dir.string(),
                       ec.message());
        return groups;
      }
      for (; projects != fs::directory_iterator(); projects.increment(ec)) {
        auto& project = *projects;
        std::error_code entry_ec;
        if (!project.is_directory(entry_ec)) continue;
        auto tiles = list_tiles(project.path(), kind);
        // directory iteration order is unspecified
        std::sort(tiles.begin(), tiles.end());
        for (auto& tile : tiles) append(groups, project.path(), tile);
      }
      if (ec) {
        logger.warning("Listing {} stopped early: {}", kind_dir.string(),
                       ec.message());
      }

      size_t n_files = 0;
      for (auto& [id, group] : groups) n_files += group.size();
      logger.info("Found {} existing {} file(s) in {} project(s)", n_files,
                  dirname_of(kind), groups.size());
      return groups;
    }

    bool append(ProjectGroupMap& groups, const fs::path& project_directory,
                const fs::path& file) override {
      auto directory = project_directory.lexically_normal();
      if (directory.filename().empty()) directory = directory.parent_path();
      const auto id = directory.filename().string();
      auto [it, inserted] = groups.try_emplace(id);
      auto& group = it->second;
      if (inserted) {
        group.id = id;
        group.directory = directory;
      }
      const auto key = path_key(file);
      for (auto& existing : group.files) {
        if (path_key(existing) == key) return false;
      }
      group.files.push_back(file);
      return true;
    }
  };

  std::unique_ptr<ProjectGrouperInterface> createProjectGrouper() {
    return std::make_unique<ProjectGrouper>();
  }
}  // namespace terraprep::pipeline
