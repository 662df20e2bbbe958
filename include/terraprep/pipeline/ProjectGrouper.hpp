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

  // Path segment after "Projects/" in a catalog download URL. Throws
  // MalformedUrlError when the marker or the segment is missing.
  std::string project_name_from_url(const std::string& url);

  // <output_dir>/<dem|lidar>/<project name>
  fs::path project_directory_for(const fs::path& output_dir, DataKind kind,
                                 const std::string& url);

  // True for files that were downloaded as-is, as opposed to files written
  // by the merge engines.
  bool is_original_tile(const fs::path& file, DataKind kind);

  struct ProjectGrouperInterface {
    virtual ~ProjectGrouperInterface() = default;

    // Rediscovers original tiles in <existing_output_dir>/<kind>/*/. A
    // missing directory yields an empty map.
    virtual ProjectGroupMap group(const fs::path& existing_output_dir,
                                  DataKind kind) = 0;

    // Adds file to the group of project_directory, creating the group if
    // needed. Returns false when the file was already present.
    virtual bool append(ProjectGroupMap& groups,
                        const fs::path& project_directory,
                        const fs::path& file) = 0;
  };

  std::unique_ptr<ProjectGrouperInterface> createProjectGrouper();
}  // namespace terraprep::pipeline
