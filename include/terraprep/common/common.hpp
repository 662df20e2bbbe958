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

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "box.hpp"

namespace terraprep {

  namespace fs = std::filesystem;

  typedef std::array<double, 2> arr2d;
  typedef std::array<double, 3> arr3d;
  typedef std::array<int, 2> arr2i;
  typedef std::vector<std::string> vec1s;
  typedef std::vector<fs::path> vec1p;

  enum class DataKind { dem, lidar };

  enum class MergeScope { project, all, both };

  enum class OutputFormat { tif, png, r16 };

  enum class ResolutionMode { none, automatic, fixed };

  // Role of a file on disk, recorded when the file is created.
  enum class FileRole {
    original,
    merged,
    filtered,
    tile,
    intermediate,
    converted,
    sidecar
  };

  // Directory name below the output directory, "dem" or "lidar".
  std::string dirname_of(DataKind kind);

  // File extension without the leading dot.
  std::string extension_of(OutputFormat format);

  std::string name_of(MergeScope scope);
  std::string name_of(FileRole role);

  OutputFormat parse_output_format(const std::string& s);
  MergeScope parse_merge_scope(const std::string& s);

  std::vector<std::string> split_string(const std::string& s,
                                        std::string delimiter);

  std::string to_lower(std::string s);

  // Case-insensitive substring test.
  bool contains_ci(const std::string& haystack, const std::string& needle);

  // Extension of path without the dot, lowercased. "merged.png.aux.xml" ->
  // "xml".
  std::string lower_extension(const fs::path& path);

  // Lexically normal absolute form of a path, used as a lookup key.
  std::string path_key(const fs::path& path);

}  // namespace terraprep
