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

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace terraprep::test {

  namespace fs = std::filesystem;

  // Scratch directory below the system temp dir, removed on destruction.
  struct ScratchDir {
    fs::path path;

    explicit ScratchDir(const std::string& prefix) {
      std::random_device rd;
      path = fs::temp_directory_path() /
             (prefix + "_" + std::to_string(rd()));
      fs::create_directories(path);
    }
    ~ScratchDir() {
      std::error_code ec;
      fs::remove_all(path, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    fs::path operator/(const std::string& rel) const { return path / rel; }
  };

  inline fs::path touch(const fs::path& file,
                        const std::string& content = "x") {
    fs::create_directories(file.parent_path());
    std::ofstream(file) << content;
    return file;
  }

  inline size_t count_files(const fs::path& dir) {
    size_t n = 0;
    for (auto& entry : fs::directory_iterator(dir)) {
      if (entry.is_regular_file()) ++n;
    }
    return n;
  }

}  // namespace terraprep::test
