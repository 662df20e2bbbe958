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
#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <terraprep/common/datastructures.hpp>

template <typename T>
using Validator = std::function<std::optional<std::string>(const T&)>;

namespace terraprep::validators {
  // Concept to ensure types are comparable
  template <typename T>
  concept Comparable = requires(T a, T b) {
    { a < b } -> std::convertible_to<bool>;
    { a > b } -> std::convertible_to<bool>;
  };

  template <typename T>
    requires Comparable<T>
  auto InRange(T min, T max) {
    return [min, max](const T& val) -> std::optional<std::string> {
      if (val < min || val > max) {
        return std::format("Value {} is out of range <{}, {}>.", val, min, max);
      }
      return std::nullopt;
    };
  };

  template <typename T>
    requires Comparable<T>
  auto HigherThan(T min) {
    return [min](const T& val) -> std::optional<std::string> {
      if (val <= min) {
        return std::format("Value must be higher than {}.", min);
      }
      return std::nullopt;
    };
  };

  template <typename T>
    requires Comparable<T>
  auto HigherOrEqualTo(T min) {
    return [min](const T& val) -> std::optional<std::string> {
      if (val < min) {
        return std::format(
            "Value must be higher than or equal to {}. But is {}.", min, val);
      }
      return std::nullopt;
    };
  };

  template <typename T>
  auto OneOf(std::vector<T> values) {
    return [values](const T& val) -> std::optional<std::string> {
      if (std::find(values.begin(), values.end(), val) == values.end()) {
        std::string allowed;
        for (auto& v : values) {
          allowed += allowed.empty() ? std::format("{}", v)
                                     : std::format(", {}", v);
        }
        return std::format("Value {} is not one of {}.", val, allowed);
      }
      return std::nullopt;
    };
  };

  // Lon/lat box: min < max, lon in [-180, 180] and lat in [-90, 90].
  inline auto ValidAreaOfInterest =
      [](const terraprep::Box& box) -> std::optional<std::string> {
    if (box.pmin[0] >= box.pmax[0] || box.pmin[1] >= box.pmax[1]) {
      return "Box is invalid, min must be smaller than max.";
    }
    if (!terraprep::is_valid_area_of_interest(box)) {
      return "Box is outside of the longitude/latitude bounds.";
    }
    return std::nullopt;
  };

  inline auto ValidResolution =
      [](const std::string& value) -> std::optional<std::string> {
    try {
      terraprep::TargetResolution::parse(value);
    } catch (const terraprep::ResolutionError& e) {
      return std::string(e.what());
    }
    return std::nullopt;
  };

  inline auto PathExists =
      [](const std::string& path) -> std::optional<std::string> {
    if (!std::filesystem::exists(path)) {
      return std::format("Path {} does not exist.", path);
    }
    return std::nullopt;
  };

  // The first existing parent of path must be a writable directory.
  inline auto DirIsWritable =
      [](const std::string& path) -> std::optional<std::string> {
    auto parent = std::filesystem::absolute(std::filesystem::path(path));
    while (!std::filesystem::exists(parent)) {
      parent = parent.parent_path();
    }
    if (!std::filesystem::is_directory(parent)) {
      return std::format("Path {} is not a directory.", parent.string());
    }

    auto test_path = parent / "terraprep_write_test.tmp";
    bool writable = false;
    {
      std::ofstream test_file(test_path);
      writable = bool(test_file);
    }
    std::error_code ec;
    std::filesystem::remove(test_path, ec);
    if (!writable) {
      return std::format("Could not write to directory {}.", parent.string());
    }
    return std::nullopt;
  };
}  // namespace terraprep::validators
