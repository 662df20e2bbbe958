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
#include <cctype>
#include <charconv>
#include <terraprep/common/common.hpp>
#include <terraprep/common/datastructures.hpp>

namespace terraprep {

  std::string dirname_of(DataKind kind) {
    switch (kind) {
      case DataKind::dem:
        return "dem";
      case DataKind::lidar:
        return "lidar";
    }
    return "";
  }

  std::string extension_of(OutputFormat format) {
    switch (format) {
      case OutputFormat::tif:
        return "tif";
      case OutputFormat::png:
        return "png";
      case OutputFormat::r16:
        return "r16";
    }
    return "";
  }

  std::string name_of(MergeScope scope) {
    switch (scope) {
      case MergeScope::project:
        return "project";
      case MergeScope::all:
        return "all";
      case MergeScope::both:
        return "both";
    }
    return "";
  }

  std::string name_of(FileRole role) {
    switch (role) {
      case FileRole::original:
        return "original";
      case FileRole::merged:
        return "merged";
      case FileRole::filtered:
        return "filtered";
      case FileRole::tile:
        return "tile";
      case FileRole::intermediate:
        return "intermediate";
      case FileRole::converted:
        return "converted";
      case FileRole::sidecar:
        return "sidecar";
    }
    return "";
  }

  std::string name_of(UnitSource source) {
    switch (source) {
      case UnitSource::band:
        return "band";
      case UnitSource::vertical_crs:
        return "vertical_crs";
      case UnitSource::heuristic:
        return "heuristic";
      case UnitSource::unknown:
        return "unknown";
      case UnitSource::error:
        return "error";
    }
    return "";
  }

  OutputFormat parse_output_format(const std::string& s) {
    auto v = to_lower(s);
    if (v == "tif" || v == "tiff") return OutputFormat::tif;
    if (v == "png") return OutputFormat::png;
    if (v == "r16") return OutputFormat::r16;
    throw ConfigError("Unknown output format '" + s +
                      "', expected one of tif, png, r16.");
  }

  MergeScope parse_merge_scope(const std::string& s) {
    auto v = to_lower(s);
    if (v == "project") return MergeScope::project;
    if (v == "all") return MergeScope::all;
    if (v == "both") return MergeScope::both;
    throw ConfigError("Unknown merge scope '" + s +
                      "', expected one of project, all, both.");
  }

  std::vector<std::string> split_string(const std::string& s,
                                        std::string delimiter) {
    std::vector<std::string> parts;
    if (delimiter.empty()) {
      parts.push_back(s);
      return parts;
    }
    size_t last = 0;
    size_t next = 0;

    while ((next = s.find(delimiter, last)) != std::string::npos) {
      parts.push_back(s.substr(last, next - last));
      last = next + delimiter.size();
    }
    parts.push_back(s.substr(last));
    return parts;
  }

  std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
  }

  bool contains_ci(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
  }

  std::string lower_extension(const fs::path& path) {
    auto ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    return to_lower(ext);
  }

  std::string path_key(const fs::path& path) {
    return fs::absolute(path).lexically_normal().string();
  }

  TargetResolution TargetResolution::fixed(int size) {
    if (size <= 0) {
      throw ResolutionError("Resolution must be a positive integer, got " +
                            std::to_string(size) + ".");
    }
    return {ResolutionMode::fixed, size};
  }

  TargetResolution TargetResolution::parse(const std::string& s) {
    auto v = to_lower(s);
    if (v == "none") return TargetResolution::none();
    if (v == "auto") return TargetResolution::automatic();
    int size = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), size);
    if (ec != std::errc() || ptr != v.data() + v.size()) {
      throw ResolutionError("Invalid resolution '" + s +
                            "', expected none, auto or a positive integer.");
    }
    return TargetResolution::fixed(size);
  }

  std::string TargetResolution::to_string() const {
    switch (mode) {
      case ResolutionMode::none:
        return "none";
      case ResolutionMode::automatic:
        return "auto";
      case ResolutionMode::fixed:
        return std::to_string(size);
    }
    return "";
  }

  void MergeRequest::validate() const {
    if (output_format == OutputFormat::png && precision != 8 &&
        precision != 16) {
      throw ConfigError("PNG precision must be 8 or 16, got " +
                        std::to_string(precision) + ".");
    }
    if (target_resolution.mode == ResolutionMode::fixed &&
        target_resolution.size <= 0) {
      throw ConfigError("Explicit resolution must be a positive integer.");
    }
    if (crop_enabled) {
      if (!area_of_interest.has_value()) {
        throw ConfigError("Cropping requested without an area of interest.");
      }
      if (!is_valid_area_of_interest(*area_of_interest)) {
        throw ConfigError("Area of interest " + area_of_interest->wkt() +
                          " is not a valid lon/lat box.");
      }
    }
  }

  bool is_valid_area_of_interest(const Box& box) {
    if (!box.is_valid()) return false;
    return box.pmin[0] >= -180 && box.pmax[0] <= 180 && box.pmin[1] >= -90 &&
           box.pmax[1] <= 90;
  }

  void ProvenanceLedger::record(const fs::path& path, FileRole role) {
    roles_[path_key(path)] = role;
  }

  std::optional<FileRole> ProvenanceLedger::role_of(
      const fs::path& path) const {
    if (auto it = roles_.find(path_key(path)); it != roles_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  void ProvenanceLedger::forget(const fs::path& path) {
    roles_.erase(path_key(path));
  }

}  // namespace terraprep
