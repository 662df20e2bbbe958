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

#include <cstdint>
#include <map>
#include <terraprep/common/common.hpp>

namespace terraprep {

  class terraprepException : public std::exception {
   public:
    explicit terraprepException(const std::string& message)
        : msg_("Error: " + message) {}
    virtual const char* what() const throw() { return msg_.c_str(); }

   protected:
    std::string msg_;
  };

  // Input file is missing, corrupt or unreadable.
  class InvalidInputError : public terraprepException {
   public:
    using terraprepException::terraprepException;
  };

  // Point cloud that LASlib cannot read.
  class InvalidPointCloudError : public InvalidInputError {
   public:
    using InvalidInputError::InvalidInputError;
  };

  // A GDAL driver needed for reading or encoding is not registered.
  class DriverUnavailableError : public terraprepException {
   public:
    using terraprepException::terraprepException;
  };

  class CrsTransformationError : public terraprepException {
   public:
    using terraprepException::terraprepException;
  };

  // Mosaic or merge failed after the inputs were accepted.
  class MergeError : public terraprepException {
   public:
    using terraprepException::terraprepException;
  };

  // Point cloud read/write pipeline failed on valid input.
  class ProcessingEngineError : public terraprepException {
   public:
    using terraprepException::terraprepException;
  };

  // Spatial or vertical reference absent from a file.
  class MissingMetadataError : public terraprepException {
   public:
    using terraprepException::terraprepException;
  };

  class ResolutionError : public terraprepException {
   public:
    using terraprepException::terraprepException;
  };

  // Merge of inputs with differing CRS was declined. Ends the invocation.
  class CrsMismatchAbort : public terraprepException {
   public:
    using terraprepException::terraprepException;
  };

  class ConfigError : public terraprepException {
   public:
    using terraprepException::terraprepException;
  };

  // Errors of the download layer. Only MalformedUrlError is raised inside
  // this library.
  class DownloadError : public terraprepException {
   public:
    using terraprepException::terraprepException;
  };
  class MalformedUrlError : public DownloadError {
   public:
    using DownloadError::DownloadError;
  };
  class DiskSpaceError : public DownloadError {
   public:
    using DownloadError::DownloadError;
  };
  class ConnectionFailedError : public DownloadError {
   public:
    using DownloadError::DownloadError;
  };
  class TimeoutError : public DownloadError {
   public:
    using DownloadError::DownloadError;
  };

  struct TargetResolution {
    ResolutionMode mode = ResolutionMode::automatic;
    int size = 0;

    static TargetResolution none() { return {ResolutionMode::none, 0}; }
    static TargetResolution automatic() {
      return {ResolutionMode::automatic, 0};
    }
    // Throws ResolutionError when size is not positive.
    static TargetResolution fixed(int size);
    // "none", "auto" or a positive integer.
    static TargetResolution parse(const std::string& s);

    std::string to_string() const;
  };

  struct ProjectGroup {
    // Stable identifier, the project name from the catalog URL.
    std::string id;
    fs::path directory;
    // Insertion order is discovery order.
    vec1p files;

    size_t size() const { return files.size(); }
    bool empty() const { return files.empty(); }
    bool is_single() const { return files.size() == 1; }
  };

  // Indexed by ProjectGroup::id.
  typedef std::map<std::string, ProjectGroup> ProjectGroupMap;

  struct MergeRequest {
    MergeScope merge_scope = MergeScope::project;
    bool keep_originals = true;
    OutputFormat output_format = OutputFormat::tif;
    // Bits per pixel for PNG output, 8 or 16.
    int precision = 16;
    bool crop_enabled = false;
    // minLon, minLat, maxLon, maxLat in WGS84.
    std::optional<Box> area_of_interest;
    TargetResolution target_resolution;

    // Throws ConfigError on an inconsistent request.
    void validate() const;
  };

  struct MergeResult {
    // Authority code of the merged inputs, eg. "EPSG:26917".
    std::string authority_code;
    vec1p outputs;

    bool empty() const { return outputs.empty(); }
  };

  enum class UnitSource { band, vertical_crs, heuristic, unknown, error };

  std::string name_of(UnitSource source);

  struct VerticalUnitInfo {
    std::optional<std::string> unit;
    UnitSource source = UnitSource::unknown;
    std::string details;
  };

  struct RasterArtifact {
    fs::path path;
    int width = 0;
    int height = 0;
    std::string authority_code;
    std::optional<std::string> vertical_unit;
    double min = 0;
    double max = 0;
  };

  struct PointCloudArtifact {
    fs::path path;
    std::optional<std::string> authority_code;
    std::uint64_t point_count = 0;
  };

  // True for a box in lon/lat with min < max inside the WGS84 bounds.
  bool is_valid_area_of_interest(const Box& box);

  // Side table with the role of every file the engines create.
  class ProvenanceLedger {
   public:
    void record(const fs::path& path, FileRole role);
    std::optional<FileRole> role_of(const fs::path& path) const;
    void forget(const fs::path& path);
    size_t size() const { return roles_.size(); }

   private:
    std::map<std::string, FileRole> roles_;
  };

}  // namespace terraprep
