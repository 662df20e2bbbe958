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
#include <memory>
#include <terraprep/common/datastructures.hpp>

namespace terraprep::io {

  // Every attribute of a LAS point record, carried unchanged through merge,
  // reprojection and crop.
  struct PointRecord {
    double x = 0, y = 0, z = 0;
    std::uint16_t intensity = 0;
    std::uint8_t return_number = 1;
    std::uint8_t number_of_returns = 1;
    // Full 8 bit class, only 0-31 fit the legacy point formats.
    std::uint8_t classification = 0;
    bool synthetic = false;
    bool keypoint = false;
    bool withheld = false;
    bool overlap = false;
    std::uint8_t scanner_channel = 0;
    bool scan_direction = false;
    bool edge_of_flight_line = false;
    // Degrees.
    float scan_angle = 0;
    std::uint8_t user_data = 0;
    std::uint16_t point_source_id = 0;
    double gps_time = 0;
    std::array<std::uint16_t, 3> rgb = {0, 0, 0};
    std::uint16_t nir = 0;
    std::vector<std::uint8_t> extra_bytes;
  };

  // Size in bytes of a point record of format 0-10 without extra bytes.
  inline std::uint16_t standard_record_length(std::uint8_t format) {
    static const std::uint16_t lengths[] = {20, 28, 26, 34, 57, 63,
                                            30, 36, 38, 59, 67};
    return format <= 10 ? lengths[format] : 20;
  }

  // Point format 6-10 holding the attributes of a legacy format 0-5.
  inline std::uint8_t extended_point_format(std::uint8_t format) {
    static const std::uint8_t extended[] = {6, 6, 7, 7, 9, 10};
    return format <= 5 ? extended[format] : format;
  }

  // Storage layout of a point cloud file, copied from the first input when
  // writing merged output.
  struct PointCloudLayout {
    std::uint8_t point_data_format = 0;
    // Bytes per record beyond standard_record_length.
    std::uint16_t extra_bytes = 0;
    arr3d scale = {0.01, 0.01, 0.01};
    arr3d offset = {0, 0, 0};
    // OGC WKT of the CRS, empty if unknown.
    std::string wkt;
    // EPSG code for the GeoTIFF keys of the legacy point formats.
    std::optional<int> epsg;
  };

  struct PointCloudReaderInterface {
    virtual ~PointCloudReaderInterface() = default;

    // Throws InvalidPointCloudError, with "not found" in the message when
    // the file does not exist.
    virtual void open(const std::string& source) = 0;
    virtual void close() = 0;

    // OGC WKT stored in the (extended) VLRs, empty if absent.
    virtual std::string get_wkt() = 0;
    // EPSG code from the GeoTIFF key directory, projected before geographic.
    virtual std::optional<int> get_geokey_epsg() = 0;

    // The WKT of the layout falls back to the CRS of the GeoTIFF keys.
    virtual PointCloudLayout get_layout() = 0;
    virtual TBox<double> getExtent() = 0;
    virtual std::uint64_t point_count() = 0;

    // Restricts read_point to points inside the 2D box.
    virtual void set_crop_window(const Box& box) = 0;

    // Returns false when all points are read.
    virtual bool read_point(PointRecord& point) = 0;
  };

  std::unique_ptr<PointCloudReaderInterface> createPointCloudReaderLASlib();
}  // namespace terraprep::io
