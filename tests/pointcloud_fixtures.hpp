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

#include <terraprep/io/PointCloudReader.hpp>
#include <terraprep/io/PointCloudWriter.hpp>
#include <terraprep/io/SpatialReferenceSystem.hpp>

#include <vector>

#include "test_helpers.hpp"

namespace terraprep::test {

  inline fs::path write_las(const fs::path& path,
                            const io::PointCloudLayout& layout,
                            const std::vector<io::PointRecord>& points) {
    fs::create_directories(path.parent_path());
    auto writer = io::createPointCloudWriterLASlib();
    writer->open(path.string(), layout);
    for (auto& p : points) writer->write_point(p);
    writer->close();
    return path;
  }

  inline std::vector<io::PointRecord> diagonal(int n, double origin_x,
                                               double origin_y,
                                               double step = 100) {
    std::vector<io::PointRecord> points(n);
    for (int i = 0; i < n; ++i) {
      points[i].x = origin_x + step * i;
      points[i].y = origin_y + step * i;
      points[i].z = 10 + i;
      points[i].classification = 2;
    }
    return points;
  }

  // n ground points on a diagonal with 100 m spacing from the origin. An
  // epsg of 0 writes no CRS.
  inline fs::path make_las(const fs::path& path, int n, int epsg = 26917,
                           double origin_x = 500000,
                           double origin_y = 3890000) {
    io::PointCloudLayout layout;
    layout.offset = {origin_x, origin_y, 0};
    if (epsg) {
      auto srs = io::createSpatialReferenceSystemOGR();
      srs->import_epsg(epsg);
      layout.wkt = srs->export_wkt();
    }
    return write_las(path, layout, diagonal(n, origin_x, origin_y));
  }

  // As make_las, with the CRS stored only as GeoTIFF keys.
  inline fs::path make_las_geokeys(const fs::path& path, int n,
                                   int epsg = 26917) {
    io::PointCloudLayout layout;
    layout.offset = {500000, 3890000, 0};
    layout.epsg = epsg;
    return write_las(path, layout, diagonal(n, 500000, 3890000));
  }

  inline std::vector<io::PointRecord> read_points(const fs::path& path) {
    auto reader = io::createPointCloudReaderLASlib();
    reader->open(path.string());
    std::vector<io::PointRecord> points;
    io::PointRecord p;
    while (reader->read_point(p)) points.push_back(p);
    return points;
  }

  inline std::uint64_t count_points(const fs::path& path) {
    auto reader = io::createPointCloudReaderLASlib();
    reader->open(path.string());
    return reader->point_count();
  }

}  // namespace terraprep::test
