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

#include <terraprep/logger/logger.h>

#include <algorithm>
#include <filesystem>
#include <laswriter.hpp>
#include <terraprep/io/PointCloudWriter.hpp>
#include <terraprep/io/SpatialReferenceSystem.hpp>

namespace terraprep::io {

  struct PointCloudWriterLASlib : public PointCloudWriterInterface {
    LASheader lasheader;
    LASpoint laspoint;
    LASwriter* laswriter = nullptr;
    std::string path_;
    std::uint64_t n_written = 0;
    bool warned_classification = false;

    ~PointCloudWriterLASlib() {
      if (laswriter) {
        laswriter->close();
        delete laswriter;
        laswriter = nullptr;
      }
    }

    // GeoKeyDirectoryTag (34735) with the model type and the projected or
    // geographic CRS code.
    void set_geo_keys(int epsg) {
      auto srs = createSpatialReferenceSystemOGR();
      srs->import_epsg(epsg);
      if (!srs->is_valid()) {
        logger::Logger::get_logger().warning(
            "EPSG:{} is unknown, no GeoTIFF keys written", epsg);
        return;
      }
      bool geographic = srs->is_geographic();
      LASvlr_key_entry keys[2];
      keys[0].key_id = 1024;  // GTModelTypeGeoKey
      keys[0].tiff_tag_location = 0;
      keys[0].count = 1;
      keys[0].value_offset = geographic ? 2 : 1;
      keys[1].key_id = geographic ? 2048 : 3072;
      keys[1].tiff_tag_location = 0;
      keys[1].count = 1;
      keys[1].value_offset = U16(epsg);
      lasheader.set_geo_keys(2, keys);
    }

    void open(const std::string& path,
              const PointCloudLayout& layout) override {
      if (laswriter) close();
      auto parent = fs::path(path).parent_path();
      if (!parent.empty()) fs::create_directories(parent);

      lasheader.x_scale_factor = layout.scale[0];
      lasheader.y_scale_factor = layout.scale[1];
      lasheader.z_scale_factor = layout.scale[2];
      lasheader.x_offset = layout.offset[0];
      lasheader.y_offset = layout.offset[1];
      lasheader.z_offset = layout.offset[2];
      lasheader.point_data_format = layout.point_data_format;
      lasheader.point_data_record_length =
          standard_record_length(layout.point_data_format) +
          layout.extra_bytes;
      if (layout.point_data_format >= 6) {
        lasheader.version_minor = 4;
        lasheader.header_size = 375;
        lasheader.offset_to_point_data = 375;
      }
      if (!layout.wkt.empty()) {
        lasheader.set_geo_ogc_wkt(U32(layout.wkt.size() + 1),
                                  layout.wkt.c_str());
      }
      if (layout.epsg.has_value() && layout.point_data_format < 6) {
        set_geo_keys(*layout.epsg);
      }

      laspoint.init(&lasheader, lasheader.point_data_format,
                    lasheader.point_data_record_length, 0);

      LASwriteOpener laswriteopener;
      laswriteopener.set_file_name(path.c_str());
      laswriter = laswriteopener.open(&lasheader);
      if (laswriter == nullptr) {
        throw ProcessingEngineError("Could not open " + path +
                                    " for writing.");
      }
      path_ = path;
      n_written = 0;
      warned_classification = false;
    }

    void write_point(const PointRecord& p) override {
      if (!laswriter) {
        throw ProcessingEngineError("Point cloud writer is not open.");
      }
      laspoint.set_x(p.x);
      laspoint.set_y(p.y);
      laspoint.set_z(p.z);
      laspoint.set_intensity(p.intensity);
      if (laspoint.extended_point_type) {
        laspoint.set_extended_return_number(p.return_number);
        laspoint.set_extended_number_of_returns(p.number_of_returns);
        laspoint.set_extended_classification(p.classification);
        laspoint.set_extended_overlap_flag(p.overlap);
        laspoint.set_extended_scanner_channel(p.scanner_channel);
      } else {
        laspoint.set_return_number(p.return_number);
        laspoint.set_number_of_returns(p.number_of_returns);
        if (p.classification > 31 && !warned_classification) {
          logger::Logger::get_logger().warning(
              "Classes above 31 do not fit point format {} of {}, they are "
              "written as 0",
              int(lasheader.point_data_format), path_);
          warned_classification = true;
        }
        laspoint.set_classification(p.classification > 31 ? 0
                                                          : p.classification);
      }
      laspoint.set_synthetic_flag(p.synthetic);
      laspoint.set_keypoint_flag(p.keypoint);
      laspoint.set_withheld_flag(p.withheld);
      laspoint.set_scan_direction_flag(p.scan_direction);
      laspoint.set_edge_of_flight_line(p.edge_of_flight_line);
      laspoint.set_scan_angle(p.scan_angle);
      laspoint.set_user_data(p.user_data);
      laspoint.set_point_source_ID(p.point_source_id);
      laspoint.set_gps_time(p.gps_time);
      laspoint.set_R(p.rgb[0]);
      laspoint.set_G(p.rgb[1]);
      laspoint.set_B(p.rgb[2]);
      laspoint.set_NIR(p.nir);
      if (laspoint.num_extra_bytes > 0) {
        auto n = std::min<size_t>(size_t(laspoint.num_extra_bytes),
                                  p.extra_bytes.size());
        std::fill_n(laspoint.extra_bytes, laspoint.num_extra_bytes, U8(0));
        std::copy_n(p.extra_bytes.begin(), n, laspoint.extra_bytes);
      }

      laswriter->write_point(&laspoint);
      laswriter->update_inventory(&laspoint);

      if ((++n_written) % 100000000 == 0)
        logger::Logger::get_logger().info("Written {0} points...", n_written);
    }

    void close() override {
      if (!laswriter) return;
      laswriter->update_header(&lasheader, TRUE);
      laswriter->close();
      delete laswriter;
      laswriter = nullptr;
      logger::Logger::get_logger().debug("Wrote {} points to {}", n_written,
                                         path_);
    }

    std::uint64_t points_written() const override { return n_written; }
  };

  std::unique_ptr<PointCloudWriterInterface> createPointCloudWriterLASlib() {
    return std::make_unique<PointCloudWriterLASlib>();
  };
}  // namespace terraprep::io
