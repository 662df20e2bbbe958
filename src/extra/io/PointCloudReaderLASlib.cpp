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

#include <cstring>
#include <lasreader.hpp>
#include <terraprep/io/PointCloudReader.hpp>
#include <terraprep/io/SpatialReferenceSystem.hpp>

namespace terraprep::io {

  struct PointCloudReaderLASlib : public PointCloudReaderInterface {
    LASreader* lasreader = nullptr;
    std::string source_;

    ~PointCloudReaderLASlib() { close(); };

    static std::string vlr_text(const U8* data, U32 length) {
      if (data == nullptr || length == 0) return "";
      auto chars = reinterpret_cast<const char*>(data);
      return std::string(chars, strnlen(chars, length));
    }

    void getOgcWkt(LASheader* lasheader, std::string& wkt) {
      auto& logger = logger::Logger::get_logger();
      for (int i = 0; i < (int)lasheader->number_of_variable_length_records;
           i++) {
        if (lasheader->vlrs[i].record_id == 2111)  // OGC MATH TRANSFORM WKT
        {
          logger.debug("Found and ignored: OGC MATH TRANSFORM WKT");
        } else if (lasheader->vlrs[i].record_id ==
                   2112)  // OGC COORDINATE SYSTEM WKT
        {
          wkt = vlr_text(lasheader->vlrs[i].data,
                         lasheader->vlrs[i].record_length_after_header);
        }
      }

      for (int i = 0;
           i < (int)lasheader->number_of_extended_variable_length_records;
           i++) {
        if (strcmp(lasheader->evlrs[i].user_id, "LASF_Projection") == 0 &&
            lasheader->evlrs[i].record_id == 2112) {
          wkt = vlr_text(
              lasheader->evlrs[i].data,
              U32(lasheader->evlrs[i].record_length_after_header));
        }
      }
    }

    // GeoKeyDirectoryTag (34735): a header of 4 shorts followed by
    // (key id, tag location, count, value) entries.
    std::optional<int> getGeoKeyEpsg(LASheader* lasheader) {
      std::optional<int> projected, geographic;
      for (int i = 0; i < (int)lasheader->number_of_variable_length_records;
           i++) {
        auto& vlr = lasheader->vlrs[i];
        if (vlr.record_id != 34735 || vlr.data == nullptr) continue;
        const size_t n_shorts = vlr.record_length_after_header / 2;
        if (n_shorts < 4) continue;
        std::vector<U16> keys(n_shorts);
        std::memcpy(keys.data(), vlr.data, n_shorts * 2);
        const size_t n_keys = keys[3];
        for (size_t k = 0; k < n_keys && 4 + 4 * k + 3 < n_shorts; ++k) {
          U16 key_id = keys[4 + 4 * k];
          U16 location = keys[4 + 4 * k + 1];
          U16 value = keys[4 + 4 * k + 3];
          // 32767 is "user defined"
          if (location != 0 || value == 0 || value == 32767) continue;
          if (key_id == 3072) projected = value;   // ProjectedCSTypeGeoKey
          if (key_id == 2048) geographic = value;  // GeographicTypeGeoKey
        }
      }
      return projected.has_value() ? projected : geographic;
    }

    void open(const std::string& source) override {
      close();
      if (!fs::exists(source)) {
        throw InvalidPointCloudError("Point cloud " + source + " not found.");
      }
      LASreadOpener lasreadopener;
      lasreadopener.set_file_name(source.c_str());
      lasreader = lasreadopener.open();
      if (lasreader == nullptr) {
        throw InvalidPointCloudError("Open failed on " + source);
      }
      source_ = source;
    }

    void close() override {
      if (lasreader) {
        lasreader->close();
        delete lasreader;
        lasreader = nullptr;
      }
    }

    LASreader* reader() {
      if (!lasreader) {
        throw ProcessingEngineError("No point cloud is open.");
      }
      return lasreader;
    }

    std::string get_wkt() override {
      std::string wkt;
      getOgcWkt(&reader()->header, wkt);
      return wkt;
    }

    std::optional<int> get_geokey_epsg() override {
      return getGeoKeyEpsg(&reader()->header);
    }

    PointCloudLayout get_layout() override {
      auto& h = reader()->header;
      PointCloudLayout layout;
      layout.point_data_format = h.point_data_format;
      auto standard = standard_record_length(h.point_data_format);
      if (h.point_data_record_length > standard) {
        layout.extra_bytes = h.point_data_record_length - standard;
      }
      layout.scale = {h.x_scale_factor, h.y_scale_factor, h.z_scale_factor};
      layout.offset = {h.x_offset, h.y_offset, h.z_offset};
      layout.wkt = get_wkt();
      layout.epsg = get_geokey_epsg();
      if (layout.wkt.empty() && layout.epsg.has_value()) {
        auto srs = createSpatialReferenceSystemOGR();
        srs->import_epsg(*layout.epsg);
        if (srs->is_valid()) layout.wkt = srs->export_wkt();
      }
      return layout;
    }

    TBox<double> getExtent() override {
      return {reader()->get_min_x(), lasreader->get_min_y(),
              lasreader->get_min_z(), lasreader->get_max_x(),
              lasreader->get_max_y(), lasreader->get_max_z()};
    }

    std::uint64_t point_count() override {
      return std::uint64_t(reader()->npoints);
    }

    void set_crop_window(const Box& box) override {
      reader()->inside_rectangle(box.pmin[0], box.pmin[1], box.pmax[0],
                                 box.pmax[1]);
    }

    bool read_point(PointRecord& point) override {
      if (!reader()->read_point()) return false;
      LASpoint& p = lasreader->point;
      point.x = p.get_x();
      point.y = p.get_y();
      point.z = p.get_z();
      point.intensity = p.get_intensity();
      if (p.extended_point_type) {
        point.return_number = p.get_extended_return_number();
        point.number_of_returns = p.get_extended_number_of_returns();
        point.classification = p.get_extended_classification();
        point.overlap = p.get_extended_overlap_flag();
        point.scanner_channel = p.get_extended_scanner_channel();
      } else {
        point.return_number = p.get_return_number();
        point.number_of_returns = p.get_number_of_returns();
        point.classification = p.get_classification();
        point.overlap = false;
        point.scanner_channel = 0;
      }
      point.synthetic = p.get_synthetic_flag();
      point.keypoint = p.get_keypoint_flag();
      point.withheld = p.get_withheld_flag();
      point.scan_direction = p.get_scan_direction_flag();
      point.edge_of_flight_line = p.get_edge_of_flight_line();
      point.scan_angle = p.get_scan_angle();
      point.user_data = p.get_user_data();
      point.point_source_id = p.get_point_source_ID();
      point.gps_time = p.get_gps_time();
      point.rgb = {p.get_R(), p.get_G(), p.get_B()};
      point.nir = p.get_NIR();
      if (p.num_extra_bytes > 0 && p.extra_bytes) {
        point.extra_bytes.assign(p.extra_bytes,
                                 p.extra_bytes + p.num_extra_bytes);
      } else {
        point.extra_bytes.clear();
      }
      return true;
    }
  };

  std::unique_ptr<PointCloudReaderInterface> createPointCloudReaderLASlib() {
    return std::make_unique<PointCloudReaderLASlib>();
  };

}  // namespace terraprep::io
