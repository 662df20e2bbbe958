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
#include <cmath>
#include <regex>
#include <terraprep/io/PointCloudReader.hpp>
#include <terraprep/io/PointCloudWriter.hpp>
#include <terraprep/io/SpatialReferenceSystem.hpp>
#include <terraprep/logger/logger.h>
#include <terraprep/misc/projHelper.hpp>
#include <terraprep/pipeline/PointCloudMergeEngine.hpp>

namespace terraprep::pipeline {

  std::optional<std::string> find_epsg_tag(const std::string& wkt) {
    static const std::regex tag(
        R"re((?:AUTHORITY|ID)\[\s*"EPSG"\s*,\s*"?(\d+)"?\s*\])re",
        std::regex::icase);
    std::optional<std::string> code;
    for (auto it = std::sregex_iterator(wkt.begin(), wkt.end(), tag);
         it != std::sregex_iterator(); ++it) {
      code = "EPSG:" + (*it)[1].str();
    }
    return code;
  }

  std::string detect_epsg(const fs::path& path) {
    auto reader = io::createPointCloudReaderLASlib();
    reader->open(path.string());
    auto wkt = reader->get_wkt();
    auto geokey = reader->get_geokey_epsg();
    reader->close();

    if (!wkt.empty()) {
      auto srs = io::createSpatialReferenceSystemOGR();
      srs->import_wkt(wkt);
      if (srs->is_valid()) {
        auto code = srs->authority_code();
        if (code.rfind("EPSG:", 0) == 0) return code;
      }
      if (auto code = find_epsg_tag(wkt)) return *code;
    }
    if (geokey.has_value()) return "EPSG:" + std::to_string(*geokey);
    throw MissingMetadataError("No spatial reference found in " +
                               path.string() + ".");
  }

  namespace {
    bool is_legacy(const ProjectGroup& group, const fs::path& file) {
      return contains_ci(group.id, "legacy") ||
             contains_ci(file.filename().string(), "legacy");
    }
  }  // namespace

  struct PointCloudMergeEngine : public PointCloudMergeEngineInterface {
    RetentionPolicyInterface& retention;
    ProvenanceLedger* ledger;
    PointCloudMergeConfig cfg;

    PointCloudMergeEngine(RetentionPolicyInterface& retention,
                          ProvenanceLedger* ledger,
                          PointCloudMergeConfig config)
        : retention(retention), ledger(ledger), cfg(std::move(config)){};

    static void discard(const fs::path& path) {
      std::error_code ec;
      fs::remove(path, ec);
    }

    // Layout of the first readable file, widened to the matching LAS 1.4
    // point format when another file uses one so that no attribute is lost.
    std::optional<io::PointCloudLayout> merged_layout(
        const ProjectGroup& group) {
      auto& logger = logger::Logger::get_logger();
      auto reader = io::createPointCloudReaderLASlib();
      std::optional<io::PointCloudLayout> layout;
      bool any_extended = false;
      for (auto& file : group.files) {
        try {
          reader->open(file.string());
        } catch (const InvalidPointCloudError&) {
          continue;
        }
        auto file_layout = reader->get_layout();
        reader->close();
        if (!layout) layout = file_layout;
        any_extended |= file_layout.point_data_format >= 6;
      }
      if (layout && any_extended && layout->point_data_format < 6) {
        auto widened = io::extended_point_format(layout->point_data_format);
        logger.info("Writing point format {} for {} to hold the LAS 1.4 "
                    "attributes of its inputs",
                    int(widened), group.id);
        layout->point_data_format = widened;
      }
      return layout;
    }

    // Returns the number of points written to output.
    std::uint64_t merge_group(const ProjectGroup& group,
                              const fs::path& output) {
      auto& logger = logger::Logger::get_logger();
      auto reader = io::createPointCloudReaderLASlib();
      auto writer = io::createPointCloudWriterLASlib();

      size_t n_inputs = 0;
      std::string first_wkt;
      io::PointRecord point;
      auto layout = merged_layout(group);
      try {
        for (auto& file : group.files) {
          try {
            reader->open(file.string());
          } catch (const InvalidPointCloudError& e) {
            logger.warning("Skipping {}: {}", file.string(), e.what());
            continue;
          }
          if (n_inputs == 0) {
            first_wkt = layout->wkt;
            writer->open(output.string(), *layout);
          } else if (reader->get_layout().wkt != first_wkt) {
            logger.warning("{} has a different spatial reference than the "
                           "first file of {}",
                           file.filename().string(), group.id);
          }
          while (reader->read_point(point)) writer->write_point(point);
          reader->close();
          ++n_inputs;
        }
        writer->close();
      } catch (...) {
        reader->close();
        writer->close();
        discard(output);
        throw;
      }
      if (n_inputs == 0) {
        throw InvalidPointCloudError("None of the " +
                                     std::to_string(group.size()) +
                                     " file(s) of " + group.id +
                                     " could be read.");
      }
      logger.info("Merged {} file(s) into {}", n_inputs, output.string());
      return writer->points_written();
    }

    void clean_directory(const fs::path& directory, const fs::path& keep) {
      vec1p removable;
      std::error_code ec;
      for (auto& entry : fs::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file()) continue;
        if (path_key(entry.path()) == path_key(keep)) continue;
        removable.push_back(entry.path());
      }
      if (ec) {
        logger::Logger::get_logger().warning("Could not list {}: {}",
                                             directory.string(),
                                             ec.message());
      }
      std::sort(removable.begin(), removable.end());
      auto n = retention.remove(removable);
      logger::Logger::get_logger().info("Removed {} file(s) from {}", n,
                                        directory.string());
    }

    std::map<std::string, fs::path> merge(const ProjectGroupMap& groups,
                                          bool keep_originals) override {
      auto& logger = logger::Logger::get_logger();
      std::map<std::string, fs::path> merged;
      size_t done = 0;
      for (auto& [id, group] : groups) {
        logger.progress("merge_lidar", done++, groups.size());
        if (group.empty()) {
          logger.debug("No point clouds in {}", id);
          continue;
        }
        if (group.is_single() && !cfg.merge_single_file_groups) {
          logger.info("Only 1 file in {}, no merging", id);
          continue;
        }

        auto output = group.directory / cfg.output_name;
        logger.info("Merging {} point cloud(s) in {}", group.size(), id);
        try {
          auto count = merge_group(group, output);
          logger.info("Total points written: {}", count);
        } catch (const terraprepException& e) {
          logger.error("Merging {} failed. {}", id, e.what());
          continue;
        }
        if (ledger) ledger->record(output, FileRole::merged);
        merged[id] = output;

        if (!keep_originals) clean_directory(group.directory, output);
      }
      return merged;
    }

    // Offsets and scale for coordinates in target_crs covering extent.
    static io::PointCloudLayout reprojected_layout(
        io::PointCloudLayout layout, const Box& extent,
        const std::string& source_crs, const std::string& target_crs) {
      auto source = io::createSpatialReferenceSystemOGR();
      source->import(source_crs);
      auto srs = io::createSpatialReferenceSystemOGR();
      srs->import(target_crs);
      layout.wkt = srs->export_wkt();
      layout.epsg.reset();
      if (srs->get_auth_name() == "EPSG" && !srs->get_auth_code().empty()) {
        layout.epsg = std::stoi(srs->get_auth_code());
      }
      if (srs->is_geographic()) {
        layout.scale = {1e-7, 1e-7, layout.scale[2]};
      } else if (source->is_geographic()) {
        // degree scales overflow the int32 records a few hundred metres
        // from the offset
        layout.scale = {0.01, 0.01, layout.scale[2]};
      }
      layout.offset = {std::floor(extent.pmin[0]), std::floor(extent.pmin[1]),
                       layout.offset[2]};
      return layout;
    }

    fs::path reproject_file(const fs::path& file,
                            const std::string& source_crs,
                            const std::string& target_crs) {
      auto proj = misc::createProjHelper();
      proj->set_transform(source_crs, target_crs);

      auto reader = io::createPointCloudReaderLASlib();
      reader->open(file.string());
      auto extent = proj->transform_box(reader->getExtent());
      auto layout = reprojected_layout(reader->get_layout(), extent,
                                       source_crs, target_crs);

      auto output =
          file.parent_path() / (file.stem().string() + "_reprojected.laz");
      auto writer = io::createPointCloudWriterLASlib();
      try {
        writer->open(output.string(), layout);
        io::PointRecord point;
        while (reader->read_point(point)) {
          auto p = proj->transform(point.x, point.y, point.z);
          point.x = p[0];
          point.y = p[1];
          point.z = p[2];
          writer->write_point(point);
        }
        writer->close();
        reader->close();
      } catch (...) {
        writer->close();
        reader->close();
        discard(output);
        throw;
      }
      return output;
    }

    std::map<std::string, vec1p> reproject(
        const ProjectGroupMap& groups, const std::string& target_crs) override {
      auto& logger = logger::Logger::get_logger();
      std::map<std::string, vec1p> reprojected;
      for (auto& [id, group] : groups) {
        for (auto& file : group.files) {
          if (is_legacy(group, file)) {
            logger.info("Skipping legacy point cloud {}", file.string());
            continue;
          }
          std::string source_crs;
          try {
            source_crs = detect_epsg(file);
          } catch (const InvalidPointCloudError& e) {
            logger.warning("Skipping {}: {}", file.string(), e.what());
            continue;
          } catch (const MissingMetadataError& e) {
            logger.warning("Skipping {}: {}", file.string(), e.what());
            continue;
          }

          try {
            auto output = reproject_file(file, source_crs, target_crs);
            if (ledger) ledger->record(output, FileRole::intermediate);
            reprojected[id].push_back(output);
            logger.info("Reprojected {} from {} to {}",
                        file.filename().string(), source_crs, target_crs);
          } catch (const terraprepException& e) {
            logger.warning("Reprojecting {} failed. {}", file.string(),
                           e.what());
          }
        }
      }
      return reprojected;
    }

    std::map<std::string, fs::path> crop(
        const std::map<std::string, fs::path>& point_clouds,
        const std::string& output_name, const Box& bbox) override {
      auto& logger = logger::Logger::get_logger();
      if (!is_valid_area_of_interest(bbox)) {
        throw ConfigError("Bounding box " + bbox.wkt() +
                          " is not a valid lon/lat box.");
      }
      std::map<std::string, fs::path> cropped;
      for (auto& [id, path] : point_clouds) {
        auto output = path.parent_path() / output_name;
        auto reader = io::createPointCloudReaderLASlib();
        auto writer = io::createPointCloudWriterLASlib();
        try {
          auto crs = detect_epsg(path);
          auto window = misc::transform_box(bbox, "EPSG:4326", crs);
          reader->open(path.string());
          reader->set_crop_window(window);
          writer->open(output.string(), reader->get_layout());
          io::PointRecord point;
          while (reader->read_point(point)) writer->write_point(point);
          writer->close();
          reader->close();
        } catch (const terraprepException& e) {
          writer->close();
          reader->close();
          discard(output);
          logger.warning("Cropping {} failed. {}", path.string(), e.what());
          continue;
        }
        if (writer->points_written() == 0) {
          logger.warning("No points of {} inside {}", path.string(),
                         bbox.wkt());
        }
        if (ledger) ledger->record(output, FileRole::filtered);
        cropped[id] = output;
        logger.info("Cropped {} to {} ({} points)", path.filename().string(),
                    output.string(), writer->points_written());
      }
      return cropped;
    }
  };

  std::unique_ptr<PointCloudMergeEngineInterface> createPointCloudMergeEngine(
      RetentionPolicyInterface& retention, ProvenanceLedger* ledger,
      PointCloudMergeConfig config) {
    return std::make_unique<PointCloudMergeEngine>(retention, ledger,
                                                   std::move(config));
  }
}  // namespace terraprep::pipeline
