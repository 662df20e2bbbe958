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

#include <cctype>
#include <filesystem>
#include <format>
#include <iomanip>
#include <iostream>
#include <list>
#include <sstream>
#include <string>
#include <toml++/toml.hpp>
#include <unordered_map>
#include <utility>
#include <vector>

#include <terraprep/common/common.hpp>
#include <terraprep/common/formatters.hpp>
#include <terraprep/logger/logger.h>
#include <terraprep/pipeline/Pipeline.hpp>

#include "parameter.hpp"
#include "validators.hpp"

#ifndef TP_VERSION
#define TP_VERSION "unknown"
#endif

namespace fs = std::filesystem;
namespace check = terraprep::validators;

// Values as given on the command line or in the config file, converted to a
// PipelineConfig after validation.
struct TerraprepConfig {
  std::optional<terraprep::Box> aoi;
  std::string type = "dem";
  std::string output_path;

  std::string dem_merge = "merge-keep";
  std::string dem_merge_method = "all";
  std::string dem_filter_type = "none";
  std::string dem_resolution = "auto";
  std::string dem_output = "tif";
  int png_precision = 16;
  std::string crs_mismatch = "abort";

  std::string merge_lidar = "merge-keep";
  std::string lidar_filter = "filter";
  std::string lidar_reproject = "none";
  bool lidar_merge_single = true;
};

struct CLIArgs {
  std::string program_name;
  std::list<std::string> args;

  CLIArgs(int argc, const char* argv[]) {
    program_name = argv[0];
    // get the name of the binary
    auto pos = program_name.find_last_of("/\\");
    if (pos != std::string::npos) {
      program_name = program_name.substr(pos + 1);
    }
    for (int i = 1; i < argc; i++) {
      args.push_back(argv[i]);
    }
  }
};

struct TerraprepConfigHandler {
  TerraprepConfig cfg_;

  using param_group_map = std::vector<std::pair<std::string, ParameterVector>>;

  param_group_map app_param_groups_;
  param_group_map param_groups_;
  std::unordered_map<std::string, ConfigParameter*> param_index_;
  std::unordered_map<std::string, ConfigParameter*> app_param_index_;

  // flags
  bool _print_help = false;
  bool _print_version = false;
  terraprep::logger::LogLevel _loglevel = terraprep::logger::LogLevel::info;
  std::string _config_path;

  TerraprepConfigHandler() {
    ParameterVector general;
    ParameterVector input, dem, lidar;

    general.add("help", 'h', "Show help message", _print_help);
    general.add("version", 'v', "Show version", _print_version);
    general.add("config", 'c', "Configuration file", _config_path,
                {check::PathExists});
    general.add("loglevel", "Specify loglevel", _loglevel);

    input
        .add("aoi",
             "Area of interest in WGS84 longitude/latitude. Required for "
             "any cropping of DEM or LiDAR outputs.",
             cfg_.aoi,
             {[](const std::optional<terraprep::Box>& box)
                  -> std::optional<std::string> {
               if (box.has_value()) {
                 return check::ValidAreaOfInterest(*box);
               }
               return std::nullopt;
             }})
        .example_ = "[-84.5, 33.6, -84.4, 33.7]";
    input.add("type", "Kind of data to process.", cfg_.type,
              {check::OneOf<std::string>({"dem", "lidar", "both"})});

    dem.add("dem-merge",
            "Merge the GeoTIFF files of each project. merge-keep keeps the "
            "original files, merge-delete only keeps the merged output.",
            cfg_.dem_merge,
            {check::OneOf<std::string>(
                {"no-merge", "merge-keep", "merge-delete"})});
    dem.add("dem-merge-method",
            "Merge DEM files per project, across all projects, or both. Files "
            "from different years may overlap.",
            cfg_.dem_merge_method,
            {check::OneOf<std::string>({"project", "all", "both"})});
    dem.add("dem-filter-type",
            "Crop DEM files to the area of interest. merge only crops merged "
            "files, all also crops every downloaded tile.",
            cfg_.dem_filter_type,
            {check::OneOf<std::string>({"none", "merge", "all"})});
    dem.add("dem-resolution",
            "Output size of cropped files. auto picks the closest of 1009, "
            "2017, 4033 and 8129, an integer sets width and height, none "
            "keeps the native size.",
            cfg_.dem_resolution, {check::ValidResolution});
    dem.add("dem-output",
            "Output format. png and r16 reduce the precision to 8 or 16 bit.",
            cfg_.dem_output,
            {check::OneOf<std::string>({"tif", "png", "r16"})});
    dem.add("png-precision", "Bits per pixel of png output.",
            cfg_.png_precision, {check::OneOf<int>({8, 16})});
    dem.add("crs-mismatch",
            "What to do when the rasters of a merge use different coordinate "
            "reference systems.",
            cfg_.crs_mismatch,
            {check::OneOf<std::string>({"abort", "proceed", "prompt"})});

    lidar.add("merge-lidar",
              "Merge the point cloud files of each project. merge-delete "
              "only keeps the merged output.",
              cfg_.merge_lidar,
              {check::OneOf<std::string>(
                  {"no-merge", "merge-keep", "merge-delete"})});
    lidar.add("lidar-filter",
              "Crop merged point clouds to the area of interest.",
              cfg_.lidar_filter,
              {check::OneOf<std::string>({"no-filter", "filter"})});
    lidar.add("lidar-reproject",
              "Reproject point clouds to the coordinate reference system of "
              "the DEM merge. Only used with --type both.",
              cfg_.lidar_reproject,
              {check::OneOf<std::string>({"none", "auto"})});
    lidar.add("lidar-merge-single",
              "Also write merged.laz for projects with a single file.",
              cfg_.lidar_merge_single);

    app_param_groups_.push_back({"General", std::move(general)});
    param_groups_.push_back({"Input", std::move(input)});
    param_groups_.push_back({"DEM", std::move(dem)});
    param_groups_.push_back({"LiDAR", std::move(lidar)});

    for (auto& [name, group] : param_groups_) {
      group.add_to_index(param_index_);
    }
    for (auto& [name, group] : app_param_groups_) {
      group.add_to_index(app_param_index_);
    }
  };

  void validate() {
    for (auto& [group_name, group] : param_groups_) {
      for (auto& param : group) {
        if (auto error_msg = param->validate()) {
          throw terraprep::ConfigError(
              std::format("Validation error for {} parameter {}. {}",
                          group_name, param->longname_, *error_msg));
        }
      }
    }
    if (cfg_.output_path.empty()) {
      throw terraprep::ConfigError("No output directory specified.");
    }
    if (auto error_msg = check::PathExists(cfg_.output_path)) {
      throw terraprep::ConfigError(
          std::format("Output directory does not exist. {}", *error_msg));
    }
    if (auto error_msg = check::DirIsWritable(cfg_.output_path)) {
      throw terraprep::ConfigError(
          std::format("Can't write to output directory: {}", *error_msg));
    }
    // cross-parameter checks
    pipeline_config().validate();
  }

  terraprep::pipeline::PipelineConfig pipeline_config() const {
    terraprep::pipeline::PipelineConfig pc;
    pc.output_directory = cfg_.output_path;
    pc.process_dem = cfg_.type == "dem" || cfg_.type == "both";
    pc.process_lidar = cfg_.type == "lidar" || cfg_.type == "both";
    pc.area_of_interest = cfg_.aoi;

    pc.merge_dem = cfg_.dem_merge != "no-merge";
    pc.keep_dem_originals = cfg_.dem_merge != "merge-delete";
    pc.dem_merge_scope = terraprep::parse_merge_scope(cfg_.dem_merge_method);
    pc.dem_filter = terraprep::pipeline::parse_dem_filter(cfg_.dem_filter_type);
    pc.dem_resolution = terraprep::TargetResolution::parse(cfg_.dem_resolution);
    pc.dem_output = terraprep::parse_output_format(cfg_.dem_output);
    pc.png_precision = cfg_.png_precision;

    pc.merge_lidar = cfg_.merge_lidar != "no-merge";
    pc.keep_lidar_originals = cfg_.merge_lidar != "merge-delete";
    pc.filter_lidar = cfg_.lidar_filter == "filter";
    pc.reproject_lidar = cfg_.lidar_reproject == "auto" && cfg_.type == "both";
    pc.merge_single_lidar = cfg_.lidar_merge_single;
    return pc;
  }

  void print_help(std::string program_name) {
    std::cout << "Merge, normalise and crop downloaded DEM and LiDAR "
                 "projects\n\n";
    std::cout << "\033[1mUsage\033[0m:" << "\n";
    std::cout << "  " << program_name;
    std::cout << " [options] <output-directory>" << "\n";
    std::cout << "  " << program_name;
    std::cout << " [options] (-c | --config) <config-file> [<output-directory>]"
              << "\n";
    std::cout << "  " << program_name;
    std::cout << " -h | --help" << "\n";
    std::cout << "  " << program_name;
    std::cout << " -v | --version" << "\n";
    std::cout << "\n";
    std::cout << "\033[1mPositional arguments:\033[0m" << "\n";
    std::cout << "  <output-directory>           Directory with the dem/ and "
                 "lidar/ project folders.\n";

    print_params(app_param_groups_);
    print_params(param_groups_);
  }

  // Utility function to wrap text to a specified width with proper indentation
  std::vector<std::string> wrap_text(const std::string& text, size_t max_width,
                                     size_t indent = 0) {
    std::vector<std::string> lines;
    std::string indent_str(indent, ' ');
    std::string current_line = indent_str;
    size_t current_width = indent;

    std::istringstream iss(text);
    std::string word;

    while (iss >> word) {
      if (current_width + word.length() + 1 > max_width &&
          current_line != indent_str) {
        lines.push_back(current_line);
        current_line = indent_str;
        current_width = indent;
      }
      if (current_line != indent_str) {
        current_line += " ";
        current_width += 1;
      }
      current_line += word;
      current_width += word.length();
    }
    if (current_line != indent_str) {
      lines.push_back(current_line);
    }
    return lines;
  }

  void print_params(param_group_map& params) {
    const size_t param_column_width = 35;
    const size_t desc_column_width = 65;

    for (auto& [group_name, group] : params) {
      if (group.empty()) continue;
      std::cout << "\n";
      std::cout << "\033[1m" << group_name << " options:\033[0m\n";
      for (auto& param : group) {
        std::string param_text =
            param->cli_flag() + " " + param->type_description();
        auto wrapped_desc =
            wrap_text(param->description(),
                      param_column_width + desc_column_width,
                      param_column_width + 2);
        auto wrapped_default =
            wrap_text("Default: " + param->default_to_string(),
                      param_column_width + desc_column_width,
                      param_column_width + 2);

        if (param_text.size() <= param_column_width - 2) {
          std::cout << "  " << std::setw(param_column_width) << std::left
                    << param_text;
          if (!wrapped_desc.empty()) {
            std::cout << wrapped_desc[0].substr(param_column_width + 2) << "\n";
          } else {
            std::cout << "\n";
          }
        } else {
          std::cout << "  " << param_text << "\n";
          if (!wrapped_desc.empty()) {
            std::cout << std::string(param_column_width + 2, ' ')
                      << wrapped_desc[0].substr(param_column_width + 2) << "\n";
          }
        }
        for (size_t i = 1; i < wrapped_desc.size(); ++i) {
          std::cout << wrapped_desc[i] << "\n";
        }
        for (const auto& line : wrapped_default) {
          std::cout << "\033[34m" << line << "\033[0m" << "\n";
        }
      }
    }
  }

  void print_version() {
    std::cout << std::format("terraprep {}\n", TP_VERSION);
  }

  void parse_cli_first_pass(CLIArgs& c) {
    // program control arguments, these are not read from the config file
    auto it = c.args.begin();
    while (it != c.args.end()) {
      const std::string& arg = *it;
      std::string argname = "";
      if (arg.starts_with("--")) {
        argname = arg.substr(2);
      } else if (arg.starts_with("-")) {
        argname = arg.substr(1);
      }
      if (auto p = app_param_index_.find(argname);
          !argname.empty() && p != app_param_index_.end()) {
        it = c.args.erase(it);
        it = p->second->set(c.args, it);
      } else {
        ++it;
      }

      if (argname == "c" || argname == "config") {
        if (auto error_msg = check::PathExists(_config_path)) {
          throw terraprep::ConfigError(std::format(
              "Invalid argument for -c or --config. {}", *error_msg));
        }
      }
    }
  }

  void parse_cli_second_pass(CLIArgs& c) {
    auto it = c.args.begin();
    while (it != c.args.end()) {
      std::string arg = *it;

      try {
        if (arg.starts_with("--no-") &&
            param_index_.contains(arg.substr(5))) {
          it = c.args.erase(it);
          param_index_.at(arg.substr(5))->unset();
        } else if (arg.starts_with("--")) {
          auto argname = arg.substr(2);
          if (auto p = param_index_.find(argname); p != param_index_.end()) {
            it = c.args.erase(it);
            it = p->second->set(c.args, it);
          } else {
            throw terraprep::ConfigError(
                std::format("Unknown argument: {}.", arg));
          }
        } else if (arg.starts_with("-") && arg.size() > 1 &&
                   !std::isdigit(static_cast<unsigned char>(arg[1]))) {
          auto argname = arg.substr(1);
          if (auto p = param_index_.find(argname); p != param_index_.end()) {
            it = c.args.erase(it);
            it = p->second->set(c.args, it);
          } else {
            throw terraprep::ConfigError(
                std::format("Unknown argument: {}.", arg));
          }
        } else {
          ++it;
        }
      } catch (const terraprep::ConfigError& e) {
        throw terraprep::ConfigError(
            std::format("Error parsing argument: {}. {}", arg, e.what()));
      } catch (const std::logic_error& e) {
        // std::stoi and std::stod
        throw terraprep::ConfigError(
            std::format("Error parsing argument: {}. {}", arg, e.what()));
      }
    }

    // only the positional output directory is left
    if (c.args.size() == 1) {
      cfg_.output_path = c.args.back();
    } else if (c.args.size() > 1) {
      throw terraprep::ConfigError(
          "Too many positional arguments, expected only <output-directory>.");
    } else if (cfg_.output_path.empty()) {
      throw terraprep::ConfigError(
          "Need to provide <output-directory> on the command line or as "
          "output-directory in the config file.");
    }
  };

  void parse_config_file() {
    toml::table config;
    try {
      config = toml::parse_file(_config_path);
    } catch (const toml::parse_error& e) {
      throw terraprep::ConfigError(
          std::format("Syntax error. {}", e.description()));
    }

    for (const auto& [key, value] : config) {
      try {
        if (key == "output-directory") {
          if (auto v = config["output-directory"].value<std::string>()) {
            cfg_.output_path = *v;
          }
        } else if (auto p = param_index_.find(std::string(key.str()));
                   p != param_index_.end()) {
          p->second->set_from_toml(config, std::string(key.str()));
        } else {
          throw terraprep::ConfigError(
              std::format("Unknown parameter in config file: {}.", key.str()));
        }
      } catch (const terraprep::ConfigError& e) {
        throw terraprep::ConfigError(
            std::format("Failed to read value for {} from config file. {}",
                        key.str(), e.what()));
      }
    }
  }
};

template <>
struct fmt::formatter<TerraprepConfigHandler> {
  static constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
  template <typename Context>
  auto format(TerraprepConfigHandler const& cfgh, Context& ctx) const {
    fmt::format_to(ctx.out(), "TerraprepConfig(output_directory={}",
                   cfgh.cfg_.output_path);
    for (const auto& [groupname, param_list] : cfgh.param_groups_) {
      for (const auto& param : param_list) {
        fmt::format_to(ctx.out(), ", {}={}", param->longname_,
                       param->to_string());
      }
    }
    return fmt::format_to(ctx.out(), ")");
  }
};
