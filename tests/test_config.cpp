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

#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "test_helpers.hpp"

using terraprep::ConfigError;

namespace {
  // argv style list without the program name
  CLIArgs make_args(std::vector<std::string> args) {
    std::vector<const char*> argv = {"/usr/bin/terraprep"};
    for (auto& a : args) argv.push_back(a.c_str());
    return CLIArgs(int(argv.size()), argv.data());
  }
}  // namespace

TEST_CASE("validators") {
  CHECK_FALSE(check::InRange(1, 10)(5).has_value());
  CHECK(check::InRange(1, 10)(11).has_value());
  CHECK(check::HigherThan(0)(0).has_value());
  CHECK_FALSE(check::HigherOrEqualTo(0)(0).has_value());

  auto one_of = check::OneOf<std::string>({"tif", "png"});
  CHECK_FALSE(one_of("png").has_value());
  CHECK(one_of("jpg") == std::optional<std::string>(
                             "Value jpg is not one of tif, png."));

  CHECK_FALSE(check::ValidResolution("2017").has_value());
  CHECK(check::ValidResolution("-3").has_value());
  CHECK(check::ValidAreaOfInterest(terraprep::Box::from_2d(1, 1, 0, 2))
            .has_value());
  CHECK(check::PathExists("/definitely/not/here").has_value());
}

TEST_CASE("command line arguments") {
  terraprep::test::ScratchDir out("terraprep_cli");
  auto args =
      make_args({"--type", "both", "--dem-output", "png", "--dem-merge",
                 "merge-delete", "--no-lidar-merge-single", "--aoi", "-84.5",
                 "33.6", "-84.4", "33.7", "--lidar-reproject", "auto",
                 out.path.string()});
  CHECK(args.program_name == "terraprep");

  TerraprepConfigHandler handler;
  handler.parse_cli_first_pass(args);
  handler.parse_cli_second_pass(args);
  REQUIRE_NOTHROW(handler.validate());

  auto pc = handler.pipeline_config();
  CHECK(pc.output_directory == out.path);
  CHECK(pc.process_dem);
  CHECK(pc.process_lidar);
  CHECK(pc.dem_output == terraprep::OutputFormat::png);
  CHECK(pc.merge_dem);
  CHECK_FALSE(pc.keep_dem_originals);
  CHECK(pc.dem_merge_scope == terraprep::MergeScope::all);
  CHECK(pc.reproject_lidar);
  CHECK_FALSE(pc.merge_single_lidar);
  REQUIRE(pc.area_of_interest.has_value());
  CHECK(pc.area_of_interest->pmin[0] == -84.5);
  CHECK(pc.area_of_interest->pmax[1] == 33.7);
}

TEST_CASE("app flags") {
  auto args = make_args({"-h", "--version"});
  TerraprepConfigHandler handler;
  handler.parse_cli_first_pass(args);
  CHECK(handler._print_help);
  CHECK(handler._print_version);
  CHECK(args.args.empty());
}

TEST_CASE("invalid command line arguments") {
  terraprep::test::ScratchDir out("terraprep_cli_invalid");
  TerraprepConfigHandler handler;

  SECTION("unknown argument") {
    auto args = make_args({"--colour", "red", out.path.string()});
    CHECK_THROWS_AS(handler.parse_cli_second_pass(args), ConfigError);
  }
  SECTION("missing output directory") {
    auto args = make_args({"--type", "dem"});
    CHECK_THROWS_AS(handler.parse_cli_second_pass(args), ConfigError);
  }
  SECTION("bad number") {
    auto args = make_args({"--png-precision", "sixteen", out.path.string()});
    CHECK_THROWS_AS(handler.parse_cli_second_pass(args), ConfigError);
  }
  SECTION("value not allowed") {
    auto args = make_args({"--dem-output", "jpg", out.path.string()});
    handler.parse_cli_second_pass(args);
    CHECK_THROWS_AS(handler.validate(), ConfigError);
  }
  SECTION("crop without area of interest") {
    auto args = make_args({"--dem-filter-type", "merge", out.path.string()});
    handler.parse_cli_second_pass(args);
    CHECK_THROWS_AS(handler.validate(), ConfigError);
  }
}

TEST_CASE("config file") {
  terraprep::test::ScratchDir dir("terraprep_toml");
  auto out = dir / "out";
  fs::create_directories(out);
  auto toml_path = terraprep::test::touch(
      dir / "terraprep.toml",
      "output-directory = \"" + out.generic_string() + "\"\n"
      "type = \"dem\"\n"
      "dem-merge-method = \"project\"\n"
      "dem-resolution = 2017\n"
      "dem-filter-type = \"merge\"\n"
      "aoi = [-84.5, 33.6, -84.4, 33.7]\n"
      "png-precision = 8\n");

  TerraprepConfigHandler handler;
  handler._config_path = toml_path.string();
  handler.parse_config_file();

  // the command line overrides the config file
  auto args = make_args({"--dem-merge-method", "both"});
  handler.parse_cli_second_pass(args);
  REQUIRE_NOTHROW(handler.validate());

  auto pc = handler.pipeline_config();
  CHECK(pc.output_directory == out);
  CHECK(pc.dem_merge_scope == terraprep::MergeScope::both);
  CHECK(pc.dem_resolution.mode == terraprep::ResolutionMode::fixed);
  CHECK(pc.dem_resolution.size == 2017);
  CHECK(pc.dem_filter == terraprep::pipeline::DemFilter::merge);
  CHECK(pc.png_precision == 8);

  terraprep::test::touch(dir / "unknown.toml", "colour = \"red\"\n");
  TerraprepConfigHandler other;
  other._config_path = (dir / "unknown.toml").string();
  CHECK_THROWS_AS(other.parse_config_file(), ConfigError);

  terraprep::test::touch(dir / "broken.toml", "type = \n");
  other._config_path = (dir / "broken.toml").string();
  CHECK_THROWS_AS(other.parse_config_file(), ConfigError);
}
