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

#include <terraprep/pipeline/ProjectGrouper.hpp>

#include <catch2/catch_test_macros.hpp>

#include "test_helpers.hpp"

using namespace terraprep;
using terraprep::test::touch;

TEST_CASE("project name from catalog url") {
  const std::string url =
      "https://prd-tnm.s3.amazonaws.com/StagedProducts/Elevation/1m/Projects/"
      "NC_Phase5_2018/TIFF/USGS_1M_17_x55y396_NC_Phase5_2018.tif";
  CHECK(pipeline::project_name_from_url(url) == "NC_Phase5_2018");
  CHECK(pipeline::project_directory_for("out", DataKind::lidar, url) ==
        fs::path("out") / "lidar" / "NC_Phase5_2018");

  CHECK_THROWS_AS(
      pipeline::project_name_from_url("https://example.com/data/tile.tif"),
      MalformedUrlError);
  CHECK_THROWS_AS(
      pipeline::project_name_from_url("https://example.com/Projects/"),
      MalformedUrlError);
}

TEST_CASE("original tiles") {
  CHECK(pipeline::is_original_tile("USGS_1M_x1y2.tif", DataKind::dem));
  CHECK_FALSE(pipeline::is_original_tile("merged.tif", DataKind::dem));
  CHECK_FALSE(
      pipeline::is_original_tile("merged_filtered.tif", DataKind::dem));
  CHECK_FALSE(pipeline::is_original_tile("a_converted.tif", DataKind::dem));
  CHECK_FALSE(pipeline::is_original_tile("heightmap.png", DataKind::dem));

  CHECK(pipeline::is_original_tile("tile.LAZ", DataKind::lidar));
  CHECK_FALSE(
      pipeline::is_original_tile("tile_reprojected.laz", DataKind::lidar));
  CHECK_FALSE(pipeline::is_original_tile("merged.laz", DataKind::lidar));
}

TEST_CASE("rediscover project groups") {
  test::ScratchDir out("terraprep_grouper");
  touch(out / "dem/P1/a.tif");
  touch(out / "dem/P1/b.tif");
  touch(out / "dem/P1/merged.tif");
  touch(out / "dem/P1/merged.png.aux.xml");
  touch(out / "dem/P2/c.tif");
  touch(out / "dem/stray.tif");

  auto grouper = pipeline::createProjectGrouper();
  auto groups = grouper->group(out.path, DataKind::dem);

  REQUIRE(groups.size() == 2);
  REQUIRE(groups.count("P1"));
  CHECK(groups["P1"].size() == 2);
  CHECK(groups["P1"].files[0].filename() == "a.tif");
  CHECK(groups["P1"].directory.filename() == "P1");
  CHECK(groups["P2"].is_single());

  // grouping twice gives the same result
  auto again = grouper->group(out.path, DataKind::dem);
  REQUIRE(again.size() == groups.size());
  CHECK(again["P1"].files == groups["P1"].files);

  CHECK(grouper->group(out.path, DataKind::lidar).empty());
  CHECK(grouper->group(out / "missing", DataKind::dem).empty());
}

TEST_CASE("append deduplicates") {
  auto grouper = pipeline::createProjectGrouper();
  ProjectGroupMap groups;
  CHECK(grouper->append(groups, "out/dem/P1/", "out/dem/P1/a.tif"));
  CHECK(grouper->append(groups, "out/dem/P1", "out/dem/P1/b.tif"));
  CHECK_FALSE(grouper->append(groups, "out/dem/P1", "out/dem/P1/./a.tif"));

  REQUIRE(groups.size() == 1);
  CHECK(groups.begin()->first == "P1");
  CHECK(groups["P1"].size() == 2);
}

TEST_CASE("unreadable entries are skipped") {
  test::ScratchDir out("terraprep_grouper_loop");
  touch(out / "dem/P1/a.tif");
  fs::create_directories(out / "dem/P2");
  // symbolic links to themselves fail every status query
  fs::create_directory_symlink(out / "dem/loop", out / "dem/loop");
  fs::create_symlink(out / "dem/P2/loop.tif", out / "dem/P2/loop.tif");

  auto grouper = pipeline::createProjectGrouper();
  ProjectGroupMap groups;
  REQUIRE_NOTHROW(groups = grouper->group(out.path, DataKind::dem));
  REQUIRE(groups.size() == 1);
  CHECK(groups.at("P1").size() == 1);
}
