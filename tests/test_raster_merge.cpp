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
#include <terraprep/io/RasterDataset.hpp>
#include <terraprep/pipeline/CrsReconciler.hpp>
#include <terraprep/pipeline/ProjectGrouper.hpp>
#include <terraprep/pipeline/RasterMergeEngine.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "raster_fixtures.hpp"

using namespace terraprep;
using Catch::Approx;

namespace {
  // GDAL backed engine with a shared ledger.
  struct Engines {
    ProvenanceLedger ledger;
    std::unique_ptr<pipeline::CrsDecisionPolicyInterface> policy;
    std::unique_ptr<io::RasterWarperInterface> warper =
        io::createRasterWarperGDAL();
    std::unique_ptr<io::RasterWriterInterface> writer =
        io::createRasterWriterGDAL();
    std::unique_ptr<pipeline::UnitNormalizerInterface> normalizer =
        pipeline::createUnitNormalizer(*writer);
    std::unique_ptr<pipeline::RetentionPolicyInterface> retention =
        pipeline::createRetentionPolicy(&ledger);
    std::unique_ptr<pipeline::CrsReconcilerInterface> reconciler;
    std::unique_ptr<pipeline::RasterMergeEngineInterface> engine;

    explicit Engines(std::unique_ptr<pipeline::CrsDecisionPolicyInterface> p =
                         pipeline::createAutoAbortPolicy())
        : policy(std::move(p)) {
      reconciler = pipeline::createCrsReconciler(*policy, *normalizer,
                                                 *warper, &ledger);
      engine = pipeline::createRasterMergeEngine(*reconciler, *warper,
                                                 *writer, *retention, &ledger);
    }
  };

  // n adjacent 10x10 tiles in dem/<project>/
  void make_project(const fs::path& out, const std::string& project, int n,
                    int epsg = 26917) {
    for (int i = 0; i < n; ++i) {
      test::RasterSpec spec;
      spec.epsg = epsg;
      spec.origin_x += 10 * i;
      test::make_raster(
          out / "dem" / project / ("tile" + std::to_string(i) + ".tif"), spec);
    }
  }

  bool contains(const vec1p& paths, const fs::path& path) {
    return std::find(paths.begin(), paths.end(), path) != paths.end();
  }
}  // namespace

TEST_CASE("output resolution") {
  using pipeline::get_resolution;
  CHECK(get_resolution(3900, 4100, TargetResolution::automatic()) ==
        arr2i{4033, 4033});
  CHECK(get_resolution(10, 10, TargetResolution::automatic()) ==
        arr2i{1009, 1009});
  CHECK(get_resolution(9000, 7000, TargetResolution::automatic()) ==
        arr2i{8129, 8129});
  CHECK(get_resolution(300, 200, TargetResolution::none()) ==
        arr2i{300, 200});
  CHECK(get_resolution(300, 200, TargetResolution::fixed(512)) ==
        arr2i{512, 512});
}

TEST_CASE("merge per project") {
  test::ScratchDir out("terraprep_merge_project");
  make_project(out.path, "P1", 3);
  make_project(out.path, "P2", 1);
  Engines engines;
  auto groups = pipeline::createProjectGrouper()->group(out.path,
                                                        DataKind::dem);
  REQUIRE(groups.size() == 2);

  MergeRequest request;
  request.merge_scope = MergeScope::project;

  SECTION("keep originals") {
    request.keep_originals = true;
    auto result = engines.engine->merge(groups, request);
    CHECK(result.authority_code == "EPSG:26917");
    REQUIRE(result.outputs.size() == 1);
    CHECK(result.outputs[0] == out / "dem/P1/merged.tif");
    CHECK(test::count_files(out / "dem/P1") == 4);
    CHECK(engines.ledger.role_of(out / "dem/P1/merged.tif") ==
          FileRole::merged);

    // single tile projects are not merged
    CHECK_FALSE(fs::exists(out / "dem/P2/merged.tif"));
    CHECK(test::count_files(out / "dem/P2") == 1);
  }

  SECTION("delete originals") {
    request.keep_originals = false;
    engines.engine->merge(groups, request);
    CHECK(test::count_files(out / "dem/P1") == 1);
    CHECK(fs::exists(out / "dem/P1/merged.tif"));
    CHECK(fs::exists(out / "dem/P2/tile0.tif"));
  }

  SECTION("merged output covers all tiles") {
    engines.engine->merge(groups, request);
    auto ds = io::createRasterDatasetGDAL();
    ds->open(out / "dem/P1/merged.tif");
    auto [min, max] = ds->min_max();
    CHECK(min >= 90.0);
    CHECK(max <= 150.0);
    CHECK(ds->authority_code() == "EPSG:4326");

    // three 10 m tiles side by side, about 91 km per degree of longitude
    // and 111 km per degree of latitude here
    auto gt = ds->geotransform();
    double span_x = ds->width() * std::abs(gt[1]);
    double span_y = ds->height() * std::abs(gt[5]);
    CHECK(span_x == Approx(30.0 / 91000).epsilon(0.15));
    CHECK(span_y == Approx(10.0 / 111000).epsilon(0.15));
    CHECK(ds->width() > 2 * ds->height());
  }

  SECTION("png output leaves only the merged height map") {
    request.keep_originals = false;
    request.output_format = OutputFormat::png;
    auto result = engines.engine->merge(groups, request);
    CHECK(contains(result.outputs, out / "dem/P1/merged.png"));
    CHECK(test::count_files(out / "dem/P1") == 1);
    CHECK(fs::exists(out / "dem/P1/merged.png"));
  }
}

TEST_CASE("merge all projects") {
  test::ScratchDir out("terraprep_merge_all");
  make_project(out.path, "P1", 2);
  make_project(out.path, "P2", 1);
  Engines engines;
  auto groups = pipeline::createProjectGrouper()->group(out.path,
                                                        DataKind::dem);

  MergeRequest request;
  request.merge_scope = MergeScope::all;
  request.keep_originals = false;
  auto result = engines.engine->merge(groups, request);

  REQUIRE(result.outputs.size() == 1);
  CHECK(result.outputs[0] == out / "dem/merged.tif");
  CHECK(fs::exists(out / "dem/merged.tif"));
  CHECK_FALSE(fs::exists(out / "dem/P1"));
  CHECK_FALSE(fs::exists(out / "dem/P2"));
}

TEST_CASE("merge on both levels") {
  test::ScratchDir out("terraprep_merge_both");
  make_project(out.path, "P1", 2);
  make_project(out.path, "P2", 2);
  Engines engines;
  auto groups = pipeline::createProjectGrouper()->group(out.path,
                                                        DataKind::dem);

  MergeRequest request;
  request.merge_scope = MergeScope::both;
  auto result = engines.engine->merge(groups, request);

  CHECK(contains(result.outputs, out / "dem/merged.tif"));
  CHECK(contains(result.outputs, out / "dem/P1/merged.tif"));
  CHECK(contains(result.outputs, out / "dem/P2/merged.tif"));
  CHECK(test::count_files(out / "dem/P1") == 3);
}

TEST_CASE("merge on both levels with a single tile project") {
  test::ScratchDir out("terraprep_merge_both_single");
  make_project(out.path, "P1", 2);
  make_project(out.path, "P2", 1);
  Engines engines(pipeline::createAutoAbortPolicy());
  auto groups = pipeline::createProjectGrouper()->group(out.path,
                                                        DataKind::dem);

  MergeRequest request;
  request.merge_scope = MergeScope::both;
  auto result = engines.engine->merge(groups, request);

  CHECK(result.authority_code == "EPSG:26917");
  CHECK(contains(result.outputs, out / "dem/merged.tif"));
  CHECK(contains(result.outputs, out / "dem/P1/merged.tif"));
  CHECK_FALSE(fs::exists(out / "dem/P2/merged.tif"));
}

TEST_CASE("both levels share the crop size") {
  test::ScratchDir out("terraprep_merge_both_crop");
  // 5 x 10 km tiles, P2 overlaps the first tile of P1. Without a target
  // resolution every crop takes the size of the overall one.
  for (int i = 0; i < 2; ++i) {
    test::RasterSpec spec;
    spec.width = 500;
    spec.height = 1000;
    spec.pixel_size = 10;
    spec.origin_x += 5000 * i;
    test::make_raster(
        out / "dem/P1" / ("tile" + std::to_string(i) + ".tif"), spec);
  }
  test::RasterSpec spec;
  spec.width = 500;
  spec.height = 1000;
  spec.pixel_size = 10;
  test::make_raster(out / "dem/P2/tile0.tif", spec);

  Engines engines;
  auto groups = pipeline::createProjectGrouper()->group(out.path,
                                                        DataKind::dem);
  MergeRequest request;
  request.merge_scope = MergeScope::both;
  request.crop_enabled = true;
  request.area_of_interest = Box::from_2d(-80.98, 35.18, -80.95, 35.20);
  request.target_resolution = TargetResolution::none();
  request.output_format = OutputFormat::png;
  auto result = engines.engine->merge(groups, request);

  auto ds = io::createRasterDatasetGDAL();
  ds->open(out / "dem/merged_filtered.tif");
  int width = ds->width(), height = ds->height();
  ds->close();
  CHECK(width > 1);
  CHECK(height > 1);

  for (auto rel : {"dem/merged_filtered.tif", "dem/P1/merged_filtered.tif",
                   "dem/P2/heightmap1_filtered.tif"}) {
    INFO(rel);
    REQUIRE(contains(result.outputs, out / rel));
    ds->open(out / rel);
    CHECK(ds->width() == width);
    CHECK(ds->height() == height);
    ds->close();
  }
  CHECK(fs::exists(out / "dem/merged_filtered.png"));
  CHECK(fs::exists(out / "dem/P1/merged_filtered.png"));
  CHECK(fs::exists(out / "dem/P2/heightmap1_filtered.png"));
  CHECK(fs::exists(out / "dem/P2/heightmap1.png"));
}

TEST_CASE("inputs in different crs") {
  test::ScratchDir out("terraprep_merge_crs");
  make_project(out.path, "P1", 1, 26917);
  test::RasterSpec spec;
  spec.epsg = 26918;
  test::make_raster(out / "dem/P1/tile9.tif", spec);
  auto groups = pipeline::createProjectGrouper()->group(out.path,
                                                        DataKind::dem);
  MergeRequest request;

  SECTION("abort") {
    Engines engines(pipeline::createAutoAbortPolicy());
    CHECK_THROWS_AS(engines.engine->merge(groups, request), CrsMismatchAbort);
    CHECK_FALSE(fs::exists(out / "dem/P1/merged.tif"));
  }
  SECTION("proceed") {
    Engines engines(pipeline::createAutoConfirmPolicy());
    auto result = engines.engine->merge(groups, request);
    CHECK(result.authority_code == "EPSG:26917");
    CHECK(fs::exists(out / "dem/P1/merged.tif"));
  }
}

TEST_CASE("unreadable inputs are skipped") {
  test::ScratchDir out("terraprep_merge_corrupt");
  make_project(out.path, "P1", 1);
  test::touch(out / "dem/P1/tile1.tif", "not a tiff");
  Engines engines;
  auto groups = pipeline::createProjectGrouper()->group(out.path,
                                                        DataKind::dem);
  auto result = engines.engine->merge(groups, MergeRequest());
  CHECK(fs::exists(out / "dem/P1/merged.tif"));

  std::error_code ec;
  fs::remove(out / "dem/P1/tile0.tif", ec);
  CHECK_THROWS_AS(engines.engine->merge(groups, MergeRequest()), MergeError);
}

TEST_CASE("height map encoding") {
  test::ScratchDir dir("terraprep_encode");
  test::RasterSpec spec;
  spec.nodata.reset();
  spec.value = [](int col, int row) { return 50.0 + 10 * row + col; };
  auto tif = test::make_raster(dir / "merged.tif", spec);
  Engines engines;

  SECTION("16 bit png") {
    auto png = engines.engine->convert(tif, OutputFormat::png, 16);
    CHECK(png == dir / "merged.png");
    auto cells = test::read_band(png);
    CHECK(*std::min_element(cells.begin(), cells.end()) == 0);
    CHECK(*std::max_element(cells.begin(), cells.end()) == 65535);
  }
  SECTION("8 bit png") {
    auto png = engines.engine->convert(tif, OutputFormat::png, 8);
    auto cells = test::read_band(png);
    CHECK(*std::min_element(cells.begin(), cells.end()) == 0);
    CHECK(*std::max_element(cells.begin(), cells.end()) == 255);
  }
  SECTION("raw 16 bit") {
    auto r16 = engines.engine->convert(tif, OutputFormat::r16, 16);
    CHECK(r16 == dir / "merged.r16");
    CHECK(fs::exists(r16));
    CHECK((fs::exists(dir / "merged.hdr") ||
           fs::exists(dir / "merged.r16.hdr")));
    auto cells = test::read_band(r16);
    CHECK(*std::min_element(cells.begin(), cells.end()) == 0);
    CHECK(*std::max_element(cells.begin(), cells.end()) == 65535);
  }
  SECTION("height range below a micrometre") {
    test::RasterSpec flat;
    flat.nodata.reset();
    flat.value = [](int col, int row) { return 1e-7 * (1 + col + row); };
    auto tiny = test::make_raster(dir / "flat.tif", flat);
    auto png = engines.engine->convert(tiny, OutputFormat::png, 16);
    auto cells = test::read_band(png);
    CHECK(*std::min_element(cells.begin(), cells.end()) == 0);
    CHECK(*std::max_element(cells.begin(), cells.end()) == 65535);
  }
  SECTION("tif is passed through") {
    CHECK(engines.engine->convert(tif, OutputFormat::tif, 16) == tif);
  }
}

TEST_CASE("crop to area of interest") {
  test::ScratchDir dir("terraprep_crop");
  // 10 km square west of 81W around 35.2N
  test::RasterSpec spec;
  spec.width = 1000;
  spec.height = 1000;
  spec.pixel_size = 10;
  auto tif = test::make_raster(dir / "merged.tif", spec);
  Engines engines;
  auto aoi = Box::from_2d(-80.98, 35.18, -80.95, 35.20);

  auto size = engines.engine->crop(tif, dir / "merged_filtered.tif",
                                   "EPSG:26917", aoi,
                                   TargetResolution::fixed(64));
  CHECK(size == arr2i{64, 64});
  CHECK_FALSE(fs::exists(dir / "warped.tif"));

  auto ds = io::createRasterDatasetGDAL();
  ds->open(dir / "merged_filtered.tif");
  CHECK(ds->width() == 64);
  CHECK(ds->height() == 64);

  CHECK_THROWS_AS(
      engines.engine->crop(tif, dir / "bad.tif", "EPSG:26917",
                           Box::from_2d(10, 10, 5, 5),
                           TargetResolution::automatic()),
      ConfigError);
}

TEST_CASE("single tile groups are encoded but not merged") {
  test::ScratchDir out("terraprep_merge_single");
  make_project(out.path, "P1", 1);
  Engines engines;
  auto groups = pipeline::createProjectGrouper()->group(out.path,
                                                        DataKind::dem);

  MergeRequest request;
  request.merge_scope = MergeScope::project;
  request.output_format = OutputFormat::png;
  auto result = engines.engine->merge(groups, request);

  CHECK(result.authority_code == "EPSG:26917");
  REQUIRE(result.outputs.size() == 1);
  CHECK(result.outputs[0] == out / "dem/P1/heightmap1.png");
  CHECK_FALSE(fs::exists(out / "dem/P1/merged.tif"));
  CHECK_FALSE(fs::exists(out / "dem/P1/merged.png"));
  CHECK(fs::exists(out / "dem/P1/tile0.tif"));
}
