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
#include <terraprep/io/RasterDataset.hpp>
#include <terraprep/pipeline/UnitNormalizer.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "raster_fixtures.hpp"

using namespace terraprep;
using Catch::Approx;

TEST_CASE("feet units") {
  using pipeline::is_feet_unit;
  CHECK(is_feet_unit("US survey foot"));
  CHECK(is_feet_unit("feet"));
  CHECK(is_feet_unit("ft"));
  CHECK(is_feet_unit("ftUS"));
  CHECK_FALSE(is_feet_unit("metre"));
  CHECK_FALSE(is_feet_unit("m"));
  CHECK_FALSE(is_feet_unit(""));
}

TEST_CASE("feet conversion factors") {
  using pipeline::feet_to_metre_factor;
  CHECK(feet_to_metre_factor("US survey foot") == pipeline::US_SURVEY_FOOT);
  CHECK(feet_to_metre_factor("ftUS") == pipeline::US_SURVEY_FOOT);
  CHECK(feet_to_metre_factor("us-ft") == pipeline::US_SURVEY_FOOT);
  CHECK(feet_to_metre_factor("ft") == pipeline::INTERNATIONAL_FOOT);
  CHECK(feet_to_metre_factor("international foot") ==
        pipeline::INTERNATIONAL_FOOT);
  CHECK(feet_to_metre_factor("feet") == pipeline::INTERNATIONAL_FOOT);
}

TEST_CASE("vertical unit detection") {
  test::ScratchDir dir("terraprep_units");
  auto writer = io::createRasterWriterGDAL();
  auto normalizer = pipeline::createUnitNormalizer(*writer);

  test::RasterSpec spec;
  spec.unit = "ft";
  auto in_feet = test::make_raster(dir / "tile_ft.tif", spec);
  auto info = normalizer->detect_vertical_unit(in_feet);
  REQUIRE(info.unit.has_value());
  CHECK(*info.unit == "ft");
  CHECK(info.source == UnitSource::band);

  spec.unit.clear();
  auto one_meter =
      test::make_raster(dir / "USGS_1M_17_x55y396_NC.tif", spec);
  info = normalizer->detect_vertical_unit(one_meter);
  CHECK(info.unit == std::optional<std::string>("metre"));
  CHECK(info.source == UnitSource::heuristic);

  auto bare = test::make_raster(dir / "bare.tif", spec);
  info = normalizer->detect_vertical_unit(bare);
  CHECK_FALSE(info.unit.has_value());
  CHECK(info.source == UnitSource::unknown);
  CHECK_FALSE(normalizer->normalize(bare).has_value());

  info = normalizer->detect_vertical_unit(dir / "missing.tif");
  CHECK(info.source == UnitSource::error);
}

TEST_CASE("conversion to metres keeps nodata") {
  test::ScratchDir dir("terraprep_convert");
  auto writer = io::createRasterWriterGDAL();
  auto normalizer = pipeline::createUnitNormalizer(*writer);

  test::RasterSpec spec;
  spec.unit = "US survey foot";
  spec.value = [](int col, int row) {
    return col == 0 && row == 0 ? -9999.0 : 1000.0;
  };
  auto source = test::make_raster(dir / "tile.tif", spec);

  auto converted = normalizer->normalize(source);
  REQUIRE(converted.has_value());
  CHECK(converted->filename() == "tile_converted.tif");

  auto cells = test::read_band(*converted);
  CHECK(cells[0] == Approx(-9999.0));
  CHECK(cells[1] == Approx(1000.0 * pipeline::US_SURVEY_FOOT));
  CHECK(cells.back() == Approx(304.8006096));

  auto ds = io::createRasterDatasetGDAL();
  ds->open(*converted);
  CHECK(ds->band_unit() == "metre");
  CHECK(ds->nodata() == std::optional<double>(-9999.0));
  CHECK(ds->authority_code() == "EPSG:26917");
}

TEST_CASE("international feet are converted exactly") {
  test::ScratchDir dir("terraprep_convert_ft");
  auto writer = io::createRasterWriterGDAL();
  auto normalizer = pipeline::createUnitNormalizer(*writer);

  test::RasterSpec spec;
  spec.unit = "ft";
  spec.value = [](int, int) { return 1000.0; };
  auto converted = normalizer->normalize(test::make_raster(dir / "t.tif", spec));
  REQUIRE(converted.has_value());
  CHECK(test::read_band(*converted).front() == Approx(304.8));
}
