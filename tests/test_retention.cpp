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

#include <terraprep/pipeline/RetentionPolicy.hpp>

#include <catch2/catch_test_macros.hpp>

#include "test_helpers.hpp"

using namespace terraprep;
using terraprep::test::touch;

TEST_CASE("name based retention rule") {
  using pipeline::should_keep;
  CHECK(should_keep("merged.tif", "tif", true));
  CHECK(should_keep("merged_filtered.png", "png", true));
  CHECK_FALSE(should_keep("tile.tif", "tif", true));
  CHECK_FALSE(should_keep("merged.png.aux.xml", "png", true));
  CHECK_FALSE(should_keep("merged.tif", "png", true));

  CHECK(should_keep("tile.tif", "tif", false));
  CHECK_FALSE(should_keep("tile.tif.aux.xml", "tif", false));
}

TEST_CASE("role based retention rule") {
  using pipeline::should_keep;
  CHECK(should_keep(FileRole::merged, "merged.png", "png", true));
  CHECK(should_keep(FileRole::filtered, "out.png", "png", true));
  CHECK_FALSE(should_keep(FileRole::tile, "heightmap1.png", "png", true));
  CHECK(should_keep(FileRole::tile, "heightmap1.png", "png", false));
  CHECK_FALSE(should_keep(FileRole::sidecar, "merged.hdr", "hdr", false));
  // names do not matter once the role is known
  CHECK_FALSE(
      should_keep(FileRole::original, "merged_source.tif", "tif", true));
}

TEST_CASE("files to remove") {
  test::ScratchDir dir("terraprep_retention");
  touch(dir / "a.tif");
  touch(dir / "b.tif");
  touch(dir / "merged.tif");
  touch(dir / "merged.png");
  touch(dir / "merged.png.aux.xml");
  fs::create_directories(dir / "subdir");

  SECTION("without ledger") {
    auto policy = pipeline::createRetentionPolicy();
    auto removable = policy->files_to_remove(dir.path, "png", true);
    REQUIRE(removable.size() == 4);
    CHECK(policy->remove(removable) == 4);
    CHECK(fs::exists(dir / "merged.png"));
    CHECK(fs::exists(dir / "subdir"));
    CHECK(test::count_files(dir.path) == 1);
  }

  SECTION("with ledger") {
    ProvenanceLedger ledger;
    ledger.record(dir / "merged.png", FileRole::merged);
    ledger.record(dir / "merged.png.aux.xml", FileRole::sidecar);
    ledger.record(dir / "a.tif", FileRole::original);
    auto policy = pipeline::createRetentionPolicy(&ledger);
    auto removable = policy->files_to_remove(dir.path, "tif", false);
    // a.tif, b.tif and merged.tif keep the target extension
    REQUIRE(removable.size() == 2);
    policy->remove(removable);
    CHECK_FALSE(ledger.role_of(dir / "merged.png").has_value());
    CHECK(ledger.role_of(dir / "a.tif") == FileRole::original);
  }

  SECTION("missing directory") {
    auto policy = pipeline::createRetentionPolicy();
    CHECK(policy->files_to_remove(dir / "missing", "tif").empty());
  }
}

TEST_CASE("removal is best effort") {
  test::ScratchDir dir("terraprep_remove");
  auto policy = pipeline::createRetentionPolicy();
  auto file = touch(dir / "a.tif");
  CHECK(policy->remove({dir / "missing.tif", file}) == 1);
  CHECK_FALSE(fs::exists(file));

  touch(dir / "project/x.tif");
  touch(dir / "project/nested/y.tif");
  CHECK(policy->remove_tree(dir / "project") == 4);
  CHECK_FALSE(fs::exists(dir / "project"));
}

TEST_CASE("entries that cannot be inspected are kept") {
  test::ScratchDir dir("terraprep_retention_loop");
  touch(dir / "a.tif");
  fs::create_symlink(dir / "loop.tif", dir / "loop.tif");

  auto policy = pipeline::createRetentionPolicy();
  vec1p removable;
  REQUIRE_NOTHROW(removable = policy->files_to_remove(dir.path, "png", true));
  REQUIRE(removable.size() == 1);
  CHECK(removable[0] == dir / "a.tif");
}
