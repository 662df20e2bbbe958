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

#include <sstream>
#include <terraprep/common/datastructures.hpp>
#include <terraprep/pipeline/CrsDecisionPolicy.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace terraprep;
using pipeline::CrsDecision;

static const std::set<std::string> candidates = {"EPSG:26917",
                                                 "EPSG:6346"};

TEST_CASE("automatic crs decisions") {
  CHECK(pipeline::createAutoConfirmPolicy()->resolve(candidates) ==
        CrsDecision::proceed);
  CHECK(pipeline::createAutoAbortPolicy()->resolve(candidates) ==
        CrsDecision::abort);
}

TEST_CASE("prompt crs decision") {
  std::ostringstream out;

  SECTION("yes") {
    std::istringstream in(" Yes \n");
    auto policy = pipeline::createPromptPolicy(in, out);
    CHECK(policy->resolve(candidates) == CrsDecision::proceed);
    CHECK(out.str().find("EPSG:26917, EPSG:6346") != std::string::npos);
  }
  SECTION("no") {
    std::istringstream in("n\n");
    auto policy = pipeline::createPromptPolicy(in, out);
    CHECK(policy->resolve(candidates) == CrsDecision::abort);
  }
  SECTION("empty answer") {
    std::istringstream in("\n");
    auto policy = pipeline::createPromptPolicy(in, out);
    CHECK(policy->resolve(candidates) == CrsDecision::abort);
  }
  SECTION("end of input") {
    std::istringstream in;
    auto policy = pipeline::createPromptPolicy(in, out);
    CHECK(policy->resolve(candidates) == CrsDecision::abort);
  }
}

TEST_CASE("crs policy by name") {
  CHECK(pipeline::createCrsDecisionPolicy("abort")->resolve(candidates) ==
        CrsDecision::abort);
  CHECK(pipeline::createCrsDecisionPolicy("proceed")->resolve(candidates) ==
        CrsDecision::proceed);
  CHECK_THROWS_AS(pipeline::createCrsDecisionPolicy("ask"), ConfigError);
}
