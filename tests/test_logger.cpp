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

#include <catch2/catch_test_macros.hpp>

TEST_CASE("logger") {
  auto& logger = terraprep::logger::Logger::get_logger();
  logger.set_level(terraprep::logger::LogLevel::trace);
  REQUIRE(logger.get_level() == terraprep::logger::LogLevel::trace);
  logger.progress("merge", 1, 42);
  logger.debug("debug");
  logger.info("info {}", 1);
  logger.warning("warning");
  logger.error("error");
  logger.critical("critical");
  logger.set_level(terraprep::logger::LogLevel::info);
}
