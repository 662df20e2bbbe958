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

#include <cstdlib>
#include <string>

#include <terraprep/terraprep.h>

#include "config.hpp"

int main(int argc, const char* argv[]) {
  auto& logger = terraprep::logger::Logger::get_logger();

  CLIArgs cli_args(argc, argv);
  TerraprepConfigHandler handler;

  // Parse basic command line arguments (not yet the configuration parameters)
  try {
    handler.parse_cli_first_pass(cli_args);
  } catch (const std::exception& e) {
    logger.error("Failed to parse command line arguments.");
    logger.error("{} Use '-h' to print usage information.", e.what());
    return EXIT_FAILURE;
  }
  if (handler._print_help) {
    handler.print_help(cli_args.program_name);
    return EXIT_SUCCESS;
  }
  if (handler._print_version) {
    handler.print_version();
    return EXIT_SUCCESS;
  }
  logger.set_level(handler._loglevel);

  // Read configuration file, config path has already been checked for existence
  if (handler._config_path.size()) {
    logger.info("Reading configuration from file {}", handler._config_path);
    try {
      handler.parse_config_file();
    } catch (const std::exception& e) {
      logger.error(
          "Unable to parse config file {}. {} Use '-h' to print usage "
          "information.",
          handler._config_path, e.what());
      return EXIT_FAILURE;
    }
  }

  // Command line arguments override values from the config file
  try {
    handler.parse_cli_second_pass(cli_args);
  } catch (const std::exception& e) {
    logger.error(
        "Failed to parse command line arguments. {} Use '-h' to print usage "
        "information.",
        e.what());
    return EXIT_FAILURE;
  }

  try {
    handler.validate();
  } catch (const std::exception& e) {
    logger.error(
        "Failed to validate parameter values. {} Use '-h' to print usage "
        "information.",
        e.what());
    return EXIT_FAILURE;
  }

  logger.debug("{}", handler);

  std::unique_ptr<terraprep::pipeline::CrsDecisionPolicyInterface> crs_policy;
  try {
    crs_policy =
        terraprep::pipeline::createCrsDecisionPolicy(handler.cfg_.crs_mismatch);
  } catch (const terraprep::ConfigError& e) {
    logger.error("{}", e.what());
    return EXIT_FAILURE;
  }

  terraprep::pipeline::PipelineReport report;
  try {
    report = terraprep::pipeline::run_pipeline(handler.pipeline_config(),
                                               *crs_policy);
  } catch (const terraprep::CrsMismatchAbort& e) {
    logger.critical("{}", e.what());
    return EXIT_FAILURE;
  } catch (const std::exception& e) {
    logger.error("{}", e.what());
    return EXIT_FAILURE;
  }

  for (auto& path : report.dem.outputs) {
    logger.info("DEM output: {}", path.string());
  }
  for (auto& [id, path] : report.lidar_merged) {
    logger.info("LiDAR output for {}: {}", id, path.string());
  }
  for (auto& [id, path] : report.lidar_filtered) {
    logger.info("Cropped LiDAR output for {}: {}", id, path.string());
  }
  if (!report.ok()) {
    for (auto& stage : report.failed_stages) {
      logger.error("The {} stage did not complete", stage);
    }
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
