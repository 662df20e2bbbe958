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

/**
 * Logger for terraprep.
 *
 * Implements a logger using the spdlog library as the backend.
 * The logger is thread-safe and writes messages to a JSON file in addition to
 * logging to the console. Warnings and lower go to stdout, errors to stderr.
 * */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <mutex>

#include "fmt/format.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace terraprep::logger {

  enum class LogLevel : std::uint8_t {
    off = 0,
    trace,
    debug,
    info,
    default_level = info,
    warning,
    error,
    critical,
  };

  class Logger final {
   public:
    ~Logger() = default;

    // Copy is cheap, because of the shared implementation.
    Logger(const Logger &) = default;
    Logger &operator=(const Logger &) = default;

    Logger(Logger &&) noexcept = delete;
    Logger &operator=(Logger &&) noexcept = delete;

    /**
     * @brief Set the minimum level for the logger implementation. Messages
     * with a level below will be ignored.
     */
    void set_level(LogLevel level) {
      if (impl_) {
        impl_->set_level(level);
      }
    }

    LogLevel get_level() const {
      return impl_ ? impl_->level : LogLevel::off;
    }

    /** @brief Returns a reference to the single logger instance. */
    static Logger &get_logger() {
      static Logger singleton;
      if (!singleton.impl_) {
        singleton.impl_ = std::make_shared<Logger::logger_impl>();
      }
      return singleton;
    }

    /**
     * @brief Progress of a pipeline stage, logged at trace level.
     *
     * The message is a JSON object with the "stage", "done" and "total"
     * members so that the logfile can be post-processed.
     */
    void progress(std::string_view stage, size_t done, size_t total) {
      log(LogLevel::trace,
          fmt::format(R"({{\"stage\":\"{}\",\"done\":{},\"total\":{}}})",
                      stage, done, total));
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args &&...args) {
      log(LogLevel::debug, fmt::vformat(fmt, fmt::make_format_args(args...)));
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> fmt, Args &&...args) {
      log(LogLevel::info, fmt::vformat(fmt, fmt::make_format_args(args...)));
    }

    template <typename... Args>
    void warning(fmt::format_string<Args...> fmt, Args &&...args) {
      log(LogLevel::warning, fmt::vformat(fmt, fmt::make_format_args(args...)));
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> fmt, Args &&...args) {
      log(LogLevel::error, fmt::vformat(fmt, fmt::make_format_args(args...)));
    }

    template <typename... Args>
    void critical(fmt::format_string<Args...> fmt, Args &&...args) {
      log(LogLevel::critical,
          fmt::vformat(fmt, fmt::make_format_args(args...)));
    }

   private:
    inline static const std::string logfile_path_{"terraprep.log.json"};

    Logger() = default;

    struct logger_impl {
      LogLevel level = LogLevel::default_level;

      std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> stdout_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> stderr_sink =
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      std::shared_ptr<spdlog::sinks::basic_file_sink<std::mutex>> file_sink =
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(logfile_path_,
                                                              true);

      spdlog::logger logger_stdout =
          spdlog::logger("terraprep", {stdout_sink, file_sink});
      spdlog::logger logger_stderr =
          spdlog::logger("terraprep", {stderr_sink, file_sink});

      logger_impl() {
        stdout_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
        stderr_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
        // One JSON object per line in the logfile.
        file_sink->set_pattern(
            R"({"time": "%Y-%m-%dT%H:%M:%S.%f%z", "name": "%n", "level": "%l", "process": %P, "thread": %t, "message": "%v"})");
        set_level(level);
      }

      ~logger_impl() {
        logger_stdout.flush();
        logger_stderr.flush();
        spdlog::drop_all();
      }

      void set_level(LogLevel new_level) {
        level = new_level;
        auto spdlog_level = cast_level(new_level);
        stdout_sink->set_level(spdlog_level);
        stderr_sink->set_level(spdlog_level);
        file_sink->set_level(spdlog_level);
        logger_stdout.set_level(spdlog_level);
        logger_stderr.set_level(spdlog_level);
      }

      static spdlog::level::level_enum cast_level(LogLevel level) {
        switch (level) {
          case LogLevel::off:
            return spdlog::level::off;
          case LogLevel::trace:
            return spdlog::level::trace;
          case LogLevel::debug:
            return spdlog::level::debug;
          case LogLevel::info:
            return spdlog::level::info;
          case LogLevel::warning:
            return spdlog::level::warn;
          case LogLevel::error:
            return spdlog::level::err;
          case LogLevel::critical:
            return spdlog::level::critical;
        }
        return spdlog::level::off;
      }
    };
    std::shared_ptr<logger_impl> impl_;

    void log(LogLevel level, std::string_view message) {
      if (!impl_) return;
      switch (level) {
        case LogLevel::off:
          return;
        case LogLevel::trace:
          impl_->logger_stdout.trace(message);
          return;
        case LogLevel::debug:
          impl_->logger_stdout.debug(message);
          return;
        case LogLevel::info:
          impl_->logger_stdout.info(message);
          return;
        case LogLevel::warning:
          impl_->logger_stdout.warn(message);
          return;
        case LogLevel::error:
          impl_->logger_stderr.error(message);
          return;
        case LogLevel::critical:
          impl_->logger_stderr.critical(message);
          return;
      }
    }
  };

}  // namespace terraprep::logger
