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
#include <format>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <toml++/toml.hpp>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include <terraprep/common/formatters.hpp>
#include <terraprep/logger/logger.h>

#include "validators.hpp"

// Formatter for terraprep::logger::LogLevel
template <>
struct std::formatter<terraprep::logger::LogLevel> {
  constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const terraprep::logger::LogLevel& level,
              std::format_context& ctx) const {
    switch (level) {
      case terraprep::logger::LogLevel::trace:
        return std::format_to(ctx.out(), "trace");
      case terraprep::logger::LogLevel::debug:
        return std::format_to(ctx.out(), "debug");
      case terraprep::logger::LogLevel::info:
        return std::format_to(ctx.out(), "info");
      case terraprep::logger::LogLevel::warning:
        return std::format_to(ctx.out(), "warning");
      case terraprep::logger::LogLevel::error:
        return std::format_to(ctx.out(), "error");
      default:
        return std::format_to(ctx.out(), "unknown");
    }
  }
};

inline terraprep::logger::LogLevel parse_loglevel(const std::string& s) {
  using terraprep::logger::LogLevel;
  if (s == "trace") return LogLevel::trace;
  if (s == "debug") return LogLevel::debug;
  if (s == "info") return LogLevel::info;
  if (s == "warning") return LogLevel::warning;
  if (s == "error") return LogLevel::error;
  throw terraprep::ConfigError("Invalid argument for LogLevel: " + s + ".");
}

struct ConfigParameter {
  std::string longname_;
  std::optional<char> shortname_;
  std::string help_;
  std::string example_;
  ConfigParameter(std::string longname, char shortname, std::string help)
      : longname_(longname), shortname_(shortname), help_(help){};
  ConfigParameter(std::string longname, std::string help)
      : longname_(longname), help_(help){};
  virtual ~ConfigParameter() = default;

  virtual std::optional<std::string> validate() = 0;

  virtual std::list<std::string>::iterator set(
      std::list<std::string>& args, std::list<std::string>::iterator it) = 0;
  virtual void unset() = 0;

  virtual void set_from_toml(const toml::table& table,
                             const std::string& name) = 0;

  virtual std::string description() = 0;
  virtual std::string type_description() = 0;
  virtual std::string to_string() = 0;
  virtual std::string default_to_string() = 0;
  virtual std::string cli_flag() = 0;

  std::string example_to_string() {
    if (example_.size() == 0) {
      return "<no example>";
    } else {
      return std::format("{}", example_);
    }
  }
};

template <typename T>
struct ConfigParameterByReference : public ConfigParameter {
  T& value_;
  T default_value_;
  std::vector<Validator<T>> validators_;

  ConfigParameterByReference(std::string longname, std::string help, T& value,
                             std::vector<Validator<T>> validators)
      : ConfigParameter(longname, help),
        value_(value),
        default_value_(value),
        validators_(validators){};
  ConfigParameterByReference(std::string longname, char shortname,
                             std::string help, T& value,
                             std::vector<Validator<T>> validators)
      : ConfigParameter(longname, shortname, help),
        value_(value),
        default_value_(value),
        validators_(validators){};

  std::optional<std::string> validate() override {
    for (auto& validator : validators_) {
      if (auto error_msg = validator(value_)) {
        return error_msg;
      }
    }
    return std::nullopt;
  }

  std::string to_string() override { return std::format("{}", value_); }

  std::string default_to_string() override {
    std::string s = std::format("{}", default_value_);
    if (s.size() == 0) {
      return "<no value>";
    }
    return s;
  }

  std::string cli_flag() override {
    if (shortname_.has_value()) {
      return std::format("-{}, --{}", shortname_.value(), longname_);
    } else {
      if constexpr (std::is_same_v<T, bool>) {
        return std::format("--[no-]{}", longname_);
      } else {
        return std::format("--{}", longname_);
      }
    }
  }

  void unset() override {
    if constexpr (std::is_same_v<T, bool>) {
      value_ = false;
    } else {
      value_ = default_value_;
    }
  }

  std::list<std::string>::iterator set(
      std::list<std::string>& args,
      std::list<std::string>::iterator it) override {
    if constexpr (std::is_same_v<T, bool>) {
      value_ = true;
      return it;
    } else {
      if (it == args.end()) {
        throw terraprep::ConfigError("Missing argument for parameter");
      } else if constexpr (std::is_same_v<T, int>) {
        value_ = std::stoi(*it);
        return args.erase(it);
      } else if constexpr (std::is_same_v<T, std::string>) {
        value_ = *it;
        return args.erase(it);
      } else if constexpr (std::is_same_v<T,
                                          std::optional<terraprep::Box>>) {
        if (std::distance(it, args.end()) < 4) {
          throw terraprep::ConfigError("Not enough arguments, need 4.");
        }
        double v[4];
        for (auto& d : v) {
          d = std::stod(*it);
          it = args.erase(it);
        }
        value_ = terraprep::Box::from_2d(v[0], v[1], v[2], v[3]);
        return it;
      } else if constexpr (std::is_same_v<T, terraprep::logger::LogLevel>) {
        value_ = parse_loglevel(*it);
        return args.erase(it);
      } else {
        static_assert(!std::is_same_v<T, T>,
                      "Unsupported type for ConfigParameterByReference::set()");
      }
    }
  }

  void set_from_toml(const toml::table& table,
                     const std::string& name) override {
    if constexpr (std::is_same_v<T, std::optional<terraprep::Box>>) {
      if (const toml::array* a = table[name].as_array()) {
        if (a->size() == 4 &&
            (a->is_homogeneous(toml::node_type::floating_point) ||
             a->is_homogeneous(toml::node_type::integer))) {
          double v[4];
          for (size_t i = 0; i < 4; ++i) {
            v[i] = *a->get(i)->value<double>();
          }
          value_ = terraprep::Box::from_2d(v[0], v[1], v[2], v[3]);
        } else {
          throw terraprep::ConfigError("Failed to read value for " + name +
                                       " from config file.");
        }
      }
    } else if constexpr (std::is_same_v<T, terraprep::logger::LogLevel>) {
      if (const toml::value<std::string>* s = table[name].as_string()) {
        value_ = parse_loglevel(s->get());
      }
    } else if constexpr (std::is_same_v<T, std::string>) {
      // dem-resolution may be given as a number in the config file
      if (auto v = table[name].value<std::string>(); v.has_value()) {
        value_ = *v;
      } else if (auto i = table[name].value<int64_t>(); i.has_value()) {
        value_ = std::to_string(*i);
      }
    } else {
      if (auto value = table[name].value<T>(); value.has_value()) {
        value_ = *value;
      }
    }
  }

  std::string description() override { return std::format("{}", help_); }

  std::string type_description() override {
    if constexpr (std::is_same_v<T, bool>) {
      return "";
    } else if constexpr (std::is_same_v<T, int>) {
      return "<int>";
    } else if constexpr (std::is_same_v<T, std::string>) {
      return "<string>";
    } else if constexpr (std::is_same_v<T, std::optional<terraprep::Box>>) {
      return "(minLon minLat maxLon maxLat)";
    } else if constexpr (std::is_same_v<T, terraprep::logger::LogLevel>) {
      return "(trace|debug|info|warning|error)";
    } else {
      static_assert(!std::is_same_v<T, T>,
                    "Unsupported type for "
                    "ConfigParameterByReference::type_description()");
    }
  }
};

class ParameterVector {
 public:
  std::vector<std::unique_ptr<ConfigParameter>> params_;

  ParameterVector(){};
  ~ParameterVector() = default;

  ParameterVector(ParameterVector&&) = default;
  ParameterVector& operator=(ParameterVector&&) = default;

  ParameterVector(const ParameterVector&) = delete;
  ParameterVector& operator=(const ParameterVector&) = delete;

  template <typename T>
  ConfigParameter& add(const std::string& longname, const std::string& help,
                       T& value, std::vector<Validator<T>> validators = {}) {
    params_.emplace_back(std::make_unique<ConfigParameterByReference<T>>(
        longname, help, value, std::move(validators)));
    return *params_.back();
  }

  template <typename T>
  ConfigParameter& add(const std::string& longname, const char shortname,
                       const std::string& help, T& value,
                       std::vector<Validator<T>> validators = {}) {
    params_.emplace_back(std::make_unique<ConfigParameterByReference<T>>(
        longname, shortname, help, value, std::move(validators)));
    return *params_.back();
  }

  void add_to_index(std::unordered_map<std::string, ConfigParameter*>& index) {
    for (auto& param : params_) {
      index[param->longname_] = param.get();
      if (param->shortname_.has_value()) {
        index[std::string(1, param->shortname_.value())] = param.get();
      }
    }
  }

  auto begin() { return params_.begin(); }
  auto end() { return params_.end(); }
  auto begin() const { return params_.begin(); }
  auto end() const { return params_.end(); }
  auto size() const { return params_.size(); }
  auto empty() const { return params_.empty(); }
};
