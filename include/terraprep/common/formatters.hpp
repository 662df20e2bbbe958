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
#include <terraprep/common/datastructures.hpp>

// Formatter for terraprep::TBox<double>
template <typename T>
struct std::formatter<terraprep::TBox<T>> {
  constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const terraprep::TBox<T>& box, std::format_context& ctx) const {
    return std::format_to(ctx.out(), "[{},{},{},{}]", box.pmin[0],
                          box.pmin[1], box.pmax[0], box.pmax[1]);
  }
};

// Formatter for std::optional<terraprep::TBox<double>>
template <typename T>
struct std::formatter<std::optional<terraprep::TBox<T>>> {
  constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const std::optional<terraprep::TBox<T>>& box,
              std::format_context& ctx) const {
    if (!box.has_value()) {
      return std::format_to(ctx.out(), "");
    } else {
      return std::format_to(ctx.out(), "[{},{},{},{}]", box->pmin[0],
                            box->pmin[1], box->pmax[0], box->pmax[1]);
    }
  }
};

template <>
struct std::formatter<terraprep::TargetResolution> {
  constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const terraprep::TargetResolution& res,
              std::format_context& ctx) const {
    return std::format_to(ctx.out(), "{}", res.to_string());
  }
};

template <>
struct std::formatter<terraprep::MergeScope> {
  constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const terraprep::MergeScope& scope,
              std::format_context& ctx) const {
    return std::format_to(ctx.out(), "{}", terraprep::name_of(scope));
  }
};

template <>
struct std::formatter<terraprep::OutputFormat> {
  constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const terraprep::OutputFormat& format,
              std::format_context& ctx) const {
    return std::format_to(ctx.out(), "{}", terraprep::extension_of(format));
  }
};
