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

#include <memory>
#include <string>

namespace terraprep::io {
  struct SpatialReferenceSystemInterface {
    virtual ~SpatialReferenceSystemInterface() = default;

    virtual bool is_valid() const = 0;
    virtual void clear() = 0;

    // Accepts anything OGR understands: "EPSG:4326", WKT, PROJ strings.
    virtual void import(const std::string& user_input) = 0;
    virtual void import_epsg(const int epsg) = 0;
    virtual void import_wkt(const std::string& wkt) = 0;
    virtual std::string export_wkt() const = 0;

    virtual std::string get_auth_name() const = 0;
    virtual std::string get_auth_code() const = 0;

    // "AUTH:CODE" of the horizontal part, identified from the definition if
    // the authority is not set explicitly. Empty when it cannot be found.
    virtual std::string authority_code() = 0;

    virtual bool is_geographic() const = 0;
    virtual bool is_compound() const = 0;

    // Name of the linear unit of the vertical part of a compound or
    // vertical CRS. Empty when there is no vertical part.
    virtual std::string vertical_unit() const = 0;
  };

  std::unique_ptr<SpatialReferenceSystemInterface>
  createSpatialReferenceSystemOGR();
}  // namespace terraprep::io
