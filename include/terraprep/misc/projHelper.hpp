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
#include <terraprep/common/common.hpp>
#include <terraprep/common/datastructures.hpp>
#include <terraprep/io/SpatialReferenceSystem.hpp>

namespace terraprep::misc {

  // Coordinate transformation between two CRS in traditional GIS axis order
  // (x = easting/longitude, y = northing/latitude).
  struct projHelperInterface {
    virtual ~projHelperInterface() = default;

    // Throws CrsTransformationError when either CRS is unknown or no
    // transformation exists between them.
    virtual void set_transform(const std::string& source_crs,
                               const std::string& target_crs) = 0;
    virtual void clear() = 0;
    virtual bool has_transform() const = 0;

    virtual arr3d transform(double x, double y, double z = 0) = 0;

    // Envelope of the four transformed corners of box.
    virtual Box transform_box(const Box& box) = 0;
  };

  std::unique_ptr<projHelperInterface> createProjHelper();

  // One-shot box transformation, eg. an AOI from "EPSG:4326" to a UTM zone.
  Box transform_box(const Box& box, const std::string& source_crs,
                    const std::string& target_crs);
}  // namespace terraprep::misc
