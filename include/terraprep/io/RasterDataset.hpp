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
#include <utility>
#include <terraprep/common/datastructures.hpp>

namespace terraprep::io {

  // Read access to a single raster file.
  struct RasterDatasetInterface {
    virtual ~RasterDatasetInterface() = default;

    // Throws InvalidInputError: "... not found" when the file does not
    // exist, "Could not open ..." when GDAL cannot read it.
    virtual void open(const fs::path& source) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    virtual int width() const = 0;
    virtual int height() const = 0;
    virtual std::array<double, 6> geotransform() const = 0;

    // Horizontal authority code, eg. "EPSG:26917", empty if undetectable.
    virtual std::string authority_code() const = 0;
    virtual std::string projection_wkt() const = 0;

    // Unit type set on band 1, empty if absent.
    virtual std::string band_unit() const = 0;
    // Linear unit of the vertical part of a compound CRS, empty if absent.
    virtual std::string vertical_crs_unit() const = 0;

    virtual std::optional<double> nodata() const = 0;

    // Exact min/max of band 1, nodata excluded.
    virtual std::pair<double, double> min_max() = 0;

    virtual RasterArtifact describe() = 0;
  };

  std::unique_ptr<RasterDatasetInterface> createRasterDatasetGDAL();

  // Throws DriverUnavailableError when the GDAL driver is not registered.
  void require_driver(const std::string& driver_name);
}  // namespace terraprep::io
