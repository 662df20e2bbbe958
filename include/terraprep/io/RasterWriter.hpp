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
#include <terraprep/common/datastructures.hpp>

namespace terraprep::io {

  struct RasterWriterInterface {
    virtual ~RasterWriterInterface() = default;

    // Writes band 1 of source multiplied by factor as a Float32 GeoTIFF.
    // Nodata cells keep the nodata value, the band unit type is set to unit.
    virtual void write_scaled(const fs::path& source, const fs::path& target,
                              double factor, const std::string& unit) = 0;

    // Linear rescale of band 1 from [min, max] to the full range of the
    // output type and encode as PNG (8 or 16 bit) or ENVI UInt16 (r16).
    virtual void encode(const fs::path& source, const fs::path& target,
                        OutputFormat format, int precision, double min,
                        double max) = 0;
  };

  std::unique_ptr<RasterWriterInterface> createRasterWriterGDAL();
}  // namespace terraprep::io
