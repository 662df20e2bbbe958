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

  // Mosaic, reprojection and windowing with cubic resampling.
  struct RasterWarperInterface {
    virtual ~RasterWarperInterface() = default;

    // Throws MergeError when GDAL fails to produce output.
    virtual void mosaic(const vec1p& inputs, const fs::path& output,
                        const std::string& target_crs) = 0;

    virtual void reproject(const fs::path& input, const fs::path& output,
                           const std::string& target_crs) = 0;

    // Extracts window (in the CRS of input) into output, resampled to
    // size = {width, height} when given.
    virtual void extract_window(const fs::path& input, const fs::path& output,
                                const Box& window,
                                std::optional<arr2i> size) = 0;
  };

  std::unique_ptr<RasterWarperInterface> createRasterWarperGDAL();
}  // namespace terraprep::io
