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
#include <terraprep/io/PointCloudReader.hpp>

namespace terraprep::io {

  // Writes .las or .laz, chosen by the file extension.
  struct PointCloudWriterInterface {
    virtual ~PointCloudWriterInterface() = default;

    // Throws ProcessingEngineError when the file cannot be created.
    virtual void open(const std::string& path,
                      const PointCloudLayout& layout) = 0;
    virtual void write_point(const PointRecord& point) = 0;
    // Finalises the header bounds and counts.
    virtual void close() = 0;
    virtual std::uint64_t points_written() const = 0;
  };

  std::unique_ptr<PointCloudWriterInterface> createPointCloudWriterLASlib();
}  // namespace terraprep::io
