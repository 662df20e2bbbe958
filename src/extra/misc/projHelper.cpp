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

#include <terraprep/logger/logger.h>
#include <terraprep/misc/projHelper.hpp>

#include <cpl_error.h>
#include <ogr_spatialref.h>

namespace terraprep::misc {

  struct OGRTransformDeleter {
    void operator()(OGRCoordinateTransformation* ct) const {
      OGRCoordinateTransformation::DestroyCT(ct);
    }
  };

  struct projHelper : public projHelperInterface {
    OGRSpatialReference source, target;
    std::unique_ptr<OGRCoordinateTransformation, OGRTransformDeleter>
        transformation;
    std::string source_name, target_name;

    static void import_crs(OGRSpatialReference& srs, const std::string& crs) {
      srs.Clear();
      srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
      if (crs.empty() || srs.SetFromUserInput(crs.c_str()) != OGRERR_NONE) {
        throw CrsTransformationError("Unknown coordinate reference system '" +
                                     crs + "'.");
      }
    }

    void set_transform(const std::string& source_crs,
                       const std::string& target_crs) override {
      clear();
      import_crs(source, source_crs);
      import_crs(target, target_crs);
      transformation.reset(OGRCreateCoordinateTransformation(&source, &target));
      if (!transformation) {
        throw CrsTransformationError(
            "No transformation from " + source_crs + " to " + target_crs +
            ". " + CPLGetLastErrorMsg());
      }
      source_name = source_crs;
      target_name = target_crs;
    };

    void clear() override {
      transformation.reset();
      source_name.clear();
      target_name.clear();
    };

    bool has_transform() const override { return transformation != nullptr; };

    arr3d transform(double x, double y, double z) override {
      if (!transformation) {
        throw CrsTransformationError("No transformation has been set.");
      }
      if (!transformation->Transform(1, &x, &y, &z)) {
        throw CrsTransformationError("Failed to transform (" +
                                     std::to_string(x) + ", " +
                                     std::to_string(y) + ") from " +
                                     source_name + " to " + target_name + ".");
      }
      return {x, y, z};
    };

    Box transform_box(const Box& box) override {
      Box result;
      for (double x : {box.pmin[0], box.pmax[0]}) {
        for (double y : {box.pmin[1], box.pmax[1]}) {
          auto p = transform(x, y, 0);
          result.add({p[0], p[1], 0.});
        }
      }
      return result;
    };
  };

  std::unique_ptr<projHelperInterface> createProjHelper() {
    return std::make_unique<projHelper>();
  };

  Box transform_box(const Box& box, const std::string& source_crs,
                    const std::string& target_crs) {
    projHelper pj;
    pj.set_transform(source_crs, target_crs);
    auto result = pj.transform_box(box);
    logger::Logger::get_logger().debug("Transformed {} from {} to {}: {}",
                                       box.wkt(), source_crs, target_crs,
                                       result.wkt());
    return result;
  }
}  // namespace terraprep::misc
