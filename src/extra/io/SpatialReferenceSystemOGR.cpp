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
#include <terraprep/io/SpatialReferenceSystem.hpp>
#include <string>
#include <cpl_conv.h>
#include <ogr_spatialref.h>

namespace terraprep::io {

  struct SpatialReferenceSystemOGR : public SpatialReferenceSystemInterface {
    OGRSpatialReference srs;

    SpatialReferenceSystemOGR() {
      srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    }

    void import(const std::string& user_input) override {
      if (srs.SetFromUserInput(user_input.c_str()) != OGRERR_NONE) {
        logger::Logger::get_logger().debug("OGR could not interpret '{}'",
                                           user_input);
        srs.Clear();
      }
    };

    void import_epsg(const int epsg) override {
      if (srs.importFromEPSG(epsg) != OGRERR_NONE) srs.Clear();
    };

    void import_wkt(const std::string& wkt) override {
      auto c_str = wkt.c_str();
      if (srs.importFromWkt(&c_str) != OGRERR_NONE) srs.Clear();
    };

    std::string export_wkt() const override {
      char* wkt_ptr = nullptr;
      std::string wkt;
      if (srs.exportToWkt(&wkt_ptr) == OGRERR_NONE && wkt_ptr) {
        wkt = wkt_ptr;
      }
      CPLFree(wkt_ptr);
      return wkt;
    };

    bool is_valid() const override {
      return !srs.IsEmpty() && srs.Validate() == OGRERR_NONE;
    };

    void clear() override { srs.Clear(); };

    std::string get_auth_name() const override {
      auto name = srs.GetAuthorityName(nullptr);
      return name ? name : "";
    };

    std::string get_auth_code() const override {
      auto code = srs.GetAuthorityCode(nullptr);
      return code ? code : "";
    };

    static const char* horizontal_key(const OGRSpatialReference& s) {
      if (s.IsProjected()) return "PROJCS";
      if (s.IsGeographic()) return "GEOGCS";
      return nullptr;
    }

    static std::string lookup(const OGRSpatialReference& s) {
      auto key = horizontal_key(s);
      auto name = s.GetAuthorityName(key);
      auto code = s.GetAuthorityCode(key);
      if (name && code) return std::string(name) + ":" + code;
      return "";
    }

    std::string authority_code() override {
      if (srs.IsEmpty()) return "";
      auto code = lookup(srs);
      if (!code.empty()) return code;

      OGRSpatialReference identified(srs);
      if (identified.AutoIdentifyEPSG() == OGRERR_NONE) {
        code = lookup(identified);
      }
      return code;
    };

    bool is_geographic() const override { return srs.IsGeographic(); };

    bool is_compound() const override { return srs.IsCompound(); };

    std::string vertical_unit() const override {
      if (!srs.IsVertical() && !srs.IsCompound()) return "";
      const char* name = nullptr;
      srs.GetTargetLinearUnits("VERT_CS", &name);
      return name ? name : "";
    };
  };

  std::unique_ptr<SpatialReferenceSystemInterface>
  createSpatialReferenceSystemOGR() {
    return std::make_unique<SpatialReferenceSystemOGR>();
  };
}  // namespace terraprep::io
