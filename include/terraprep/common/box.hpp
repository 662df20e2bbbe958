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

#include <algorithm>
#include <array>
#include <initializer_list>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace terraprep {

  template <typename T>
  struct TBox {
    std::array<T, 3> pmin, pmax;
    bool just_cleared;

    TBox() { clear(); };

    TBox(const TBox& otherBox)
        : pmin(otherBox.min()),
          pmax(otherBox.max()),
          just_cleared(otherBox.just_cleared){};

    TBox& operator=(const TBox& otherBox) = default;

    // {xmin, ymin, zmin, xmax, ymax, zmax}
    TBox(std::initializer_list<T> initList) {
      clear();
      auto it = initList.begin();
      pmin[0] = *it++;
      pmin[1] = *it++;
      pmin[2] = *it++;
      pmax[0] = *it++;
      pmax[1] = *it++;
      pmax[2] = *it;
      just_cleared = false;
    }

    static TBox from_2d(T xmin, T ymin, T xmax, T ymax) {
      return TBox{xmin, ymin, 0, xmax, ymax, 0};
    }

    std::array<T, 3> min() const { return pmin; };
    std::array<T, 3> max() const { return pmax; };
    T size_x() const { return pmax[0] - pmin[0]; };
    T size_y() const { return pmax[1] - pmin[1]; };

    void add(const std::array<T, 3>& p) {
      if (just_cleared) {
        pmin = p;
        pmax = p;
        just_cleared = false;
        return;
      }
      for (size_t i = 0; i < 3; ++i) {
        pmin[i] = std::min(p[i], pmin[i]);
        pmax[i] = std::max(p[i], pmax[i]);
      }
    };
    void add(const TBox& otherBox) {
      if (otherBox.isEmpty()) return;
      add(otherBox.min());
      add(otherBox.max());
    };

    bool intersects(const TBox& otherBox) const {
      bool intersect_x =
          (pmin[0] < otherBox.pmax[0]) && (pmax[0] > otherBox.pmin[0]);
      bool intersect_y =
          (pmin[1] < otherBox.pmax[1]) && (pmax[1] > otherBox.pmin[1]);
      return intersect_x && intersect_y;
    };
    // 2D containment, closed on all sides.
    bool contains(T x, T y) const {
      return pmin[0] <= x && x <= pmax[0] && pmin[1] <= y && y <= pmax[1];
    };
    // Strictly positive extent in x and y.
    bool is_valid() const {
      return !just_cleared && pmin[0] < pmax[0] && pmin[1] < pmax[1];
    };

    void clear() {
      pmin.fill(0);
      pmax.fill(0);
      just_cleared = true;
    };
    bool isEmpty() const { return just_cleared; };

    std::string wkt() const {
      if (isEmpty()) return "POLYGON EMPTY";
      std::ostringstream oss;
      oss << std::fixed << std::setprecision(6);
      oss << "POLYGON((";
      oss << pmin[0] << " " << pmin[1] << ", ";
      oss << pmax[0] << " " << pmin[1] << ", ";
      oss << pmax[0] << " " << pmax[1] << ", ";
      oss << pmin[0] << " " << pmax[1] << ", ";
      oss << pmin[0] << " " << pmin[1];
      oss << "))";
      return oss.str();
    }
  };

  typedef TBox<double> Box;
}  // namespace terraprep
