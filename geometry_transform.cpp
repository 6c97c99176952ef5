/*
 * This file is part of coatpath.
 *
 * Copyright (C) 2025 The coatpath authors
 *
 * coatpath is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * coatpath is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with coatpath.  If not, see <http://www.gnu.org/licenses/>.
 */


#include "geometry_transform.hpp"

#include <cmath>
#include <boost/math/constants/constants.hpp>

namespace geometry_transform {

point_type_fp rotate(const point_type_fp& point, const point_type_fp& center, double angle) {
  if (angle == 0) {
    return point;
  }
  const double radians = angle * boost::math::constants::pi<double>() / 180;
  const double cos_a = std::cos(radians);
  const double sin_a = std::sin(radians);
  const double dx = point.x() - center.x();
  const double dy = point.y() - center.y();
  return point_type_fp(center.x() + dx * cos_a - dy * sin_a,
                       center.y() + dx * sin_a + dy * cos_a);
}

segments_type_fp rotate(const segments_type_fp& segments, const point_type_fp& center, double angle) {
  if (angle == 0) {
    return segments;
  }
  segments_type_fp ret;
  ret.reserve(segments.size());
  for (const auto& segment : segments) {
    ret.push_back(segment_type_fp(rotate(segment.first, center, angle),
                                  rotate(segment.second, center, angle)));
  }
  return ret;
}

point_type_fp rotation_center(const CoatingShape& shape) {
  const point_type_fp center = shape_center(shape);
  return point_type_fp(center.x() - shape.offset_x, center.y() - shape.offset_y);
}

point_type_fp to_local(const point_type_fp& point, const CoatingShape& shape) {
  return rotate(point, rotation_center(shape), -shape.rotation);
}

segments_type_fp to_world(const segments_type_fp& segments, const CoatingShape& shape) {
  return rotate(segments, rotation_center(shape), shape.rotation);
}

} // namespace geometry_transform
