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


#include "outline_planner.hpp"

#include <algorithm>
#include <cmath>
#include <boost/math/constants/constants.hpp>

namespace outline_planner {

namespace {

class outline_visitor : public boost::static_visitor<segments_type_fp> {
 public:
  outline_visitor(const EffectiveParameters& parameters)
      : offset(parameters.line_spacing),
        passes(parameters.outline_passes) {
    switch (parameters.outline_start_point) {
      case OutlineStartPoint::OUTSIDE:
        first_offset = offset;
        break;
      case OutlineStartPoint::INSIDE:
        first_offset = -offset;
        break;
      case OutlineStartPoint::CENTER:
      default:
        first_offset = 0;
        break;
    }
  }

  segments_type_fp operator()(const Rectangle& r) const {
    segments_type_fp ret;
    for (unsigned int pass = 0; pass < passes; pass++) {
      const coordinate_type_fp d = first_offset + offset * pass;
      const coordinate_type_fp width = r.width + d * 2;
      const coordinate_type_fp height = r.height + d * 2;
      if (width <= 0 || height <= 0) {
        continue;
      }
      const auto sides = box_segments(r.x - d, r.y - d, width, height);
      ret.insert(ret.end(), sides.cbegin(), sides.cend());
    }
    return ret;
  }

  segments_type_fp operator()(const Circle& c) const {
    segments_type_fp ret;
    const unsigned int chords = chord_count(c.radius);
    for (unsigned int pass = 0; pass < passes; pass++) {
      const coordinate_type_fp radius = c.radius + first_offset + offset * pass;
      if (radius <= 0) {
        continue;
      }
      const auto ring = circle_segments(point_type_fp(c.x, c.y), radius, chords);
      ret.insert(ret.end(), ring.cbegin(), ring.cend());
    }
    return ret;
  }

  // Lines are traced as drawn, without offsetting or extra passes.
  segments_type_fp operator()(const Polyline& p) const {
    segments_type_fp ret;
    for (size_t i = 1; i < p.points.size(); i++) {
      ret.push_back(segment_type_fp(
          point_type_fp(p.x + p.points[i-1].x(), p.y + p.points[i-1].y()),
          point_type_fp(p.x + p.points[i].x(), p.y + p.points[i].y())));
    }
    return ret;
  }

 private:
  const coordinate_type_fp offset;
  const unsigned int passes;
  coordinate_type_fp first_offset;
};

} // namespace

unsigned int chord_count(coordinate_type_fp radius) {
  return std::max(16u, static_cast<unsigned int>(std::max(0.0, std::floor(radius * 0.5))));
}

segments_type_fp circle_segments(const point_type_fp& center, coordinate_type_fp radius,
                                 unsigned int chords) {
  segments_type_fp ret;
  const double step = 2 * boost::math::constants::pi<double>() / chords;
  auto at = [&](unsigned int i) {
    const double angle = (i % chords) * step;
    return point_type_fp(center.x() + radius * std::cos(angle),
                         center.y() + radius * std::sin(angle));
  };
  for (unsigned int i = 0; i < chords; i++) {
    ret.push_back(segment_type_fp(at(i), at(i + 1)));
  }
  return ret;
}

segments_type_fp box_segments(coordinate_type_fp x, coordinate_type_fp y,
                              coordinate_type_fp width, coordinate_type_fp height) {
  const point_type_fp top_left(x, y);
  const point_type_fp top_right(x + width, y);
  const point_type_fp bottom_right(x + width, y + height);
  const point_type_fp bottom_left(x, y + height);
  return {
    segment_type_fp(top_left, top_right),
    segment_type_fp(top_right, bottom_right),
    segment_type_fp(bottom_right, bottom_left),
    segment_type_fp(bottom_left, top_left),
  };
}

segments_type_fp plan_outline(const CoatingShape& shape, const EffectiveParameters& parameters) {
  return boost::apply_visitor(outline_visitor(parameters), shape.boundary);
}

} // namespace outline_planner
