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


#ifndef SHAPE_HPP
#define SHAPE_HPP

#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include "geometry.hpp"
#include "coating_types.hpp"

// Axis-aligned in the shape frame, (x, y) is the top-left corner.
struct Rectangle {
  coordinate_type_fp x;
  coordinate_type_fp y;
  coordinate_type_fp width;
  coordinate_type_fp height;
};

struct Circle {
  coordinate_type_fp x;
  coordinate_type_fp y;
  coordinate_type_fp radius;
};

// The points are relative to (x, y).
struct Polyline {
  coordinate_type_fp x;
  coordinate_type_fp y;
  std::vector<point_type_fp> points;
};

typedef boost::variant<Rectangle, Circle, Polyline> Boundary;

// A design shape together with its coating intent.  The optional
// parameters fall back to the process-wide CoatingSettings.
struct CoatingShape {
  std::string name;
  Boundary boundary = Rectangle{0, 0, 0, 0};
  CoatingType::CoatingType coating_type = CoatingType::FILL;
  boost::optional<coordinate_type_fp> line_spacing;
  boost::optional<coordinate_type_fp> coating_width;
  boost::optional<FillPattern::FillPattern> fill_pattern;
  unsigned int outline_passes = 1;
  OutlineStartPoint::OutlineStartPoint outline_start_point = OutlineStartPoint::CENTER;
  double rotation = 0;  // degrees
  double scale_x = 1;
  double scale_y = 1;
  // Pivot offset, subtracted from the geometric center to get the
  // rotation center.
  coordinate_type_fp offset_x = 0;
  coordinate_type_fp offset_y = 0;
  bool skip_coating = false;
  // Only used by masking shapes.
  boost::optional<coordinate_type_fp> masking_clearance;
};

// The (x, y) anchor of the boundary.
point_type_fp origin(const Boundary& boundary);

// The bounding box of the boundary in the shape frame.  A polyline
// without points has no bounds.
boost::optional<box_type_fp> bounds(const Boundary& boundary);

// Rectangle middle, circle center or polyline origin.
point_type_fp shape_center(const Boundary& boundary);
point_type_fp shape_center(const CoatingShape& shape);

// Point containment in the shape frame.  Polylines contain a point
// only when they have at least 3 points and the closed polygon covers it.
bool contains(const Boundary& boundary, const point_type_fp& point);

// "rectangle", "circle" or "polyline".
std::string kind_name(const Boundary& boundary);

#endif // SHAPE_HPP
