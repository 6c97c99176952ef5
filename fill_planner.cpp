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


#include "fill_planner.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "bg_operators.hpp"
#include "errors.hpp"
#include "geometry_transform.hpp"
#include "outline_planner.hpp"

namespace fill_planner {

namespace {

const unsigned int density_grid = 5;
const double density_threshold = 0.4;

// The part of one scan line inside the boundary, from low to high.
class scan_line_visitor : public boost::static_visitor<boost::optional<segment_type_fp>> {
 public:
  scan_line_visitor(bool horizontal, coordinate_type_fp coordinate)
      : horizontal(horizontal), coordinate(coordinate) {}

  boost::optional<segment_type_fp> operator()(const Rectangle& r) const {
    if (horizontal) {
      if (coordinate >= r.y && coordinate <= r.y + r.height) {
        return segment_type_fp(point_type_fp(r.x, coordinate), point_type_fp(r.x + r.width, coordinate));
      }
    } else {
      if (coordinate >= r.x && coordinate <= r.x + r.width) {
        return segment_type_fp(point_type_fp(coordinate, r.y), point_type_fp(coordinate, r.y + r.height));
      }
    }
    return boost::none;
  }

  boost::optional<segment_type_fp> operator()(const Circle& c) const {
    const coordinate_type_fp center_main = horizontal ? c.y : c.x;
    const coordinate_type_fp center_cross = horizontal ? c.x : c.y;
    const coordinate_type_fp d = std::abs(coordinate - center_main);
    if (d > c.radius) {
      return boost::none;
    }
    const coordinate_type_fp half = std::sqrt(c.radius * c.radius - d * d);
    if (horizontal) {
      return segment_type_fp(point_type_fp(center_cross - half, coordinate),
                             point_type_fp(center_cross + half, coordinate));
    } else {
      return segment_type_fp(point_type_fp(coordinate, center_cross - half),
                             point_type_fp(coordinate, center_cross + half));
    }
  }

  // No interior to fill.
  boost::optional<segment_type_fp> operator()(const Polyline&) const {
    return boost::none;
  }

 private:
  const bool horizontal;
  const coordinate_type_fp coordinate;
};

class concentric_visitor : public boost::static_visitor<segments_type_fp> {
 public:
  concentric_visitor(const EffectiveParameters& parameters, Checkpoint& checkpoint)
      : line_spacing(parameters.line_spacing),
        coating_width(parameters.coating_width),
        checkpoint(checkpoint) {}

  segments_type_fp operator()(const Rectangle& r) const {
    segments_type_fp ret;
    if (r.width <= coating_width || r.height <= coating_width) {
      return ret;
    }
    const point_type_fp center(r.x + r.width / 2, r.y + r.height / 2);
    coordinate_type_fp width = r.width - coating_width;
    coordinate_type_fp height = r.height - coating_width;
    while (width > 0 && height > 0) {
      const auto ring = outline_planner::box_segments(
          center.x() - width / 2, center.y() - height / 2, width, height);
      ret.insert(ret.end(), ring.cbegin(), ring.cend());
      width -= line_spacing * 2;
      height -= line_spacing * 2;
      checkpoint.tick();
    }
    return ret;
  }

  segments_type_fp operator()(const Circle& c) const {
    segments_type_fp ret;
    const unsigned int chords = outline_planner::chord_count(c.radius);
    for (coordinate_type_fp radius = c.radius - coating_width / 2; radius > 0; radius -= line_spacing) {
      const auto ring = outline_planner::circle_segments(point_type_fp(c.x, c.y), radius, chords);
      ret.insert(ret.end(), ring.cbegin(), ring.cend());
      checkpoint.tick();
    }
    return ret;
  }

  segments_type_fp operator()(const Polyline&) const {
    return segments_type_fp();
  }

 private:
  const coordinate_type_fp line_spacing;
  const coordinate_type_fp coating_width;
  Checkpoint& checkpoint;
};

// Calls line_fn(index, coordinate) for the center of every scan line.
template <typename LineFn>
void for_each_scan_line(const box_type_fp& bounds, bool horizontal,
                        const EffectiveParameters& parameters, Checkpoint& checkpoint,
                        LineFn line_fn) {
  const coordinate_type_fp half_width = parameters.coating_width / 2;
  const coordinate_type_fp low = horizontal ? bounds.min_corner().y() : bounds.min_corner().x();
  const coordinate_type_fp high = horizontal ? bounds.max_corner().y() : bounds.max_corner().x();
  const coordinate_type_fp first = low + half_width;
  const coordinate_type_fp last = high - half_width;
  if (first > last || parameters.line_spacing <= 0) {
    return;
  }
  for (unsigned int i = 0; ; i++) {
    const coordinate_type_fp coordinate = first + i * parameters.line_spacing;
    if (coordinate > last + scan_tolerance) {
      break;
    }
    line_fn(i, coordinate);
    checkpoint.tick();
  }
}

bool is_scan_direction(FillPattern::FillPattern direction) {
  return direction == FillPattern::HORIZONTAL || direction == FillPattern::VERTICAL;
}

} // namespace

FillPattern::FillPattern choose_direction(const CoatingShape& shape, const box_type_fp& bounds,
                                          const MaskIndex& masks) {
  const coordinate_type_fp width = bounds.max_corner().x() - bounds.min_corner().x();
  const coordinate_type_fp height = bounds.max_corner().y() - bounds.min_corner().y();
  const FillPattern::FillPattern along_longer = width > height ? FillPattern::HORIZONTAL : FillPattern::VERTICAL;
  const FillPattern::FillPattern along_shorter = width > height ? FillPattern::VERTICAL : FillPattern::HORIZONTAL;
  if (!masks.has_masks()) {
    return along_longer;
  }

  const coordinate_type_fp step_x = width / density_grid;
  const coordinate_type_fp step_y = height / density_grid;
  unsigned int masked = 0;
  for (unsigned int i = 0; i < density_grid; i++) {
    for (unsigned int j = 0; j < density_grid; j++) {
      const point_type_fp sample(bounds.min_corner().x() + (i + 0.5) * step_x,
                                 bounds.min_corner().y() + (j + 0.5) * step_y);
      if (contains(shape.boundary, geometry_transform::to_local(sample, shape)) &&
          masks.is_point_in_mask_area(sample)) {
        masked++;
      }
    }
  }
  const double density = double(masked) / (density_grid * density_grid);
  return density > density_threshold ? along_shorter : along_longer;
}

segments_type_fp scan_lines(const CoatingShape& shape, const EffectiveParameters& parameters,
                            FillPattern::FillPattern direction, Checkpoint& checkpoint) {
  segments_type_fp ret;
  const auto shape_bounds = bounds(shape.boundary);
  if (!shape_bounds) {
    return ret;
  }
  const bool horizontal = direction == FillPattern::HORIZONTAL;
  for_each_scan_line(*shape_bounds, horizontal, parameters, checkpoint,
                     [&](unsigned int i, coordinate_type_fp coordinate) {
    const auto line = boost::apply_visitor(scan_line_visitor(horizontal, coordinate), shape.boundary);
    if (line) {
      ret.push_back(i % 2 == 0 ? *line : reversed(*line));
    }
  });
  return ret;
}

segments_type_fp scan_lines_around_masks(const CoatingShape& shape, const EffectiveParameters& parameters,
                                         FillPattern::FillPattern direction, const MaskIndex& masks,
                                         Checkpoint& checkpoint) {
  segments_type_fp ret;
  const auto shape_bounds = bounds(shape.boundary);
  if (!shape_bounds) {
    return ret;
  }
  const bool horizontal = direction == FillPattern::HORIZONTAL;
  const ScanAxis::ScanAxis axis = horizontal ? ScanAxis::HORIZONTAL : ScanAxis::VERTICAL;
  for_each_scan_line(*shape_bounds, horizontal, parameters, checkpoint,
                     [&](unsigned int i, coordinate_type_fp coordinate) {
    const auto line = boost::apply_visitor(scan_line_visitor(horizontal, coordinate), shape.boundary);
    if (!line) {
      return;
    }
    const coordinate_type_fp lo = horizontal ? line->first.x() : line->first.y();
    const coordinate_type_fp hi = horizontal ? line->second.x() : line->second.y();
    segments_type_fp pieces;
    for (const auto& interval : masks.allowed_intervals(axis, coordinate, lo, hi)) {
      if (horizontal) {
        pieces.push_back(segment_type_fp(point_type_fp(interval.first, coordinate),
                                         point_type_fp(interval.second, coordinate)));
      } else {
        pieces.push_back(segment_type_fp(point_type_fp(coordinate, interval.first),
                                         point_type_fp(coordinate, interval.second)));
      }
    }
    if (i % 2 == 1) {
      std::reverse(pieces.begin(), pieces.end());
      for (auto& piece : pieces) {
        piece = reversed(piece);
      }
    }
    ret.insert(ret.end(), pieces.cbegin(), pieces.cend());
  });
  return ret;
}

segments_type_fp concentric_rings(const CoatingShape& shape, const EffectiveParameters& parameters,
                                  Checkpoint& checkpoint) {
  if (parameters.line_spacing <= 0) {
    return segments_type_fp();
  }
  return boost::apply_visitor(concentric_visitor(parameters, checkpoint), shape.boundary);
}

segments_type_fp plan_fill(const CoatingShape& shape, const EffectiveParameters& parameters,
                           const MaskIndex& masks, MaskAvoidance::MaskAvoidance avoidance,
                           Checkpoint& checkpoint) {
  const auto shape_bounds = bounds(shape.boundary);
  if (!shape_bounds || parameters.line_spacing <= 0) {
    return segments_type_fp();
  }

  FillPattern::FillPattern pattern = parameters.fill_pattern;
  switch (pattern) {
    case FillPattern::HORIZONTAL:
    case FillPattern::VERTICAL:
    case FillPattern::CONCENTRIC:
      break;
    case FillPattern::AUTO:
      pattern = choose_direction(shape, *shape_bounds, masks);
      break;
    default:
      throw unsupported_pattern(std::to_string(static_cast<int>(pattern)));
  }

  if (!masks.has_masks()) {
    const auto local = is_scan_direction(pattern)
        ? scan_lines(shape, parameters, pattern, checkpoint)
        : concentric_rings(shape, parameters, checkpoint);
    return geometry_transform::to_world(local, shape);
  }

  if (masks.is_shape_inside_mask(shape)) {
    return segments_type_fp();
  }
  if (is_scan_direction(pattern) && avoidance == MaskAvoidance::ROUTE_AROUND && shape.rotation == 0) {
    return scan_lines_around_masks(shape, parameters, pattern, masks, checkpoint);
  }
  const auto local = is_scan_direction(pattern)
      ? scan_lines(shape, parameters, pattern, checkpoint)
      : concentric_rings(shape, parameters, checkpoint);
  return masks.apply_masking(geometry_transform::to_world(local, shape), shape);
}

} // namespace fill_planner
