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


#include "mask_index.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "bg_operators.hpp"
#include "geometry_transform.hpp"

using std::max;
using std::min;
using std::vector;

namespace {

// The range of t in [0, 1] for which start + t*(end-start) is inside the
// box.  Liang-Barsky.
boost::optional<interval_type_fp> box_overlap(const segment_type_fp& segment, const box_type_fp& box) {
  const coordinate_type_fp dx = segment.second.x() - segment.first.x();
  const coordinate_type_fp dy = segment.second.y() - segment.first.y();
  coordinate_type_fp t0 = 0;
  coordinate_type_fp t1 = 1;
  auto check = [&](coordinate_type_fp p, coordinate_type_fp q) {
    if (p == 0) {
      return q >= 0;
    }
    const coordinate_type_fp r = q / p;
    if (p < 0) {
      if (r > t1) return false;
      if (r > t0) t0 = r;
    } else {
      if (r < t0) return false;
      if (r < t1) t1 = r;
    }
    return true;
  };
  if (!check(-dx, segment.first.x() - box.min_corner().x()) ||
      !check(dx, box.max_corner().x() - segment.first.x()) ||
      !check(-dy, segment.first.y() - box.min_corner().y()) ||
      !check(dy, box.max_corner().y() - segment.first.y())) {
    return boost::none;
  }
  if (t0 < t1) {
    return interval_type_fp(t0, t1);
  }
  return boost::none;
}

// Same for a disc, by solving |start + t*d - center| = radius.
boost::optional<interval_type_fp> disc_overlap(const segment_type_fp& segment,
                                               const point_type_fp& center, coordinate_type_fp radius) {
  const coordinate_type_fp dx = segment.second.x() - segment.first.x();
  const coordinate_type_fp dy = segment.second.y() - segment.first.y();
  const coordinate_type_fp fx = segment.first.x() - center.x();
  const coordinate_type_fp fy = segment.first.y() - center.y();
  const coordinate_type_fp a = dx * dx + dy * dy;
  const coordinate_type_fp b = 2 * (fx * dx + fy * dy);
  const coordinate_type_fp c = fx * fx + fy * fy - radius * radius;
  if (a == 0) {
    // A single point.
    if (c <= 0) {
      return interval_type_fp(0, 1);
    }
    return boost::none;
  }
  const coordinate_type_fp discriminant = b * b - 4 * a * c;
  if (discriminant < 0) {
    return boost::none;
  }
  const coordinate_type_fp root = std::sqrt(discriminant);
  const coordinate_type_fp t_enter = max<coordinate_type_fp>(0, (-b - root) / (2 * a));
  const coordinate_type_fp t_exit = min<coordinate_type_fp>(1, (-b + root) / (2 * a));
  if (t_enter < t_exit) {
    return interval_type_fp(t_enter, t_exit);
  }
  return boost::none;
}

boost::optional<interval_type_fp> overlap(const segment_type_fp& segment, const MaskRegion& mask) {
  if (mask.round) {
    return disc_overlap(segment, mask.center, mask.radius);
  } else {
    return box_overlap(segment, mask.box);
  }
}

bool region_contains(const MaskRegion& mask, const point_type_fp& point) {
  if (mask.round) {
    return bg::distance(point, mask.center) <= mask.radius;
  } else {
    return bg::covered_by(point, mask.box);
  }
}

// Sort by start and fold the overlapping intervals together.  Touching
// intervals are folded only if merge_touching is set.
intervals_type_fp merge(intervals_type_fp intervals, bool merge_touching) {
  std::sort(intervals.begin(), intervals.end());
  intervals_type_fp merged;
  for (const auto& interval : intervals) {
    if (!merged.empty() &&
        (interval.first < merged.back().second ||
         (merge_touching && interval.first == merged.back().second))) {
      merged.back().second = max(merged.back().second, interval.second);
    } else {
      merged.push_back(interval);
    }
  }
  return merged;
}

coordinate_type_fp path_length(const point_type_fp& start, const vector<point_type_fp>& waypoints,
                               const point_type_fp& end) {
  if (waypoints.empty()) {
    return std::numeric_limits<coordinate_type_fp>::infinity();
  }
  coordinate_type_fp length = bg::distance(start, waypoints.front());
  for (size_t i = 1; i < waypoints.size(); i++) {
    length += bg::distance(waypoints[i-1], waypoints[i]);
  }
  return length + bg::distance(waypoints.back(), end);
}

} // namespace

MaskIndex::MaskIndex(const vector<CoatingShape>& shapes, const CoatingSettings& settings)
    : settings(settings) {
  if (!settings.enable_masking) {
    return;
  }
  for (const auto& shape : shapes) {
    if (shape.coating_type != CoatingType::MASKING || shape.skip_coating) {
      continue;
    }
    const auto shape_bounds = bounds(shape.boundary);
    if (!shape_bounds) {
      continue;
    }
    const coordinate_type_fp grow = clearance(shape);
    MaskRegion mask;
    mask.name = shape.name;
    mask.round = boost::get<Circle>(&shape.boundary) != nullptr;
    mask.center = shape_center(shape);
    mask.radius = 0;
    if (mask.round) {
      mask.radius = boost::get<Circle>(shape.boundary).radius + grow;
    }
    mask.box = box_type_fp(
        point_type_fp(shape_bounds->min_corner().x() - grow, shape_bounds->min_corner().y() - grow),
        point_type_fp(shape_bounds->max_corner().x() + grow, shape_bounds->max_corner().y() + grow));
    masks.push_back(mask);
  }
}

coordinate_type_fp MaskIndex::clearance(const CoatingShape& mask) const {
  return mask.masking_clearance.value_or(settings.masking_clearance) + settings.coating_width / 2;
}

bool MaskIndex::has_masks() const {
  return settings.enable_masking && !masks.empty();
}

bool MaskIndex::is_point_in_mask_area(const point_type_fp& point) const {
  for (const auto& mask : masks) {
    if (region_contains(mask, point)) {
      return true;
    }
  }
  return false;
}

intervals_type_fp MaskIndex::forbidden_intervals(ScanAxis::ScanAxis axis, coordinate_type_fp coordinate) const {
  const bool horizontal = axis == ScanAxis::HORIZONTAL;
  intervals_type_fp forbidden;
  for (const auto& mask : masks) {
    if (mask.round) {
      const coordinate_type_fp center_cross = horizontal ? mask.center.x() : mask.center.y();
      const coordinate_type_fp center_main = horizontal ? mask.center.y() : mask.center.x();
      const coordinate_type_fp delta_main = std::abs(coordinate - center_main);
      if (delta_main <= mask.radius) {
        const coordinate_type_fp delta_cross = std::sqrt(mask.radius * mask.radius - delta_main * delta_main);
        forbidden.push_back(interval_type_fp(center_cross - delta_cross, center_cross + delta_cross));
      }
    } else {
      const point_type_fp& lo = mask.box.min_corner();
      const point_type_fp& hi = mask.box.max_corner();
      const coordinate_type_fp min_main = horizontal ? lo.y() : lo.x();
      const coordinate_type_fp max_main = horizontal ? hi.y() : hi.x();
      if (coordinate >= min_main && coordinate <= max_main) {
        forbidden.push_back(horizontal ? interval_type_fp(lo.x(), hi.x())
                                       : interval_type_fp(lo.y(), hi.y()));
      }
    }
  }
  return merge(forbidden, true);
}

intervals_type_fp MaskIndex::allowed_intervals(ScanAxis::ScanAxis axis, coordinate_type_fp coordinate,
                                               coordinate_type_fp lo, coordinate_type_fp hi) const {
  intervals_type_fp allowed;
  auto keep = [&](coordinate_type_fp start, coordinate_type_fp end) {
    if (end - start > scan_tolerance) {
      allowed.push_back(interval_type_fp(start, end));
    }
  };
  coordinate_type_fp cursor = lo;
  for (const auto& forbidden : forbidden_intervals(axis, coordinate)) {
    if (forbidden.second - forbidden.first <= 0) {
      continue;
    }
    if (cursor < forbidden.first) {
      keep(cursor, min(forbidden.first, hi));
    }
    cursor = max(cursor, forbidden.second);
    if (cursor >= hi) {
      break;
    }
  }
  keep(cursor, hi);
  return allowed;
}

segments_type_fp MaskIndex::clip_segment(const segment_type_fp& segment) const {
  intervals_type_fp unsafe;
  for (const auto& mask : masks) {
    auto t = overlap(segment, mask);
    if (t) {
      unsafe.push_back(*t);
    }
  }
  if (unsafe.empty()) {
    return {segment};
  }

  const point_type_fp direction = segment.second - segment.first;
  auto at = [&](coordinate_type_fp t) { return segment.first + direction * t; };
  segments_type_fp safe;
  coordinate_type_fp last_t = 0;
  for (const auto& interval : merge(unsafe, false)) {
    if (interval.first > last_t) {
      const segment_type_fp piece(at(last_t), at(interval.first));
      if (bg::distance(piece.first, piece.second) > scan_tolerance) {
        safe.push_back(piece);
      }
    }
    last_t = max(last_t, interval.second);
  }
  if (last_t < 1) {
    const segment_type_fp piece(at(last_t), segment.second);
    if (bg::distance(piece.first, piece.second) > scan_tolerance) {
      safe.push_back(piece);
    }
  }
  return safe;
}

bool MaskIndex::is_shape_inside_mask(const CoatingShape& shape) const {
  const point_type_fp pivot = geometry_transform::rotation_center(shape);
  if (const Circle* circle = boost::get<Circle>(&shape.boundary)) {
    const point_type_fp center = geometry_transform::rotate(
        point_type_fp(circle->x, circle->y), pivot, shape.rotation);
    for (const auto& mask : masks) {
      if (mask.round) {
        if (bg::distance(center, mask.center) + circle->radius <= mask.radius) {
          return true;
        }
      } else {
        const box_type_fp circle_box(
            point_type_fp(center.x() - circle->radius, center.y() - circle->radius),
            point_type_fp(center.x() + circle->radius, center.y() + circle->radius));
        if (bg::covered_by(circle_box, mask.box)) {
          return true;
        }
      }
    }
    return false;
  }

  vector<point_type_fp> corners;
  if (const Polyline* polyline = boost::get<Polyline>(&shape.boundary)) {
    for (const auto& point : polyline->points) {
      corners.push_back(point_type_fp(polyline->x + point.x(), polyline->y + point.y()));
    }
  } else {
    const Rectangle& r = boost::get<Rectangle>(shape.boundary);
    corners = {point_type_fp(r.x, r.y), point_type_fp(r.x + r.width, r.y),
               point_type_fp(r.x + r.width, r.y + r.height), point_type_fp(r.x, r.y + r.height)};
  }
  if (corners.empty()) {
    return false;
  }
  for (auto& corner : corners) {
    corner = geometry_transform::rotate(corner, pivot, shape.rotation);
  }
  for (const auto& mask : masks) {
    if (std::all_of(corners.cbegin(), corners.cend(),
                    [&](const point_type_fp& corner) { return region_contains(mask, corner); })) {
      return true;
    }
  }
  return false;
}

segments_type_fp MaskIndex::apply_masking(const segments_type_fp& segments, const CoatingShape& shape) const {
  if (!has_masks()) {
    return segments;
  }
  if (is_shape_inside_mask(shape)) {
    return {};
  }
  segments_type_fp masked;
  for (const auto& segment : segments) {
    const auto pieces = clip_segment(segment);
    masked.insert(masked.end(), pieces.cbegin(), pieces.cend());
  }
  return masked;
}

vector<MaskRegion> MaskIndex::find_intersecting_masks(const point_type_fp& start, const point_type_fp& end) const {
  vector<MaskRegion> crossed;
  if (!has_masks()) {
    return crossed;
  }
  const segment_type_fp travel(start, end);
  for (const auto& mask : masks) {
    if (overlap(travel, mask)) {
      crossed.push_back(mask);
    }
  }
  return crossed;
}

vector<point_type_fp> MaskIndex::detour(const point_type_fp& start, const point_type_fp& end,
                                        const MaskRegion& mask) const {
  const point_type_fp& lo = mask.box.min_corner();
  const point_type_fp& hi = mask.box.max_corner();
  const vector<point_type_fp> corners{
    point_type_fp(lo.x(), lo.y()),
    point_type_fp(hi.x(), lo.y()),
    point_type_fp(hi.x(), hi.y()),
    point_type_fp(lo.x(), hi.y()),
  };
  auto closest = [&](const point_type_fp& p) {
    size_t best = 0;
    for (size_t i = 1; i < corners.size(); i++) {
      if (bg::distance(p, corners[i]) < bg::distance(p, corners[best])) {
        best = i;
      }
    }
    return best;
  };
  const size_t first = closest(start);
  const size_t last = closest(end);

  vector<point_type_fp> forward;
  for (size_t i = first; i != last; i = (i + 1) % 4) {
    forward.push_back(corners[i]);
  }
  forward.push_back(corners[last]);
  vector<point_type_fp> backward;
  for (size_t i = first; i != last; i = (i + 3) % 4) {
    backward.push_back(corners[i]);
  }
  backward.push_back(corners[last]);

  if (path_length(start, forward, end) < path_length(start, backward, end)) {
    return forward;
  } else {
    return backward;
  }
}

travel_move MaskIndex::plan_travel(const point_type_fp& start, const point_type_fp& end,
                                   MaskAvoidance::MaskAvoidance strategy) const {
  const auto crossed = find_intersecting_masks(start, end);
  if (crossed.empty()) {
    return travel_move{{end}, false};
  }
  if (strategy == MaskAvoidance::ROUTE_AROUND && crossed.size() == 1 && !crossed.front().round) {
    auto waypoints = detour(start, end, crossed.front());
    waypoints.push_back(end);
    return travel_move{waypoints, false};
  }
  return travel_move{{end}, true};
}
