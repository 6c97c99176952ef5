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


#ifndef MASK_INDEX_HPP
#define MASK_INDEX_HPP

#include <string>
#include <utility>
#include <vector>
#include <boost/optional.hpp>

#include "geometry.hpp"
#include "shape.hpp"
#include "coating_settings.hpp"

namespace ScanAxis {
enum ScanAxis {
  HORIZONTAL,  // scan lines at constant y, intervals along x
  VERTICAL     // scan lines at constant x, intervals along y
};
}; // namespace ScanAxis

// [start, end] along one axis, or along a segment's parameter t.
typedef std::pair<coordinate_type_fp, coordinate_type_fp> interval_type_fp;
typedef std::vector<interval_type_fp> intervals_type_fp;

// The area that coating must stay out of, already grown by the
// clearance.  Round masks use center and radius, every other mask uses
// box.  Mask rotation is not taken into account.
struct MaskRegion {
  std::string name;
  bool round;
  point_type_fp center;
  coordinate_type_fp radius;
  box_type_fp box;
};

// A travel from one point to another.  The waypoints end with the
// destination.  When lift is set the travel happens at safe height.
struct travel_move {
  std::vector<point_type_fp> waypoints;
  bool lift;
};

// All the masking shapes, read-only once built.
class MaskIndex {
 public:
  MaskIndex(const std::vector<CoatingShape>& shapes, const CoatingSettings& settings);

  bool has_masks() const;
  const std::vector<MaskRegion>& regions() const { return masks; }

  bool is_point_in_mask_area(const point_type_fp& point) const;

  // Sorted and merged intervals that a scan line at coordinate must skip.
  intervals_type_fp forbidden_intervals(ScanAxis::ScanAxis axis, coordinate_type_fp coordinate) const;
  // [lo, hi] without the forbidden intervals.  A mask that only touches
  // the line cuts nothing.  Pieces up to scan_tolerance long are dropped.
  intervals_type_fp allowed_intervals(ScanAxis::ScanAxis axis, coordinate_type_fp coordinate,
                                      coordinate_type_fp lo, coordinate_type_fp hi) const;

  // The parts of a world segment outside of every mask, in the
  // segment's direction.  Pieces up to scan_tolerance long are dropped.
  segments_type_fp clip_segment(const segment_type_fp& segment) const;

  // Clip every segment, or drop them all if the shape is completely
  // inside one mask.
  segments_type_fp apply_masking(const segments_type_fp& segments, const CoatingShape& shape) const;
  bool is_shape_inside_mask(const CoatingShape& shape) const;

  std::vector<MaskRegion> find_intersecting_masks(const point_type_fp& start, const point_type_fp& end) const;

  travel_move plan_travel(const point_type_fp& start, const point_type_fp& end,
                          MaskAvoidance::MaskAvoidance strategy) const;

 private:
  coordinate_type_fp clearance(const CoatingShape& mask) const;
  // Corners of the grown box, around it in order, taking the shorter way.
  std::vector<point_type_fp> detour(const point_type_fp& start, const point_type_fp& end,
                                    const MaskRegion& mask) const;

  const CoatingSettings settings;
  std::vector<MaskRegion> masks;
};

#endif // MASK_INDEX_HPP
