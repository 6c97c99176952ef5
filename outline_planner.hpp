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


#ifndef OUTLINE_PLANNER_HPP
#define OUTLINE_PLANNER_HPP

#include "geometry.hpp"
#include "shape.hpp"
#include "coating_settings.hpp"

namespace outline_planner {

// Number of chords used to draw a circle of the given radius.
unsigned int chord_count(coordinate_type_fp radius);

// A closed polygon of chords around center, starting at angle 0.
segments_type_fp circle_segments(const point_type_fp& center, coordinate_type_fp radius,
                                 unsigned int chords);

// The four sides of a box, clockwise from the top-left corner in a
// y-down frame: top, right, bottom, left.
segments_type_fp box_segments(coordinate_type_fp x, coordinate_type_fp y,
                              coordinate_type_fp width, coordinate_type_fp height);

// Trace the boundary of the shape once per outline pass, in the shape
// frame.  The passes are line_spacing apart and the start point policy
// decides whether the first one is outside, on or inside the boundary.
segments_type_fp plan_outline(const CoatingShape& shape, const EffectiveParameters& parameters);

} // namespace outline_planner

#endif // OUTLINE_PLANNER_HPP
