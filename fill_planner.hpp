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


#ifndef FILL_PLANNER_HPP
#define FILL_PLANNER_HPP

#include "geometry.hpp"
#include "shape.hpp"
#include "coating_settings.hpp"
#include "mask_index.hpp"
#include "checkpoint.hpp"

namespace fill_planner {

// Pick HORIZONTAL or VERTICAL for an auto fill.  Without masks the
// scan lines run along the longer side.  When more than 40% of a 5x5
// sample grid over the bounds is both in the shape and in a mask, the
// lines run along the shorter side instead.
FillPattern::FillPattern choose_direction(const CoatingShape& shape, const box_type_fp& bounds,
                                          const MaskIndex& masks);

// Snake scan lines in the shape frame, without any masking.  Even lines
// run in the increasing direction, odd lines are reversed.
segments_type_fp scan_lines(const CoatingShape& shape, const EffectiveParameters& parameters,
                            FillPattern::FillPattern direction, Checkpoint& checkpoint);

// Same, but every line is cut down to the intervals that the masks
// allow.  Only valid for unrotated shapes, where the shape frame is the
// world frame.
segments_type_fp scan_lines_around_masks(const CoatingShape& shape, const EffectiveParameters& parameters,
                                         FillPattern::FillPattern direction, const MaskIndex& masks,
                                         Checkpoint& checkpoint);

// Shrinking rings in the shape frame.  Nothing if line_spacing <= 0.
segments_type_fp concentric_rings(const CoatingShape& shape, const EffectiveParameters& parameters,
                                  Checkpoint& checkpoint);

// The complete fill of a shape, in world coordinates, with the masks
// avoided the way the avoidance setting says.
segments_type_fp plan_fill(const CoatingShape& shape, const EffectiveParameters& parameters,
                           const MaskIndex& masks, MaskAvoidance::MaskAvoidance avoidance,
                           Checkpoint& checkpoint);

} // namespace fill_planner

#endif // FILL_PLANNER_HPP
