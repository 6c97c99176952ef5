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


#ifndef GEOMETRY_TRANSFORM_HPP
#define GEOMETRY_TRANSFORM_HPP

#include "geometry.hpp"
#include "shape.hpp"

namespace geometry_transform {

// Rotate point about center by angle degrees, counter-clockwise in a
// y-up frame.  An angle of 0 returns the point unchanged.
point_type_fp rotate(const point_type_fp& point, const point_type_fp& center, double angle);

// Rotate both ends of every segment.
segments_type_fp rotate(const segments_type_fp& segments, const point_type_fp& center, double angle);

// The geometric center minus the pivot offset of the shape.
point_type_fp rotation_center(const CoatingShape& shape);

// Bring a world point into the shape frame by undoing the shape's rotation.
point_type_fp to_local(const point_type_fp& point, const CoatingShape& shape);

// Bring local segments into the world frame.
segments_type_fp to_world(const segments_type_fp& segments, const CoatingShape& shape);

} // namespace geometry_transform

#endif // GEOMETRY_TRANSFORM_HPP
