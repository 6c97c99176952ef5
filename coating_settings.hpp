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


#ifndef COATING_SETTINGS_HPP
#define COATING_SETTINGS_HPP

#include "geometry.hpp"
#include "coating_types.hpp"
#include "shape.hpp"

// Process-wide defaults.  Immutable while a computation runs.
struct CoatingSettings {
  coordinate_type_fp line_spacing = 10;
  coordinate_type_fp coating_width = 10;
  FillPattern::FillPattern fill_pattern = FillPattern::AUTO;
  bool enable_masking = true;
  coordinate_type_fp masking_clearance = 0;
  MaskAvoidance::MaskAvoidance mask_avoidance = MaskAvoidance::ROUTE_AROUND;
  // Scan iterations between two checkpoints.
  unsigned int yield_interval = 50;
};

// The parameters of one shape once the settings filled in the gaps.
struct EffectiveParameters {
  coordinate_type_fp line_spacing;
  coordinate_type_fp coating_width;
  FillPattern::FillPattern fill_pattern;
  unsigned int outline_passes;
  OutlineStartPoint::OutlineStartPoint outline_start_point;
};

EffectiveParameters resolve_parameters(const CoatingShape& shape, const CoatingSettings& settings);

#endif // COATING_SETTINGS_HPP
