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


#include "coating_settings.hpp"

EffectiveParameters resolve_parameters(const CoatingShape& shape, const CoatingSettings& settings) {
  EffectiveParameters parameters;
  parameters.line_spacing = shape.line_spacing.value_or(settings.line_spacing);
  parameters.coating_width = shape.coating_width.value_or(settings.coating_width);
  parameters.fill_pattern = shape.fill_pattern.value_or(settings.fill_pattern);
  parameters.outline_passes = shape.outline_passes > 0 ? shape.outline_passes : 1;
  parameters.outline_start_point = shape.outline_start_point;
  return parameters;
}
