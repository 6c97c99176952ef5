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


#include "toolpath_calculator.hpp"

#include <iostream>

#include "fill_planner.hpp"
#include "geometry_transform.hpp"
#include "outline_planner.hpp"

using std::cout;
using std::endl;
using std::flush;
using std::vector;

ToolpathCalculator::ToolpathCalculator(const CoatingSettings& settings, const vector<CoatingShape>& shapes)
    : settings(settings), masks(shapes, settings) {}

toolpath_result ToolpathCalculator::calculate(const CoatingShape& shape,
                                              const calculation_options& options,
                                              Checkpoint::callback_type callback) const {
  toolpath_result result;
  if (!shape.skip_coating) {
    const EffectiveParameters parameters = resolve_parameters(shape, settings);
    Checkpoint checkpoint(callback, settings.yield_interval);
    switch (shape.coating_type) {
      case CoatingType::FILL:
        result.segments = fill_planner::plan_fill(shape, parameters, masks, settings.mask_avoidance, checkpoint);
        break;
      case CoatingType::OUTLINE:
        result.segments = geometry_transform::to_world(
            outline_planner::plan_outline(shape, parameters), shape);
        break;
      case CoatingType::MASKING:
        break;
    }
  }

  const point_type_fp anchor = origin(shape.boundary);
  if (options.relative) {
    for (auto& segment : result.segments) {
      segment.first = point_type_fp(segment.first.x() - anchor.x(), segment.first.y() - anchor.y());
      segment.second = point_type_fp(segment.second.x() - anchor.x(), segment.second.y() - anchor.y());
    }
  }
  if (options.include_transform) {
    result.transform = shape_transform{anchor.x(), anchor.y(), shape.rotation, shape.scale_x, shape.scale_y};
  }
  return result;
}

vector<shape_toolpath> ToolpathCalculator::calculate_all(const vector<CoatingShape>& shapes,
                                                         const calculation_options& options,
                                                         Checkpoint::callback_type callback) const {
  vector<shape_toolpath> toolpaths;
  for (const auto& shape : shapes) {
    if (shape.skip_coating || shape.coating_type == CoatingType::MASKING) {
      continue;
    }
    cout << "Calculating " << shape.coating_type << " toolpath for \"" << shape.name << "\"... " << flush;
    shape_toolpath toolpath{shape.name, shape.coating_type, calculate(shape, options, callback)};
    cout << "DONE (" << toolpath.result.segments.size() << " segments)." << endl;
    toolpaths.push_back(toolpath);
  }
  return toolpaths;
}
