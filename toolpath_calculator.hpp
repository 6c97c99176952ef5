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


#ifndef TOOLPATH_CALCULATOR_HPP
#define TOOLPATH_CALCULATOR_HPP

#include <string>
#include <vector>
#include <boost/optional.hpp>

#include "geometry.hpp"
#include "shape.hpp"
#include "coating_settings.hpp"
#include "mask_index.hpp"
#include "checkpoint.hpp"

struct calculation_options {
  // Subtract the shape's (x, y) from every point.
  bool relative = false;
  bool include_transform = false;
};

// Where the shape sits, for callers that draw relative segments.
struct shape_transform {
  coordinate_type_fp x;
  coordinate_type_fp y;
  double rotation;
  double scale_x;
  double scale_y;
};

struct toolpath_result {
  segments_type_fp segments;
  boost::optional<shape_transform> transform;
};

struct shape_toolpath {
  std::string name;
  CoatingType::CoatingType coating_type;
  toolpath_result result;
};

class ToolpathCalculator {
 public:
  // The masks are taken out of shapes once, here.
  ToolpathCalculator(const CoatingSettings& settings, const std::vector<CoatingShape>& shapes);

  // The ordered motion segments of one shape.  Masking and skipped
  // shapes have none.  The callback is called every
  // settings.yield_interval scan iterations and cancels the
  // computation by returning false.
  toolpath_result calculate(const CoatingShape& shape,
                            const calculation_options& options = calculation_options(),
                            Checkpoint::callback_type callback = Checkpoint::callback_type()) const;

  // Every fill and outline shape that isn't skipped, in input order.
  std::vector<shape_toolpath> calculate_all(const std::vector<CoatingShape>& shapes,
                                            const calculation_options& options = calculation_options(),
                                            Checkpoint::callback_type callback = Checkpoint::callback_type()) const;

  const MaskIndex& mask_index() const { return masks; }

 private:
  const CoatingSettings settings;
  const MaskIndex masks;
};

#endif // TOOLPATH_CALCULATOR_HPP
