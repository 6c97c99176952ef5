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

#ifndef COATING_TYPES_HPP
#define COATING_TYPES_HPP

#include <istream>
#include <iterator>
#include <ostream>
#include <string>
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>

#include "errors.hpp"

namespace FillPattern {
enum FillPattern {
  HORIZONTAL,
  VERTICAL,
  AUTO,
  CONCENTRIC
};

inline FillPattern from_string(const std::string& token) {
  if (boost::iequals(token, "horizontal")) {
    return HORIZONTAL;
  } else if (boost::iequals(token, "vertical")) {
    return VERTICAL;
  } else if (boost::iequals(token, "auto")) {
    return AUTO;
  } else if (boost::iequals(token, "concentric")) {
    return CONCENTRIC;
  }
  throw unsupported_pattern(token);
}

inline std::istream& operator>>(std::istream& in, FillPattern& fill_pattern)
{
  std::string token(std::istreambuf_iterator<char>(in), {});
  try {
    fill_pattern = from_string(token);
  } catch (const unsupported_pattern&) {
    throw boost::program_options::invalid_option_value(token);
  }
  return in;
}

inline std::ostream& operator<<(std::ostream& out, const FillPattern& fill_pattern)
{
  switch (fill_pattern) {
    case HORIZONTAL:
      out << "horizontal";
      break;
    case VERTICAL:
      out << "vertical";
      break;
    case AUTO:
      out << "auto";
      break;
    case CONCENTRIC:
      out << "concentric";
      break;
  }
  return out;
}
}; // namespace FillPattern

namespace CoatingType {
enum CoatingType {
  FILL,
  OUTLINE,
  MASKING
};

inline std::istream& operator>>(std::istream& in, CoatingType& coating_type)
{
  std::string token(std::istreambuf_iterator<char>(in), {});
  if (boost::iequals(token, "fill")) {
    coating_type = FILL;
  } else if (boost::iequals(token, "outline")) {
    coating_type = OUTLINE;
  } else if (boost::iequals(token, "masking")) {
    coating_type = MASKING;
  } else {
    throw boost::program_options::invalid_option_value(token);
  }
  return in;
}

inline std::ostream& operator<<(std::ostream& out, const CoatingType& coating_type)
{
  switch (coating_type) {
    case FILL:
      out << "fill";
      break;
    case OUTLINE:
      out << "outline";
      break;
    case MASKING:
      out << "masking";
      break;
  }
  return out;
}
}; // namespace CoatingType

namespace OutlineStartPoint {
enum OutlineStartPoint {
  OUTSIDE,
  CENTER,
  INSIDE
};

inline std::istream& operator>>(std::istream& in, OutlineStartPoint& start_point)
{
  std::string token(std::istreambuf_iterator<char>(in), {});
  if (boost::iequals(token, "outside")) {
    start_point = OUTSIDE;
  } else if (boost::iequals(token, "center")) {
    start_point = CENTER;
  } else if (boost::iequals(token, "inside")) {
    start_point = INSIDE;
  } else {
    throw boost::program_options::invalid_option_value(token);
  }
  return in;
}

inline std::ostream& operator<<(std::ostream& out, const OutlineStartPoint& start_point)
{
  switch (start_point) {
    case OUTSIDE:
      out << "outside";
      break;
    case CENTER:
      out << "center";
      break;
    case INSIDE:
      out << "inside";
      break;
  }
  return out;
}
}; // namespace OutlineStartPoint

// How a fill avoids the masking shapes it crosses.
namespace MaskAvoidance {
enum MaskAvoidance {
  LIFT,         // clip the lines and travel over the masks at safe height
  ROUTE_AROUND  // split scan lines into allowed intervals, detour around masks
};

inline std::istream& operator>>(std::istream& in, MaskAvoidance& avoidance)
{
  std::string token(std::istreambuf_iterator<char>(in), {});
  if (boost::iequals(token, "lift")) {
    avoidance = LIFT;
  } else if (boost::iequals(token, "route-around")) {
    avoidance = ROUTE_AROUND;
  } else {
    throw boost::program_options::invalid_option_value(token);
  }
  return in;
}

inline std::ostream& operator<<(std::ostream& out, const MaskAvoidance& avoidance)
{
  switch (avoidance) {
    case LIFT:
      out << "lift";
      break;
    case ROUTE_AROUND:
      out << "route-around";
      break;
  }
  return out;
}
}; // namespace MaskAvoidance

#endif // COATING_TYPES_HPP
