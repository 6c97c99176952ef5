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


#ifndef SHAPE_READER_HPP
#define SHAPE_READER_HPP

#include <istream>
#include <string>
#include <vector>
#include <boost/optional.hpp>

#include "shape.hpp"

class shape_parse_exception : public std::exception {
 public:
  shape_parse_exception(const std::string& what, unsigned int line) : line(line) {
    what_string = "Line " + std::to_string(line) + ": " + what;
  }
  virtual const char* what() const throw() {
    return what_string.c_str();
  }
  unsigned int line_number() const {
    return line;
  }

 private:
  std::string what_string;
  unsigned int line;
};

// Shape files hold one shape per line:
//
//   <kind> key=value key=value ...
//
// where kind is rectangle, image, circle or polyline.  Everything after
// a '#' is a comment.  Lengths take unit suffixes and default to
// millimeters, rotations default to degrees.
namespace shape_reader {

// Parse a single line.  Blank and comment-only lines give nothing.
boost::optional<CoatingShape> parse_shape(const std::string& line, unsigned int line_number);

std::vector<CoatingShape> read_shapes(std::istream& in);
std::vector<CoatingShape> read_shapes(const std::string& filename);

} // namespace shape_reader

#endif // SHAPE_READER_HPP
