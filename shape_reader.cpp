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


#include "shape_reader.hpp"

#include <fstream>
#include <sstream>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

#include "errors.hpp"
#include "units.hpp"

using std::string;
using std::vector;

namespace shape_reader {

namespace {

constexpr unsigned int hash(const char *s, int off = 0) {
    return !s[off] ? 5381 : (hash(s, off+1)*33) ^ s[off];
}

// Everything that a line may set, before the kind decides which
// boundary to build.
struct shape_fields {
  coordinate_type_fp x = 0;
  coordinate_type_fp y = 0;
  coordinate_type_fp width = 0;
  coordinate_type_fp height = 0;
  coordinate_type_fp radius = 0;
  vector<point_type_fp> points;
};

coordinate_type_fp parse_length(const string& value) {
  return parse_unit<Length>(value).asMillimeter(1);
}

bool parse_bool(const string& value) {
  if (boost::iequals(value, "true") || boost::iequals(value, "yes") || value == "1") {
    return true;
  }
  if (boost::iequals(value, "false") || boost::iequals(value, "no") || value == "0") {
    return false;
  }
  throw boost::program_options::invalid_option_value(value);
}

template <typename enum_t>
enum_t parse_enum(const string& value) {
  std::istringstream in(value);
  enum_t result;
  in >> result;
  return result;
}

vector<point_type_fp> parse_points(const string& value) {
  vector<string> numbers;
  boost::split(numbers, value, boost::is_any_of(","));
  if (numbers.size() % 2 != 0) {
    throw boost::program_options::invalid_option_value("odd number of coordinates in " + value);
  }
  vector<point_type_fp> points;
  for (size_t i = 0; i < numbers.size(); i += 2) {
    points.push_back(point_type_fp(parse_length(numbers[i]), parse_length(numbers[i + 1])));
  }
  return points;
}

// Returns false if the key isn't known.
bool update(CoatingShape& shape, shape_fields& fields, const string& key, const string& value) {
  switch (hash(key.c_str())) {
    case hash("name"):
      shape.name = value;
      return true;
    case hash("x"):
      fields.x = parse_length(value);
      return true;
    case hash("y"):
      fields.y = parse_length(value);
      return true;
    case hash("width"):
      fields.width = parse_length(value);
      return true;
    case hash("height"):
      fields.height = parse_length(value);
      return true;
    case hash("radius"):
      fields.radius = parse_length(value);
      return true;
    case hash("points"):
      fields.points = parse_points(value);
      return true;
    case hash("coating"):
      shape.coating_type = parse_enum<CoatingType::CoatingType>(value);
      return true;
    case hash("fill-pattern"):
      shape.fill_pattern = FillPattern::from_string(value);
      return true;
    case hash("line-spacing"):
      shape.line_spacing = parse_length(value);
      return true;
    case hash("coating-width"):
      shape.coating_width = parse_length(value);
      return true;
    case hash("outline-passes"):
      shape.outline_passes = boost::lexical_cast<unsigned int>(value);
      return true;
    case hash("outline-start"):
      shape.outline_start_point = parse_enum<OutlineStartPoint::OutlineStartPoint>(value);
      return true;
    case hash("rotation"):
      shape.rotation = parse_unit<Angle>(value).asDegree(1);
      return true;
    case hash("scale-x"):
      shape.scale_x = boost::lexical_cast<double>(value);
      return true;
    case hash("scale-y"):
      shape.scale_y = boost::lexical_cast<double>(value);
      return true;
    case hash("offset-x"):
      shape.offset_x = parse_length(value);
      return true;
    case hash("offset-y"):
      shape.offset_y = parse_length(value);
      return true;
    case hash("skip"):
      shape.skip_coating = parse_bool(value);
      return true;
    case hash("masking-clearance"):
      shape.masking_clearance = parse_length(value);
      return true;
    default:
      return false;
  }
}

Boundary make_boundary(const string& kind, const shape_fields& fields) {
  if (kind == "rectangle" || kind == "image") {
    return Rectangle{fields.x, fields.y, fields.width, fields.height};
  } else if (kind == "circle") {
    return Circle{fields.x, fields.y, fields.radius};
  } else if (kind == "polyline") {
    return Polyline{fields.x, fields.y, fields.points};
  }
  throw unsupported_shape_kind(kind);
}

} // namespace

boost::optional<CoatingShape> parse_shape(const string& line, unsigned int line_number) {
  string text = line.substr(0, line.find('#'));
  boost::trim(text);
  if (text.empty()) {
    return boost::none;
  }

  vector<string> words;
  boost::split(words, text, boost::is_any_of(" \t"), boost::token_compress_on);
  const string kind = boost::to_lower_copy(words.front());

  CoatingShape shape;
  shape.name = kind + " " + std::to_string(line_number);
  shape_fields fields;
  for (size_t i = 1; i < words.size(); i++) {
    const size_t equals = words[i].find('=');
    if (equals == string::npos) {
      throw shape_parse_exception("Expected key=value, got \"" + words[i] + "\"", line_number);
    }
    const string key = words[i].substr(0, equals);
    const string value = words[i].substr(equals + 1);
    try {
      if (!update(shape, fields, key, value)) {
        throw shape_parse_exception("Unknown key \"" + key + "\"", line_number);
      }
    } catch (const boost::program_options::error& e) {
      throw shape_parse_exception("Bad value for \"" + key + "\": " + e.what(), line_number);
    } catch (const boost::bad_lexical_cast&) {
      throw shape_parse_exception("Bad value for \"" + key + "\": " + value, line_number);
    }
  }
  shape.boundary = make_boundary(kind, fields);
  return shape;
}

vector<CoatingShape> read_shapes(std::istream& in) {
  vector<CoatingShape> shapes;
  string line;
  unsigned int line_number = 0;
  while (std::getline(in, line)) {
    line_number++;
    auto shape = parse_shape(line, line_number);
    if (shape) {
      shapes.push_back(*shape);
    }
  }
  return shapes;
}

vector<CoatingShape> read_shapes(const string& filename) {
  std::ifstream in(filename.c_str());
  if (!in) {
    throw shape_parse_exception("Can't open shape file \"" + filename + "\"", 0);
  }
  return read_shapes(in);
}

} // namespace shape_reader
