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


#ifndef SEGMENT_EXPORTER_HPP
#define SEGMENT_EXPORTER_HPP

#include <istream>
#include <iterator>
#include <ostream>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/core/noncopyable.hpp>
#include <boost/program_options.hpp>

#include "mask_index.hpp"
#include "toolpath_calculator.hpp"

namespace OutputFormat {
enum OutputFormat {
  SEGMENTS,
  WKT
};

inline std::istream& operator>>(std::istream& in, OutputFormat& format)
{
  std::string token(std::istreambuf_iterator<char>(in), {});
  if (boost::iequals(token, "segments")) {
    format = SEGMENTS;
  } else if (boost::iequals(token, "wkt")) {
    format = WKT;
  } else {
    throw boost::program_options::invalid_option_value(token);
  }
  return in;
}

inline std::ostream& operator<<(std::ostream& out, const OutputFormat& format)
{
  switch (format) {
    case SEGMENTS:
      out << "segments";
      break;
    case WKT:
      out << "wkt";
      break;
  }
  return out;
}
}; // namespace OutputFormat

/******************************************************************************/
/*
 Writes the toolpaths of all the shapes, either as a plain listing of
 segment coordinates or as one WKT MULTILINESTRING per shape.
 */
/******************************************************************************/
class SegmentExporter : private boost::noncopyable {
 public:
  SegmentExporter(const std::vector<shape_toolpath>& toolpaths);
  void add_header(const std::string& line);
  // With a mask index, the segment listing also shows the travel moves
  // between segments that don't join up.
  void set_travel(const MaskIndex* masks, MaskAvoidance::MaskAvoidance avoidance);
  void export_all(std::ostream& out, OutputFormat::OutputFormat format) const;

 protected:
  void export_segments(std::ostream& out, const shape_toolpath& toolpath) const;
  void export_travel(std::ostream& out, const point_type_fp& from, const point_type_fp& to) const;
  void export_wkt(std::ostream& out, const shape_toolpath& toolpath) const;

  const std::vector<shape_toolpath>& toolpaths;
  std::vector<std::string> header;
  const MaskIndex* masks;
  MaskAvoidance::MaskAvoidance avoidance;
};

#endif // SEGMENT_EXPORTER_HPP
