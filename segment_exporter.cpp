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


#include "segment_exporter.hpp"

#include <boost/format.hpp>

#include "bg_operators.hpp"

using std::endl;
using std::string;

SegmentExporter::SegmentExporter(const std::vector<shape_toolpath>& toolpaths)
    : toolpaths(toolpaths), masks(nullptr), avoidance(MaskAvoidance::LIFT) {}

void SegmentExporter::add_header(const string& line) {
  header.push_back(line);
}

void SegmentExporter::set_travel(const MaskIndex* masks, MaskAvoidance::MaskAvoidance avoidance) {
  this->masks = masks;
  this->avoidance = avoidance;
}

void SegmentExporter::export_all(std::ostream& out, OutputFormat::OutputFormat format) const {
  for (const auto& line : header) {
    out << "# " << line << endl;
  }
  for (const auto& toolpath : toolpaths) {
    switch (format) {
      case OutputFormat::SEGMENTS:
        export_segments(out, toolpath);
        break;
      case OutputFormat::WKT:
        export_wkt(out, toolpath);
        break;
    }
  }
}

void SegmentExporter::export_segments(std::ostream& out, const shape_toolpath& toolpath) const {
  out << "# " << toolpath.name << " " << toolpath.coating_type << endl;
  if (toolpath.result.transform) {
    const shape_transform& t = *toolpath.result.transform;
    out << boost::format("# transform x=%.3f y=%.3f rotation=%.3f scale-x=%.3f scale-y=%.3f")
        % t.x % t.y % t.rotation % t.scale_x % t.scale_y << endl;
  }
  const segments_type_fp& segments = toolpath.result.segments;
  for (size_t i = 0; i < segments.size(); i++) {
    if (i > 0 && !near(segments[i-1].second, segments[i].first)) {
      export_travel(out, segments[i-1].second, segments[i].first);
    }
    out << boost::format("%.3f %.3f %.3f %.3f")
        % segments[i].first.x() % segments[i].first.y()
        % segments[i].second.x() % segments[i].second.y() << endl;
  }
  out << endl;
}

void SegmentExporter::export_travel(std::ostream& out, const point_type_fp& from, const point_type_fp& to) const {
  if (masks == nullptr) {
    return;
  }
  const travel_move move = masks->plan_travel(from, to, avoidance);
  out << (move.lift ? "# travel lift" : "# travel");
  for (const auto& waypoint : move.waypoints) {
    out << boost::format(" %.3f %.3f") % waypoint.x() % waypoint.y();
  }
  out << endl;
}

void SegmentExporter::export_wkt(std::ostream& out, const shape_toolpath& toolpath) const {
  multi_linestring_type_fp lines;
  for (const auto& segment : toolpath.result.segments) {
    linestring_type_fp line;
    line.push_back(segment.first);
    line.push_back(segment.second);
    lines.push_back(line);
  }
  out << bg::wkt(lines) << endl;
}
