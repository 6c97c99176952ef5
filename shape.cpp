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


#include "shape.hpp"

#include <boost/geometry/geometries/polygon.hpp>

using std::string;

namespace {

class origin_visitor : public boost::static_visitor<point_type_fp> {
 public:
  point_type_fp operator()(const Rectangle& r) const { return point_type_fp(r.x, r.y); }
  point_type_fp operator()(const Circle& c) const { return point_type_fp(c.x, c.y); }
  point_type_fp operator()(const Polyline& p) const { return point_type_fp(p.x, p.y); }
};

class bounds_visitor : public boost::static_visitor<boost::optional<box_type_fp>> {
 public:
  boost::optional<box_type_fp> operator()(const Rectangle& r) const {
    return box_type_fp(point_type_fp(r.x, r.y),
                       point_type_fp(r.x + r.width, r.y + r.height));
  }
  boost::optional<box_type_fp> operator()(const Circle& c) const {
    return box_type_fp(point_type_fp(c.x - c.radius, c.y - c.radius),
                       point_type_fp(c.x + c.radius, c.y + c.radius));
  }
  boost::optional<box_type_fp> operator()(const Polyline& p) const {
    if (p.points.empty()) {
      return boost::none;
    }
    linestring_type_fp absolute;
    for (const auto& point : p.points) {
      absolute.push_back(point_type_fp(p.x + point.x(), p.y + point.y()));
    }
    return bg::return_envelope<box_type_fp>(absolute);
  }
};

class center_visitor : public boost::static_visitor<point_type_fp> {
 public:
  point_type_fp operator()(const Rectangle& r) const {
    return point_type_fp(r.x + r.width / 2, r.y + r.height / 2);
  }
  point_type_fp operator()(const Circle& c) const { return point_type_fp(c.x, c.y); }
  point_type_fp operator()(const Polyline& p) const { return point_type_fp(p.x, p.y); }
};

class contains_visitor : public boost::static_visitor<bool> {
 public:
  contains_visitor(const point_type_fp& point) : point(point) {}
  bool operator()(const Rectangle& r) const {
    return point.x() >= r.x && point.x() <= r.x + r.width &&
           point.y() >= r.y && point.y() <= r.y + r.height;
  }
  bool operator()(const Circle& c) const {
    return bg::distance(point, point_type_fp(c.x, c.y)) <= c.radius;
  }
  bool operator()(const Polyline& p) const {
    if (p.points.size() < 3) {
      return false;
    }
    bg::model::polygon<point_type_fp> polygon;
    for (const auto& vertex : p.points) {
      bg::append(polygon.outer(), point_type_fp(p.x + vertex.x(), p.y + vertex.y()));
    }
    bg::correct(polygon);
    return bg::covered_by(point, polygon);
  }

 private:
  const point_type_fp point;
};

class kind_visitor : public boost::static_visitor<string> {
 public:
  string operator()(const Rectangle&) const { return "rectangle"; }
  string operator()(const Circle&) const { return "circle"; }
  string operator()(const Polyline&) const { return "polyline"; }
};

} // namespace

point_type_fp origin(const Boundary& boundary) {
  return boost::apply_visitor(origin_visitor(), boundary);
}

boost::optional<box_type_fp> bounds(const Boundary& boundary) {
  return boost::apply_visitor(bounds_visitor(), boundary);
}

point_type_fp shape_center(const Boundary& boundary) {
  return boost::apply_visitor(center_visitor(), boundary);
}

point_type_fp shape_center(const CoatingShape& shape) {
  return shape_center(shape.boundary);
}

bool contains(const Boundary& boundary, const point_type_fp& point) {
  return boost::apply_visitor(contains_visitor(point), boundary);
}

string kind_name(const Boundary& boundary) {
  return boost::apply_visitor(kind_visitor(), boundary);
}
