#ifndef BG_OPERATORS_HPP
#define BG_OPERATORS_HPP

#include <cmath>
#include <ostream>
#include <tuple>
#include <utility>
#include <vector>

#include "geometry.hpp"

// It's not great to insert definitions into the bg namespace but they
// are useful for sorting, comparing and printing in tests.

namespace boost { namespace geometry { namespace model { namespace d2 {

template <typename T>
extern inline bool operator<(
    const boost::geometry::model::d2::point_xy<T>& x,
    const boost::geometry::model::d2::point_xy<T>& y) {
  return std::tie(x.x(), x.y()) < std::tie(y.x(), y.y());
}

template <typename T>
extern inline boost::geometry::model::d2::point_xy<T> operator-(
    const boost::geometry::model::d2::point_xy<T>& lhs,
    const boost::geometry::model::d2::point_xy<T>& rhs) {
  return {lhs.x()-rhs.x(), lhs.y()-rhs.y()};
}

template <typename T>
extern inline boost::geometry::model::d2::point_xy<T> operator+(
    const boost::geometry::model::d2::point_xy<T>& lhs,
    const boost::geometry::model::d2::point_xy<T>& rhs) {
  return {lhs.x()+rhs.x(), lhs.y()+rhs.y()};
}

template <typename T, typename S>
extern inline boost::geometry::model::d2::point_xy<T> operator*(
    const boost::geometry::model::d2::point_xy<T>& lhs,
    const S& rhs) {
  return {lhs.x()*static_cast<T>(rhs), lhs.y()*static_cast<T>(rhs)};
}

template <typename T>
extern inline bool operator==(
    const boost::geometry::model::d2::point_xy<T>& x,
    const boost::geometry::model::d2::point_xy<T>& y) {
  return std::tie(x.x(), x.y()) == std::tie(y.x(), y.y());
}

template <typename T>
extern inline bool operator!=(
    const boost::geometry::model::d2::point_xy<T>& x,
    const boost::geometry::model::d2::point_xy<T>& y) {
  return std::tie(x.x(), x.y()) != std::tie(y.x(), y.y());
}

template <typename T>
extern inline std::ostream& operator<<(std::ostream& out, const bg::model::d2::point_xy<T>& t) {
  out << bg::wkt(t);
  return out;
}

}}}} // namespace boost::geometry::model::d2

namespace boost { namespace geometry { namespace model {

template <typename T>
extern inline std::ostream& operator<<(std::ostream& out, const bg::model::segment<T>& s) {
  out << "{" << bg::wkt(s.first) << "->" << bg::wkt(s.second) << "}";
  return out;
}

}}} // namespace boost::geometry::model

namespace std {

template <typename T>
static std::ostream& operator<<(std::ostream& out, const vector<T>& xs) {
  out << "{";
  for (const auto& x : xs) {
    out << x << ",";
  }
  out << "}";
  return out;
}

} // namespace std

// Returns true if the two points are within tolerance of each other
// on both axes.
static inline bool near(const point_type_fp& a, const point_type_fp& b,
                        coordinate_type_fp tolerance = axis_tolerance) {
  return std::abs(a.x() - b.x()) <= tolerance && std::abs(a.y() - b.y()) <= tolerance;
}

// Swap the start and the end of the segment.
static inline segment_type_fp reversed(const segment_type_fp& s) {
  return segment_type_fp(s.second, s.first);
}

#endif //BG_OPERATORS_HPP
