#define BOOST_TEST_MODULE geometry transform tests
#include <boost/test/included/unit_test.hpp>

#include "geometry_transform.hpp"
#include "bg_operators.hpp"

using namespace std;
using namespace geometry_transform;

BOOST_AUTO_TEST_SUITE(geometry_transform_tests)

BOOST_AUTO_TEST_CASE(zero_angle_is_exact) {
  const point_type_fp p(1.0/3, 2.0/7);
  BOOST_CHECK_EQUAL(rotate(p, point_type_fp(5, 5), 0), p);
}

BOOST_AUTO_TEST_CASE(quarter_turn) {
  const point_type_fp rotated = rotate(point_type_fp(10, 0), point_type_fp(0, 0), 90);
  BOOST_CHECK_SMALL(rotated.x(), 1e-9);
  BOOST_CHECK_CLOSE(rotated.y(), 10, 1e-9);

  const point_type_fp around = rotate(point_type_fp(2, 1), point_type_fp(1, 1), 180);
  BOOST_CHECK(near(around, point_type_fp(0, 1), 1e-9));
}

BOOST_AUTO_TEST_CASE(full_turn_round_trip) {
  const segments_type_fp segments{
    segment_type_fp(point_type_fp(0, 1), point_type_fp(100, 1)),
    segment_type_fp(point_type_fp(100, 11), point_type_fp(0, 11)),
  };
  const auto turned = rotate(segments, point_type_fp(50, 25), 360);
  BOOST_REQUIRE_EQUAL(turned.size(), segments.size());
  for (size_t i = 0; i < segments.size(); i++) {
    BOOST_CHECK(near(turned[i].first, segments[i].first, 1e-9));
    BOOST_CHECK(near(turned[i].second, segments[i].second, 1e-9));
  }
}

BOOST_AUTO_TEST_CASE(segments_stay_straight) {
  const segment_type_fp segment(point_type_fp(0, 0), point_type_fp(10, 0));
  const auto turned = rotate(segments_type_fp{segment}, point_type_fp(0, 0), 30);
  BOOST_CHECK_CLOSE(bg::distance(turned[0].first, turned[0].second), 10, 1e-9);
}

BOOST_AUTO_TEST_CASE(rotation_center_uses_pivot_offset) {
  CoatingShape shape;
  shape.boundary = Rectangle{0, 0, 100, 50};
  BOOST_CHECK_EQUAL(rotation_center(shape), point_type_fp(50, 25));
  shape.offset_x = 50;
  shape.offset_y = 25;
  BOOST_CHECK_EQUAL(rotation_center(shape), point_type_fp(0, 0));

  CoatingShape circle;
  circle.boundary = Circle{3, 4, 5};
  BOOST_CHECK_EQUAL(rotation_center(circle), point_type_fp(3, 4));
}

BOOST_AUTO_TEST_CASE(to_local_undoes_rotation) {
  CoatingShape shape;
  shape.boundary = Rectangle{0, 0, 10, 10};
  shape.rotation = 37;
  const point_type_fp local(2, 3);
  const point_type_fp world = rotate(local, rotation_center(shape), shape.rotation);
  BOOST_CHECK(near(to_local(world, shape), local, 1e-9));

  const auto worlds = to_world(segments_type_fp{segment_type_fp(local, local)}, shape);
  BOOST_CHECK(near(worlds[0].first, world, 1e-12));
}

BOOST_AUTO_TEST_SUITE_END()
