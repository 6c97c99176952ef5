#define BOOST_TEST_MODULE outline planner tests
#include <boost/test/included/unit_test.hpp>

#include "outline_planner.hpp"
#include "bg_operators.hpp"

using namespace std;
using namespace outline_planner;

BOOST_AUTO_TEST_SUITE(outline_planner_tests)

EffectiveParameters make_parameters(coordinate_type_fp spacing, unsigned int passes,
                                    OutlineStartPoint::OutlineStartPoint start) {
  EffectiveParameters parameters;
  parameters.line_spacing = spacing;
  parameters.coating_width = 2;
  parameters.fill_pattern = FillPattern::AUTO;
  parameters.outline_passes = passes;
  parameters.outline_start_point = start;
  return parameters;
}

CoatingShape make_outline(const Boundary& boundary) {
  CoatingShape shape;
  shape.boundary = boundary;
  shape.coating_type = CoatingType::OUTLINE;
  return shape;
}

BOOST_AUTO_TEST_CASE(rectangle_single_pass) {
  const auto segments = plan_outline(make_outline(Rectangle{0, 0, 100, 50}),
                                     make_parameters(5, 1, OutlineStartPoint::CENTER));
  const segments_type_fp expected{
    segment_type_fp(point_type_fp(0, 0), point_type_fp(100, 0)),
    segment_type_fp(point_type_fp(100, 0), point_type_fp(100, 50)),
    segment_type_fp(point_type_fp(100, 50), point_type_fp(0, 50)),
    segment_type_fp(point_type_fp(0, 50), point_type_fp(0, 0)),
  };
  BOOST_REQUIRE_EQUAL(segments.size(), expected.size());
  for (size_t i = 0; i < expected.size(); i++) {
    BOOST_CHECK_EQUAL(segments[i].first, expected[i].first);
    BOOST_CHECK_EQUAL(segments[i].second, expected[i].second);
  }
}

BOOST_AUTO_TEST_CASE(rectangle_passes_grow_outward) {
  const auto outside = plan_outline(make_outline(Rectangle{0, 0, 100, 50}),
                                    make_parameters(5, 3, OutlineStartPoint::OUTSIDE));
  BOOST_REQUIRE_EQUAL(outside.size(), 12);
  BOOST_CHECK_EQUAL(outside[0].first, point_type_fp(-5, -5));
  BOOST_CHECK_EQUAL(outside[4].first, point_type_fp(-10, -10));
  BOOST_CHECK_EQUAL(outside[8].first, point_type_fp(-15, -15));
  BOOST_CHECK_EQUAL(outside[9].second, point_type_fp(115, 65));

  const auto inside = plan_outline(make_outline(Rectangle{0, 0, 100, 50}),
                                   make_parameters(5, 2, OutlineStartPoint::INSIDE));
  BOOST_REQUIRE_EQUAL(inside.size(), 8);
  BOOST_CHECK_EQUAL(inside[0].first, point_type_fp(5, 5));
  BOOST_CHECK_EQUAL(inside[4].first, point_type_fp(0, 0));
}

BOOST_AUTO_TEST_CASE(rectangle_degenerate_passes_skipped) {
  // Starting inside a 6x6 square with a 5 offset leaves no room.
  const auto segments = plan_outline(make_outline(Rectangle{0, 0, 6, 6}),
                                     make_parameters(5, 2, OutlineStartPoint::INSIDE));
  BOOST_CHECK_EQUAL(segments.size(), 4);
  BOOST_CHECK_EQUAL(segments[0].first, point_type_fp(0, 0));
}

BOOST_AUTO_TEST_CASE(circle_rings) {
  const auto segments = plan_outline(make_outline(Circle{0, 0, 10}),
                                     make_parameters(2, 2, OutlineStartPoint::CENTER));
  BOOST_REQUIRE_EQUAL(segments.size(), 32);
  BOOST_CHECK(near(segments[0].first, point_type_fp(10, 0), 1e-9));
  BOOST_CHECK(near(segments[15].second, point_type_fp(10, 0), 1e-9));
  BOOST_CHECK(near(segments[16].first, point_type_fp(12, 0), 1e-9));
  for (const auto& segment : segments) {
    const double r = bg::distance(segment.first, point_type_fp(0, 0));
    BOOST_CHECK(std::abs(r - 10) < 1e-9 || std::abs(r - 12) < 1e-9);
  }

  BOOST_CHECK(plan_outline(make_outline(Circle{0, 0, 1}),
                           make_parameters(2, 1, OutlineStartPoint::INSIDE)).empty());
}

BOOST_AUTO_TEST_CASE(chords) {
  BOOST_CHECK_EQUAL(chord_count(10), 16);
  BOOST_CHECK_EQUAL(chord_count(0), 16);
  BOOST_CHECK_EQUAL(chord_count(100), 50);
  BOOST_CHECK_EQUAL(chord_count(101.9), 50);
}

BOOST_AUTO_TEST_CASE(polyline_traced_once) {
  const auto segments = plan_outline(
      make_outline(Polyline{10, 20, {point_type_fp(0, 0), point_type_fp(5, 0), point_type_fp(5, 5)}}),
      make_parameters(5, 3, OutlineStartPoint::OUTSIDE));
  BOOST_REQUIRE_EQUAL(segments.size(), 2);
  BOOST_CHECK_EQUAL(segments[0].first, point_type_fp(10, 20));
  BOOST_CHECK_EQUAL(segments[1].second, point_type_fp(15, 25));

  BOOST_CHECK(plan_outline(make_outline(Polyline{0, 0, {point_type_fp(1, 1)}}),
                           make_parameters(5, 1, OutlineStartPoint::CENTER)).empty());
}

BOOST_AUTO_TEST_SUITE_END()
