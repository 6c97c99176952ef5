#define BOOST_TEST_MODULE mask index tests
#include <boost/test/included/unit_test.hpp>

#include "mask_index.hpp"
#include "bg_operators.hpp"

using namespace std;

BOOST_AUTO_TEST_SUITE(mask_index_tests)

CoatingShape make_shape(const Boundary& boundary, CoatingType::CoatingType type) {
  CoatingShape shape;
  shape.boundary = boundary;
  shape.coating_type = type;
  return shape;
}

CoatingSettings make_settings() {
  CoatingSettings settings;
  settings.coating_width = 2;
  settings.masking_clearance = 0;
  return settings;
}

// A 20x50 mask standing in the middle of a 100x50 board, grown by 1.
vector<CoatingShape> middle_mask() {
  return {
    make_shape(Rectangle{0, 0, 100, 50}, CoatingType::FILL),
    make_shape(Rectangle{40, 0, 20, 50}, CoatingType::MASKING),
  };
}

BOOST_AUTO_TEST_CASE(has_masks) {
  BOOST_CHECK(MaskIndex(middle_mask(), make_settings()).has_masks());

  CoatingSettings disabled = make_settings();
  disabled.enable_masking = false;
  BOOST_CHECK(!MaskIndex(middle_mask(), disabled).has_masks());

  auto shapes = middle_mask();
  shapes[1].skip_coating = true;
  BOOST_CHECK(!MaskIndex(shapes, make_settings()).has_masks());

  BOOST_CHECK(!MaskIndex({make_shape(Circle{0, 0, 5}, CoatingType::FILL)}, make_settings()).has_masks());
}

BOOST_AUTO_TEST_CASE(point_in_mask_area) {
  const MaskIndex masks(middle_mask(), make_settings());
  BOOST_CHECK(masks.is_point_in_mask_area(point_type_fp(50, 25)));
  BOOST_CHECK(masks.is_point_in_mask_area(point_type_fp(39.5, 10)));
  BOOST_CHECK(masks.is_point_in_mask_area(point_type_fp(50, 50.5)));
  BOOST_CHECK(!masks.is_point_in_mask_area(point_type_fp(38.9, 10)));
  BOOST_CHECK(!masks.is_point_in_mask_area(point_type_fp(50, 51.5)));

  const MaskIndex round({make_shape(Circle{0, 0, 10}, CoatingType::MASKING)}, make_settings());
  BOOST_CHECK(round.is_point_in_mask_area(point_type_fp(11, 0)));
  BOOST_CHECK(!round.is_point_in_mask_area(point_type_fp(8, 8)));
}

BOOST_AUTO_TEST_CASE(per_mask_clearance) {
  auto shapes = middle_mask();
  shapes[1].masking_clearance = 3;
  const MaskIndex masks(shapes, make_settings());
  BOOST_CHECK(masks.is_point_in_mask_area(point_type_fp(36.5, 10)));
  BOOST_CHECK(!masks.is_point_in_mask_area(point_type_fp(35.5, 10)));
}

BOOST_AUTO_TEST_CASE(forbidden_intervals) {
  const MaskIndex masks(middle_mask(), make_settings());
  BOOST_CHECK_EQUAL(masks.forbidden_intervals(ScanAxis::HORIZONTAL, 10).size(), 1);
  BOOST_CHECK_EQUAL(masks.forbidden_intervals(ScanAxis::HORIZONTAL, 10)[0].first, 39);
  BOOST_CHECK_EQUAL(masks.forbidden_intervals(ScanAxis::HORIZONTAL, 10)[0].second, 61);
  BOOST_CHECK(masks.forbidden_intervals(ScanAxis::HORIZONTAL, 52).empty());
  // Vertical scan lines crossing the mask see its whole grown height.
  BOOST_CHECK_EQUAL(masks.forbidden_intervals(ScanAxis::VERTICAL, 45)[0].first, -1);
  BOOST_CHECK_EQUAL(masks.forbidden_intervals(ScanAxis::VERTICAL, 45)[0].second, 51);
  BOOST_CHECK(masks.forbidden_intervals(ScanAxis::VERTICAL, 30).empty());
}

BOOST_AUTO_TEST_CASE(forbidden_intervals_merge) {
  const MaskIndex masks({
      make_shape(Rectangle{20, 0, 10, 10}, CoatingType::MASKING),
      make_shape(Rectangle{10, 0, 10, 10}, CoatingType::MASKING),
      make_shape(Rectangle{70, 0, 10, 10}, CoatingType::MASKING),
    }, make_settings());
  const auto forbidden = masks.forbidden_intervals(ScanAxis::HORIZONTAL, 5);
  BOOST_REQUIRE_EQUAL(forbidden.size(), 2);
  BOOST_CHECK_EQUAL(forbidden[0].first, 9);
  BOOST_CHECK_EQUAL(forbidden[0].second, 31);
  BOOST_CHECK_EQUAL(forbidden[1].first, 69);
  BOOST_CHECK_EQUAL(forbidden[1].second, 81);
}

BOOST_AUTO_TEST_CASE(forbidden_intervals_circle) {
  const MaskIndex masks({make_shape(Circle{50, 50, 10}, CoatingType::MASKING)}, make_settings());
  const auto through_center = masks.forbidden_intervals(ScanAxis::HORIZONTAL, 50);
  BOOST_REQUIRE_EQUAL(through_center.size(), 1);
  BOOST_CHECK_CLOSE(through_center[0].first, 39, 1e-9);
  BOOST_CHECK_CLOSE(through_center[0].second, 61, 1e-9);
  BOOST_CHECK(masks.forbidden_intervals(ScanAxis::VERTICAL, 62).empty());
}

BOOST_AUTO_TEST_CASE(allowed_intervals) {
  const MaskIndex masks(middle_mask(), make_settings());
  const auto allowed = masks.allowed_intervals(ScanAxis::HORIZONTAL, 10, 0, 100);
  BOOST_REQUIRE_EQUAL(allowed.size(), 2);
  BOOST_CHECK_EQUAL(allowed[0].first, 0);
  BOOST_CHECK_EQUAL(allowed[0].second, 39);
  BOOST_CHECK_EQUAL(allowed[1].first, 61);
  BOOST_CHECK_EQUAL(allowed[1].second, 100);

  BOOST_CHECK(masks.allowed_intervals(ScanAxis::HORIZONTAL, 10, 45, 55).empty());
  BOOST_CHECK_EQUAL(masks.allowed_intervals(ScanAxis::HORIZONTAL, 60, 0, 100).size(), 1);
}

BOOST_AUTO_TEST_CASE(allowed_intervals_match_clipping) {
  // Grown to radius 5, touching the lines y = 11 and y = 21.
  const MaskIndex round({make_shape(Circle{50, 16, 4}, CoatingType::MASKING)}, make_settings());
  const auto touching = round.allowed_intervals(ScanAxis::HORIZONTAL, 11, 0, 100);
  BOOST_REQUIRE_EQUAL(touching.size(), 1);
  BOOST_CHECK_EQUAL(touching[0].first, 0);
  BOOST_CHECK_EQUAL(touching[0].second, 100);
  BOOST_CHECK_EQUAL(round.clip_segment(segment_type_fp(point_type_fp(0, 11), point_type_fp(100, 11))).size(), 1);

  const MaskIndex masks(middle_mask(), make_settings());
  const auto sliver = masks.allowed_intervals(ScanAxis::HORIZONTAL, 10, 38.995, 100);
  BOOST_REQUIRE_EQUAL(sliver.size(), 1);
  BOOST_CHECK_EQUAL(sliver[0].first, 61);
  BOOST_CHECK_EQUAL(sliver[0].second, 100);
  BOOST_CHECK_EQUAL(masks.clip_segment(segment_type_fp(point_type_fp(38.995, 10), point_type_fp(100, 10))).size(), 1);
}

BOOST_AUTO_TEST_CASE(clip_segment) {
  const MaskIndex masks(middle_mask(), make_settings());
  const auto forward = masks.clip_segment(segment_type_fp(point_type_fp(0, 10), point_type_fp(100, 10)));
  BOOST_REQUIRE_EQUAL(forward.size(), 2);
  BOOST_CHECK(near(forward[0].first, point_type_fp(0, 10)));
  BOOST_CHECK(near(forward[0].second, point_type_fp(39, 10)));
  BOOST_CHECK(near(forward[1].first, point_type_fp(61, 10)));
  BOOST_CHECK(near(forward[1].second, point_type_fp(100, 10)));

  // The pieces keep the direction of the segment.
  const auto backward = masks.clip_segment(segment_type_fp(point_type_fp(100, 10), point_type_fp(0, 10)));
  BOOST_REQUIRE_EQUAL(backward.size(), 2);
  BOOST_CHECK(near(backward[0].first, point_type_fp(100, 10)));
  BOOST_CHECK(near(backward[0].second, point_type_fp(61, 10)));
  BOOST_CHECK(near(backward[1].first, point_type_fp(39, 10)));
  BOOST_CHECK(near(backward[1].second, point_type_fp(0, 10)));

  // Entirely inside.
  BOOST_CHECK(masks.clip_segment(segment_type_fp(point_type_fp(45, 10), point_type_fp(55, 10))).empty());
  // Entirely outside.
  BOOST_CHECK_EQUAL(masks.clip_segment(segment_type_fp(point_type_fp(0, 60), point_type_fp(100, 60))).size(), 1);
  // The sliver left before the mask is too short to keep.
  BOOST_CHECK_EQUAL(masks.clip_segment(segment_type_fp(point_type_fp(38.995, 10), point_type_fp(100, 10))).size(), 1);
}

BOOST_AUTO_TEST_CASE(clip_segment_circle) {
  const MaskIndex masks({make_shape(Circle{50, 0, 9}, CoatingType::MASKING)}, make_settings());
  const auto pieces = masks.clip_segment(segment_type_fp(point_type_fp(0, 0), point_type_fp(100, 0)));
  BOOST_REQUIRE_EQUAL(pieces.size(), 2);
  BOOST_CHECK(near(pieces[0].second, point_type_fp(40, 0), 1e-9));
  BOOST_CHECK(near(pieces[1].first, point_type_fp(60, 0), 1e-9));
}

BOOST_AUTO_TEST_CASE(apply_masking) {
  const MaskIndex masks(middle_mask(), make_settings());
  const CoatingShape board = make_shape(Rectangle{0, 0, 100, 50}, CoatingType::FILL);
  const segments_type_fp lines{
    segment_type_fp(point_type_fp(0, 1), point_type_fp(100, 1)),
    segment_type_fp(point_type_fp(100, 11), point_type_fp(0, 11)),
  };
  BOOST_CHECK_EQUAL(masks.apply_masking(lines, board).size(), 4);

  const CoatingShape hidden = make_shape(Rectangle{45, 10, 5, 5}, CoatingType::FILL);
  BOOST_CHECK(masks.is_shape_inside_mask(hidden));
  BOOST_CHECK(masks.apply_masking(lines, hidden).empty());

  const CoatingShape small_circle = make_shape(Circle{50, 25, 5}, CoatingType::FILL);
  BOOST_CHECK(masks.is_shape_inside_mask(small_circle));
  BOOST_CHECK(!masks.is_shape_inside_mask(board));
}

BOOST_AUTO_TEST_CASE(find_intersecting_masks) {
  const MaskIndex masks(middle_mask(), make_settings());
  BOOST_CHECK_EQUAL(masks.find_intersecting_masks(point_type_fp(0, 10), point_type_fp(100, 10)).size(), 1);
  BOOST_CHECK(masks.find_intersecting_masks(point_type_fp(0, 10), point_type_fp(30, 40)).empty());
  BOOST_CHECK(masks.find_intersecting_masks(point_type_fp(0, 60), point_type_fp(100, 60)).empty());
}

BOOST_AUTO_TEST_CASE(plan_travel) {
  auto shapes = middle_mask();
  shapes[1].name = "keepout";
  const MaskIndex masks(shapes, make_settings());

  const travel_move direct = masks.plan_travel(point_type_fp(0, 10), point_type_fp(30, 10), MaskAvoidance::ROUTE_AROUND);
  BOOST_CHECK(!direct.lift);
  BOOST_REQUIRE_EQUAL(direct.waypoints.size(), 1);
  BOOST_CHECK_EQUAL(direct.waypoints[0], point_type_fp(30, 10));

  const travel_move lift = masks.plan_travel(point_type_fp(30, 10), point_type_fp(70, 10), MaskAvoidance::LIFT);
  BOOST_CHECK(lift.lift);
  BOOST_CHECK_EQUAL(lift.waypoints.back(), point_type_fp(70, 10));

  const travel_move around = masks.plan_travel(point_type_fp(30, 10), point_type_fp(70, 10), MaskAvoidance::ROUTE_AROUND);
  BOOST_CHECK(!around.lift);
  BOOST_REQUIRE_EQUAL(around.waypoints.size(), 3);
  BOOST_CHECK_EQUAL(around.waypoints[0], point_type_fp(39, -1));
  BOOST_CHECK_EQUAL(around.waypoints[1], point_type_fp(61, -1));
  BOOST_CHECK_EQUAL(around.waypoints[2], point_type_fp(70, 10));

  const MaskIndex round({make_shape(Circle{50, 10, 5}, CoatingType::MASKING)}, make_settings());
  BOOST_CHECK(round.plan_travel(point_type_fp(30, 10), point_type_fp(70, 10), MaskAvoidance::ROUTE_AROUND).lift);
}

BOOST_AUTO_TEST_SUITE_END()
