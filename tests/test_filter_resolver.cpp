/**
 * @file test_filter_resolver.cpp
 * @brief Unit tests for rotation mode parsing and filter resolution
 */

#include <cmath>
#include <limits>

#include "ffrotate/filter_resolver.hpp"
#include "test_support.hpp"

using namespace ffrotate;

void test_fixed_filters() {
  CHECK(resolve_filter(RotationMode::deg90()) == "transpose=1");
  CHECK(resolve_filter(RotationMode::deg180()) == "transpose=2,transpose=2");
  CHECK(resolve_filter(RotationMode::deg270()) == "transpose=2");
}

void test_fixed_filters_are_pure() {
  /// Same input, same output, no environment involved
  for (int i = 0; i < 3; ++i) {
    CHECK(resolve_filter(RotationMode::deg90()) ==
          resolve_filter(RotationMode::deg90()));
  }
  /// Fixed modes ignore any stray angle
  RotationMode mode = RotationMode::deg270();
  mode.angle = 33.0;
  CHECK(resolve_filter(mode) == "transpose=2");
}

void test_custom_filter() {
  CHECK(resolve_filter(RotationMode::custom(12.5)) ==
        "rotate=12.5*(PI/180):bilinear=0");
  CHECK(resolve_filter(RotationMode::custom(-30.25)) ==
        "rotate=-30.25*(PI/180):bilinear=0");
}

void test_custom_without_angle_is_invalid() {
  CHECK_THROWS_KIND(resolve_filter(RotationMode::custom(std::nullopt)),
                    ErrorKind::InvalidAngle);
  CHECK_THROWS_KIND(
      resolve_filter(RotationMode::custom(std::nan(""))),
      ErrorKind::InvalidAngle);
  CHECK_THROWS_KIND(resolve_filter(RotationMode::custom(
                        std::numeric_limits<double>::infinity())),
                    ErrorKind::InvalidAngle);
}

void test_lossless_modes() {
  CHECK(is_lossless(RotationMode::deg90()));
  CHECK(is_lossless(RotationMode::deg180()));
  CHECK(is_lossless(RotationMode::deg270()));
  CHECK(!is_lossless(RotationMode::custom(45.5)));
}

void test_parse_rotation_mode() {
  CHECK(parse_rotation_mode("90", std::nullopt)->kind ==
        RotationMode::Kind::Deg90);
  CHECK(parse_rotation_mode("180", std::nullopt)->kind ==
        RotationMode::Kind::Deg180);
  CHECK(parse_rotation_mode("270", 5.0)->kind == RotationMode::Kind::Deg270);

  auto custom = parse_rotation_mode("custom", 7.5);
  CHECK(custom && custom->is_custom());
  CHECK(custom->angle && *custom->angle == 7.5);

  auto no_angle = parse_rotation_mode("custom", std::nullopt);
  CHECK(no_angle && !no_angle->angle);

  CHECK(!parse_rotation_mode("45", std::nullopt));
  CHECK(!parse_rotation_mode("", std::nullopt));
}

void test_describe() {
  CHECK(describe(RotationMode::deg180()) == "180");
  CHECK(describe(RotationMode::custom(12.5)) == "custom(12.5)");
  CHECK(describe(RotationMode::custom(std::nullopt)) == "custom(?)");
}

int main() {
  RUN_TEST(test_fixed_filters);
  RUN_TEST(test_fixed_filters_are_pure);
  RUN_TEST(test_custom_filter);
  RUN_TEST(test_custom_without_angle_is_invalid);
  RUN_TEST(test_lossless_modes);
  RUN_TEST(test_parse_rotation_mode);
  RUN_TEST(test_describe);
  return 0;
}
