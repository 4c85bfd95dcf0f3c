// STL headers
#include <optional>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// PFD headers
#include "hardware/CalibrationMap.hpp"
#include "hardware/KinematicsMapper.hpp"

// GTest headers
#include <gtest/gtest.h>

namespace pfd::test {

  using pfd::core::ActuatorAngles;
  using pfd::core::AngleRange;
  using pfd::core::Point2D;
  using pfd::hardware::CalibrationCorner;
  using pfd::hardware::CalibrationMap;
  using pfd::hardware::Corner;
  using pfd::hardware::KinematicsMapper;

  namespace {
    constexpr double kTol = 1e-6;

    CalibrationMap unitSquare() {
      return CalibrationMap({ CalibrationCorner{ { 0.0, 0.0 }, { 60.0, 120.0 } },
                              CalibrationCorner{ { 1.0, 0.0 }, { 120.0, 120.0 } },
                              CalibrationCorner{ { 0.0, 1.0 }, { 60.0, 80.0 } },
                              CalibrationCorner{ { 1.0, 1.0 }, { 120.0, 80.0 } } });
    }

    /// Skewed but convex quad, corners handed over in scrambled order.
    CalibrationMap skewed() {
      return CalibrationMap({ CalibrationCorner{ { 1.0, 0.9 }, { 140.0, 60.0 } },  // BR
                              CalibrationCorner{ { 0.1, 0.1 }, { 40.0, 130.0 } },  // TL
                              CalibrationCorner{ { 0.0, 0.8 }, { 30.0, 70.0 } },   // BL
                              CalibrationCorner{ { 0.9, 0.2 }, { 150.0, 125.0 } } }); // TR
    }

    KinematicsMapper defaultMapper() {
      return KinematicsMapper(AngleRange{ 0.0, 180.0 }, AngleRange{ 0.0, 180.0 },
                              ActuatorAngles{ 90.0, 90.0 });
    }
  } // namespace

  //---CalibrationMap----------------------------------------------------------

  TEST(CalibrationMap, IdentifiesCornersFromCameraPoints) {
    const auto map = skewed();
    ASSERT_TRUE(map.valid());
    EXPECT_EQ(map.corner(Corner::TopLeft).camera, (Point2D{ 0.1, 0.1 }));
    EXPECT_EQ(map.corner(Corner::TopRight).camera, (Point2D{ 0.9, 0.2 }));
    EXPECT_EQ(map.corner(Corner::BottomLeft).camera, (Point2D{ 0.0, 0.8 }));
    EXPECT_EQ(map.corner(Corner::BottomRight).camera, (Point2D{ 1.0, 0.9 }));
  }

  TEST(CalibrationMap, CollinearCornersAreInvalid) {
    const CalibrationMap map({ CalibrationCorner{ { 0.0, 0.0 }, { 0.0, 0.0 } },
                               CalibrationCorner{ { 0.5, 0.5 }, { 0.0, 0.0 } },
                               CalibrationCorner{ { 1.0, 1.0 }, { 0.0, 0.0 } },
                               CalibrationCorner{ { 0.25, 0.25 }, { 0.0, 0.0 } } });
    EXPECT_FALSE(map.valid());
    EXPECT_FALSE(map.fractional({ 0.5, 0.5 }));
  }

  TEST(CalibrationMap, CoincidentCornersAreInvalid) {
    const CalibrationMap map({ CalibrationCorner{ { 0.2, 0.2 }, {} }, CalibrationCorner{ { 0.2, 0.2 }, {} },
                               CalibrationCorner{ { 0.2, 0.8 }, {} }, CalibrationCorner{ { 0.8, 0.8 }, {} } });
    EXPECT_FALSE(map.valid());
  }

  TEST(CalibrationMap, FractionalInvertsTheBlend) {
    const auto map = skewed();
    const auto frac = map.fractional(map.centroid());
    ASSERT_TRUE(frac);
    EXPECT_NEAR(frac->u, 0.5, kTol);
    EXPECT_NEAR(frac->v, 0.5, kTol);

    const auto tr = map.fractional(map.corner(Corner::TopRight).camera);
    ASSERT_TRUE(tr);
    EXPECT_NEAR(tr->u, 1.0, kTol);
    EXPECT_NEAR(tr->v, 0.0, kTol);
  }

  TEST(CalibrationMap, JsonRoundTripKeepsEveryCorner) {
    const auto map = skewed();
    const auto back = CalibrationMap::fromJson(map.toJson());
    for (auto c : { Corner::TopLeft, Corner::TopRight, Corner::BottomLeft, Corner::BottomRight }) {
      EXPECT_EQ(back.corner(c).camera, map.corner(c).camera) << pfd::hardware::toString(c);
      EXPECT_EQ(back.corner(c).angles, map.corner(c).angles) << pfd::hardware::toString(c);
    }
  }

  TEST(CalibrationMap, FromJsonRejectsMissingCorner) {
    auto doc = unitSquare().toJson();
    doc.erase("bottom_left");
    EXPECT_THROW(CalibrationMap::fromJson(doc), std::runtime_error);
  }

  TEST(CalibrationMap, FromJsonRejectsNonNumericField) {
    auto doc = unitSquare().toJson();
    doc["top_left"]["servo1"] = "ninety";
    EXPECT_THROW(CalibrationMap::fromJson(doc), std::runtime_error);
  }

  TEST(CalibrationMap, SetCornerReplacesAndRevalidates) {
    auto map = unitSquare();
    map.setCorner(Corner::TopRight, CalibrationCorner{ { 1.0, 0.0 }, { 130.0, 125.0 } });
    ASSERT_TRUE(map.valid());
    EXPECT_EQ(map.corner(Corner::TopRight).angles, (ActuatorAngles{ 130.0, 125.0 }));

    map.setCorner(Corner::TopRight, CalibrationCorner{ { 0.5, 0.5 }, { 130.0, 125.0 } });
    EXPECT_FALSE(map.valid()); // pulled into the middle: no longer convex
  }

  TEST(CalibrationMap, CornerNames) {
    const auto br = pfd::hardware::cornerFromString("bottom_right");
    ASSERT_TRUE(br);
    EXPECT_EQ(*br, Corner::BottomRight);
    EXPECT_FALSE(pfd::hardware::cornerFromString("middle"));
    EXPECT_STREQ(pfd::hardware::toString(Corner::TopLeft), "top_left");
  }

  //---KinematicsMapper--------------------------------------------------------

  TEST(KinematicsMapper, CornersMapToTheirOwnAngles) {
    const auto mapper = defaultMapper();
    const std::optional<CalibrationMap> map = skewed();
    for (auto c : { Corner::TopLeft, Corner::TopRight, Corner::BottomLeft, Corner::BottomRight }) {
      const auto r = mapper.map(map->corner(c).camera, map);
      EXPECT_NEAR(r.angles.a1, map->corner(c).angles.a1, kTol) << pfd::hardware::toString(c);
      EXPECT_NEAR(r.angles.a2, map->corner(c).angles.a2, kTol) << pfd::hardware::toString(c);
      EXPECT_FALSE(r.wasClamped);
    }
  }

  TEST(KinematicsMapper, CentroidMapsToAverageAngles) {
    const auto mapper = defaultMapper();
    const std::optional<CalibrationMap> map = unitSquare();
    const auto r = mapper.map({ 0.5, 0.5 }, map);
    EXPECT_NEAR(r.angles.a1, 90.0, kTol);
    EXPECT_NEAR(r.angles.a2, 100.0, kTol);
    EXPECT_FALSE(r.wasClamped);
  }

  TEST(KinematicsMapper, OutsideThePatchClampsToTheEdge) {
    const auto mapper = defaultMapper();
    const std::optional<CalibrationMap> map = unitSquare();

    const auto far = mapper.map({ 2.0, 2.0 }, map);
    EXPECT_TRUE(far.wasClamped);
    EXPECT_NEAR(far.angles.a1, 120.0, kTol);
    EXPECT_NEAR(far.angles.a2, 80.0, kTol);

    const auto left = mapper.map({ -0.5, 0.5 }, map);
    EXPECT_TRUE(left.wasClamped);
    EXPECT_NEAR(left.angles.a1, 60.0, kTol);
    EXPECT_NEAR(left.angles.a2, 100.0, kTol);
  }

  TEST(KinematicsMapper, OutputStaysInsideTheSafeRange) {
    const KinematicsMapper mapper(AngleRange{ 70.0, 110.0 }, AngleRange{ 85.0, 115.0 },
                                  ActuatorAngles{ 90.0, 90.0 });
    const std::optional<CalibrationMap> map = skewed();
    for (double u = -1.0; u <= 2.0; u += 0.25) {
      for (double v = -1.0; v <= 2.0; v += 0.25) {
        const auto r = mapper.map({ u, v }, map);
        EXPECT_GE(r.angles.a1, 70.0);
        EXPECT_LE(r.angles.a1, 110.0);
        EXPECT_GE(r.angles.a2, 85.0);
        EXPECT_LE(r.angles.a2, 115.0);
      }
    }
    EXPECT_TRUE(mapper.map(map->corner(Corner::TopRight).camera, map).wasClamped);
  }

  TEST(KinematicsMapper, MissingCalibrationFallsBackToRest) {
    const auto mapper = defaultMapper();
    const auto r = mapper.map({ 0.5, 0.5 }, std::nullopt);
    EXPECT_EQ(r.angles, (ActuatorAngles{ 90.0, 90.0 }));
    EXPECT_TRUE(r.wasClamped);
  }

  TEST(KinematicsMapper, DegenerateCalibrationFallsBackToRest) {
    const auto mapper = defaultMapper();
    const std::optional<CalibrationMap> flat = CalibrationMap(
        { CalibrationCorner{ { 0.0, 0.5 }, { 10.0, 10.0 } }, CalibrationCorner{ { 0.3, 0.5 }, { 20.0, 20.0 } },
          CalibrationCorner{ { 0.6, 0.5 }, { 30.0, 30.0 } }, CalibrationCorner{ { 0.9, 0.5 }, { 40.0, 40.0 } } });
    const auto r = mapper.map({ 0.5, 0.5 }, flat);
    EXPECT_EQ(r.angles, (ActuatorAngles{ 90.0, 90.0 }));
    EXPECT_TRUE(r.wasClamped);
  }

  TEST(KinematicsMapper, RejectsRestOutsideRange) {
    EXPECT_THROW(KinematicsMapper(AngleRange{ 0.0, 80.0 }, AngleRange{ 0.0, 180.0 },
                                  ActuatorAngles{ 90.0, 90.0 }),
                 std::invalid_argument);
  }

} // namespace pfd::test
