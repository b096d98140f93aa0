// Tests for compose/CenterFramingService -- offset score, symmetry bonus, direction hints.

#include "compose/CenterFramingService.hpp"

#include <gtest/gtest.h>

#include <cmath>

#include "test_helpers.h"

namespace {

using test_helpers::kFrame1000;
using test_helpers::observationAt;

TEST(CenterFramingServiceTest, CenteredWithoutPixelsIsGood) {
  CenterFramingService svc;
  const auto r = svc.evaluate(observationAt(0.5, 0.5), kFrame1000);
  EXPECT_EQ(r.compositionType, CompositionType::CenterFraming);
  EXPECT_NEAR(r.score, 1.0, 1e-9);
  EXPECT_EQ(r.status, CompositionStatus::Good);
  EXPECT_FALSE(r.symmetry.has_value());
  EXPECT_EQ(r.suggestion, "Nice center!");
}

TEST(CenterFramingServiceTest, CenteredAndSymmetricIsPerfect) {
  CenterFramingService svc;
  const auto r = svc.evaluate(observationAt(0.5, 0.5), kFrame1000, test_helpers::uniformImage());
  EXPECT_EQ(r.status, CompositionStatus::Perfect);
  EXPECT_DOUBLE_EQ(r.score, 1.0);
  ASSERT_TRUE(r.symmetry.has_value());
  EXPECT_NEAR(r.symmetry->similarity, 1.0, 1e-6);
}

TEST(CenterFramingServiceTest, AsymmetricFrameGetsNoBonus) {
  CenterFramingService svc;
  const auto r = svc.evaluate(observationAt(0.55, 0.5), kFrame1000, test_helpers::leftHeavyImage());
  EXPECT_EQ(r.status, CompositionStatus::Good);
  ASSERT_TRUE(r.symmetry.has_value());
  EXPECT_LT(r.symmetry->similarity, 0.8);
  EXPECT_NEAR(r.score, svc.offsetScore({0.55, 0.5}), 1e-9);
}

TEST(CenterFramingServiceTest, SubjectRightOfCenterSaysRight) {
  CenterFramingService svc;
  const auto r = svc.evaluate(observationAt(0.6, 0.5), kFrame1000);
  EXPECT_NE(r.suggestion.find("right"), std::string::npos);
  EXPECT_EQ(r.suggestion.find("left"), std::string::npos);
}

TEST(CenterFramingServiceTest, SubjectLeftOfCenterSaysLeft) {
  CenterFramingService svc;
  const auto r = svc.evaluate(observationAt(0.2, 0.5), kFrame1000);
  EXPECT_EQ(r.status, CompositionStatus::NeedsAdjustment);
  EXPECT_EQ(r.suggestion, "Move left");
}

TEST(CenterFramingServiceTest, DiagonalOffsetCombinesDirections) {
  CenterFramingService svc;
  const auto r = svc.evaluate(observationAt(0.8, 0.8), kFrame1000);
  EXPECT_EQ(r.status, CompositionStatus::NeedsAdjustment);
  EXPECT_EQ(r.suggestion, "Move right and down");
  const double d = std::sqrt(0.18);
  const double expected = 0.7 * (1.0 - (d - 0.12) / (std::sqrt(0.5) - 0.12));
  EXPECT_NEAR(r.score, expected, 1e-9);
}

TEST(CenterFramingServiceTest, OffsetScoreContinuousAtTolerance) {
  CenterFramingService svc;
  EXPECT_NEAR(svc.offsetScore({0.5 + 0.12 - 1e-9, 0.5}), 0.7, 1e-6);
  EXPECT_NEAR(svc.offsetScore({0.5 + 0.12 + 1e-9, 0.5}), 0.7, 1e-6);
  EXPECT_NEAR(svc.offsetScore({0.0, 0.0}), 0.0, 1e-9);
}

TEST(CenterFramingServiceTest, DirectionHintBelowThresholdIsEmpty) {
  CenterFramingService svc;
  EXPECT_EQ(svc.directionHint({0.52, 0.48}), "");
  EXPECT_EQ(svc.directionHint({0.5, 0.6}), "down");
  EXPECT_EQ(svc.directionHint({0.4, 0.4}), "left and up");
}

}  // namespace
