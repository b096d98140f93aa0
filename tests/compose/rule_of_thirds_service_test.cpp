// Tests for compose/RuleOfThirdsService -- intersection/line scoring and suggestions.

#include "compose/RuleOfThirdsService.hpp"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace {

using test_helpers::kFrame1000;
using test_helpers::observationAt;

TEST(RuleOfThirdsServiceTest, SubjectOnIntersectionIsPerfect) {
  RuleOfThirdsService svc;
  const auto r = svc.evaluate(observationAt(0.33, 0.33), kFrame1000);
  EXPECT_EQ(r.compositionType, CompositionType::RuleOfThirds);
  EXPECT_GT(r.score, 0.95);
  EXPECT_LE(r.score, 1.0);
  EXPECT_EQ(r.status, CompositionStatus::Perfect);
  EXPECT_NE(r.suggestion.find("top-left"), std::string::npos);
}

TEST(RuleOfThirdsServiceTest, CenteredSubjectNeedsAdjustment) {
  RuleOfThirdsService svc;
  const auto r = svc.evaluate(observationAt(0.5, 0.5), kFrame1000);
  EXPECT_LT(r.score, 0.4);
  EXPECT_EQ(r.status, CompositionStatus::NeedsAdjustment);
  EXPECT_NE(r.suggestion.find("third"), std::string::npos);
  // Equidistant intersections resolve to the first in fixed order.
  EXPECT_EQ(r.suggestion, "Move subject left and up to the top-left third");
}

TEST(RuleOfThirdsServiceTest, LineAlignmentScoresSeventyPercent) {
  RuleOfThirdsService svc;
  const auto r = svc.evaluate(observationAt(1.0 / 3.0, 0.5), kFrame1000);
  EXPECT_NEAR(r.score, 0.7, 1e-9);
  EXPECT_EQ(r.status, CompositionStatus::Good);
  EXPECT_NE(r.suggestion.find("Looking good"), std::string::npos);
}

TEST(RuleOfThirdsServiceTest, LargeSubjectToleranceIsWider) {
  RuleOfThirdsService svc;
  const auto small = svc.evaluate(observationAt(0.4, 0.4, 0.1, 0.1), kFrame1000);
  const auto large = svc.evaluate(observationAt(0.4, 0.4, 0.7, 0.7), kFrame1000);
  ASSERT_EQ(small.context.sizeClass, SizeClass::Small);
  ASSERT_EQ(large.context.sizeClass, SizeClass::Large);
  EXPECT_GE(large.score, small.score);
}

TEST(RuleOfThirdsServiceTest, ToleranceBySize) {
  RuleOfThirdsService svc;
  EXPECT_DOUBLE_EQ(svc.toleranceFor(SizeClass::Small), 0.12);
  EXPECT_DOUBLE_EQ(svc.toleranceFor(SizeClass::Medium), 0.15);
  EXPECT_DOUBLE_EQ(svc.toleranceFor(SizeClass::Large), 0.18);
}

TEST(RuleOfThirdsServiceTest, NearestIntersectionNames) {
  EXPECT_STREQ(RuleOfThirdsService::thirdName(RuleOfThirdsService::nearestIntersection({0.3, 0.3})), "top-left");
  EXPECT_STREQ(RuleOfThirdsService::thirdName(RuleOfThirdsService::nearestIntersection({0.7, 0.3})), "top-right");
  EXPECT_STREQ(RuleOfThirdsService::thirdName(RuleOfThirdsService::nearestIntersection({0.3, 0.7})), "bottom-left");
  EXPECT_STREQ(RuleOfThirdsService::thirdName(RuleOfThirdsService::nearestIntersection({0.7, 0.7})), "bottom-right");
}

TEST(RuleOfThirdsServiceTest, EdgeHazardTakesPrecedence) {
  RuleOfThirdsService svc;
  SubjectObservation obs;
  obs.box = cv::Rect2d(0.0, 0.3, 0.2, 0.2);
  obs.kind = SubjectKind::Face;
  const auto r = svc.evaluate(obs, kFrame1000);
  ASSERT_NE(r.status, CompositionStatus::Perfect);
  EXPECT_EQ(r.suggestion.rfind("Step back", 0), 0u);
  EXPECT_NE(r.suggestion.find("left"), std::string::npos);
}

TEST(RuleOfThirdsServiceTest, ScoreAlwaysInUnitRange) {
  RuleOfThirdsService svc;
  for (double x = 0.05; x < 1.0; x += 0.1) {
    for (double y = 0.05; y < 1.0; y += 0.1) {
      const auto r = svc.evaluate(observationAt(x, y), kFrame1000);
      EXPECT_GE(r.score, 0.0);
      EXPECT_LE(r.score, 1.0);
    }
  }
}

}  // namespace
