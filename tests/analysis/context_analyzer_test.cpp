// Tests for analysis/ContextAnalyzer -- size classes, offsets, edge proximity, headroom.

#include "analysis/ContextAnalyzer.hpp"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace {

using test_helpers::kFrame1000;
using test_helpers::observationAt;

TEST(ContextAnalyzerTest, SizeClassBoundaries) {
  EXPECT_EQ(ContextAnalyzer::classifySize(0.0), SizeClass::Small);
  EXPECT_EQ(ContextAnalyzer::classifySize(0.149), SizeClass::Small);
  EXPECT_EQ(ContextAnalyzer::classifySize(0.15), SizeClass::Medium);
  EXPECT_EQ(ContextAnalyzer::classifySize(0.35), SizeClass::Medium);
  EXPECT_EQ(ContextAnalyzer::classifySize(0.36), SizeClass::Large);
}

TEST(ContextAnalyzerTest, CenteredSmallSubject) {
  ContextAnalyzer analyzer;
  const auto ctx = analyzer.analyze(observationAt(0.5, 0.5, 0.2, 0.2), kFrame1000);

  EXPECT_NEAR(ctx.areaFraction, 0.04, 1e-9);
  EXPECT_EQ(ctx.sizeClass, SizeClass::Small);
  EXPECT_NEAR(ctx.offsetX, 0.0, 1e-9);
  EXPECT_NEAR(ctx.offsetY, 0.0, 1e-9);
  EXPECT_FALSE(ctx.edgeProximity.tooClose);
  EXPECT_TRUE(ctx.edgeProximity.dangerousEdges.empty());
  EXPECT_NEAR(ctx.edgeProximity.marginFraction, 0.4, 1e-9);
  EXPECT_FALSE(ctx.multipleSubjects);
  EXPECT_FALSE(ctx.reducedConfidence);
}

TEST(ContextAnalyzerTest, OffsetIsSignedFromFrameCenter) {
  ContextAnalyzer analyzer;
  const auto ctx = analyzer.analyze(observationAt(0.7, 0.25), kFrame1000);
  EXPECT_NEAR(ctx.offsetX, 0.2, 1e-9);
  EXPECT_NEAR(ctx.offsetY, -0.25, 1e-9);
}

TEST(ContextAnalyzerTest, LeftEdgeTooClose) {
  const auto ep = ContextAnalyzer::edgeProximity(cv::Rect2d(0.01, 0.4, 0.3, 0.3));
  EXPECT_TRUE(ep.tooClose);
  ASSERT_EQ(ep.dangerousEdges.size(), 1u);
  EXPECT_EQ(ep.dangerousEdges[0], FrameEdge::Left);
  EXPECT_NEAR(ep.marginFraction, 0.01, 1e-9);
}

TEST(ContextAnalyzerTest, CornerViolatesTwoEdges) {
  const auto ep = ContextAnalyzer::edgeProximity(cv::Rect2d(0.8, 0.0, 0.2, 0.2));
  EXPECT_TRUE(ep.tooClose);
  ASSERT_EQ(ep.dangerousEdges.size(), 2u);
  EXPECT_EQ(ep.dangerousEdges[0], FrameEdge::Top);
  EXPECT_EQ(ep.dangerousEdges[1], FrameEdge::Right);
  EXPECT_NEAR(ep.marginFraction, 0.0, 1e-9);
}

TEST(ContextAnalyzerTest, HeadroomPortraitOptimal) {
  const auto h = ContextAnalyzer::headroom(cv::Rect2d(0.3, 0.15, 0.4, 0.5));
  EXPECT_NEAR(h.ratio, 0.15, 1e-9);
  EXPECT_TRUE(h.optimalForPortrait);
  EXPECT_FALSE(h.excessive);
  EXPECT_FALSE(h.cutoff);
}

TEST(ContextAnalyzerTest, HeadroomExcessive) {
  const auto h = ContextAnalyzer::headroom(cv::Rect2d(0.4, 0.5, 0.1, 0.1));
  EXPECT_TRUE(h.excessive);
  EXPECT_FALSE(h.optimalForPortrait);
}

TEST(ContextAnalyzerTest, BottomCutoff) {
  const auto h = ContextAnalyzer::headroom(cv::Rect2d(0.3, 0.5, 0.4, 0.49));
  EXPECT_TRUE(h.cutoff);
}

TEST(ContextAnalyzerTest, NoSubjectYieldsDefaultContext) {
  ContextAnalyzer analyzer;
  SubjectObservation none;
  const auto ctx = analyzer.analyze(none, kFrame1000);
  EXPECT_EQ(ctx.sizeClass, SizeClass::Small);
  EXPECT_DOUBLE_EQ(ctx.areaFraction, 0.0);
  EXPECT_FALSE(ctx.edgeProximity.tooClose);
}

TEST(ContextAnalyzerTest, InvalidFrameYieldsDefaultContext) {
  ContextAnalyzer analyzer;
  const auto ctx = analyzer.analyze(observationAt(0.5, 0.5), cv::Size(0, 480));
  EXPECT_DOUBLE_EQ(ctx.areaFraction, 0.0);
}

}  // namespace
