// Tests for serialize/ResultJson -- field contract, rounding and identifiers.

#include "serialize/ResultJson.hpp"

#include <gtest/gtest.h>

namespace {

CompositionResult sampleResult() {
  CompositionResult r;
  r.compositionType = CompositionType::CenterFraming;
  r.score = 0.8567;
  r.status = CompositionStatus::NeedsAdjustment;
  r.suggestion = "Move right";
  r.context.sizeClass = SizeClass::Medium;
  r.context.areaFraction = 0.2049;
  r.context.offsetX = 0.1234;
  r.context.offsetY = -0.0789;
  r.context.edgeProximity.tooClose = true;
  r.context.edgeProximity.dangerousEdges = {FrameEdge::Left};
  r.context.edgeProximity.marginFraction = 0.0149;
  r.context.headroom.ratio = 0.333;
  r.frameSeq = 42;
  return r;
}

TEST(ResultJsonTest, BasicContract) {
  const auto j = result_json::toJson(sampleResult());
  EXPECT_EQ(j.at("composition"), "center_framing");
  EXPECT_DOUBLE_EQ(j.at("score").get<double>(), 0.86);
  EXPECT_EQ(j.at("status"), "Needs Adjustment");
  EXPECT_EQ(j.at("suggestion"), "Move right");

  const auto& ctx = j.at("context");
  EXPECT_EQ(ctx.at("subjectSize"), "medium");
  EXPECT_DOUBLE_EQ(ctx.at("subjectOffsetX").get<double>(), 0.12);
  EXPECT_DOUBLE_EQ(ctx.at("subjectOffsetY").get<double>(), -0.08);
  EXPECT_EQ(ctx.at("multipleSubjects"), false);

  EXPECT_FALSE(j.contains("symmetry"));
  EXPECT_FALSE(ctx.contains("edgeProximity"));
  EXPECT_EQ(j.size(), 5u);
  EXPECT_EQ(ctx.size(), 4u);
}

TEST(ResultJsonTest, DetailedAddsContextAndSymmetry) {
  auto r = sampleResult();
  r.symmetry = SymmetryDetail{0.912, Balance::RightWeighted};
  r.context.reducedConfidence = true;

  const auto j = result_json::toJson(r, true);
  const auto& ctx = j.at("context");
  EXPECT_EQ(ctx.at("edgeProximity").at("tooClose"), true);
  EXPECT_EQ(ctx.at("edgeProximity").at("dangerousEdges"), nlohmann::json::array({"left"}));
  EXPECT_DOUBLE_EQ(ctx.at("edgeProximity").at("marginFraction").get<double>(), 0.01);
  EXPECT_DOUBLE_EQ(ctx.at("headroom").at("ratio").get<double>(), 0.33);
  EXPECT_EQ(ctx.at("reducedConfidence"), true);
  EXPECT_DOUBLE_EQ(j.at("symmetry").at("similarity").get<double>(), 0.91);
  EXPECT_EQ(j.at("symmetry").at("balance"), "right-weighted");
  EXPECT_EQ(j.at("frameSeq"), 42);
}

TEST(ResultJsonTest, StatusAndTypeStrings) {
  EXPECT_STREQ(result_json::toString(CompositionStatus::Perfect), "Perfect");
  EXPECT_STREQ(result_json::toString(CompositionStatus::Good), "Good");
  EXPECT_STREQ(result_json::toString(CompositionType::RuleOfThirds), "rule_of_thirds");
  EXPECT_STREQ(result_json::toString(CompositionType::Symmetry), "symmetry");
  EXPECT_STREQ(result_json::toString(SubjectKind::Human), "human");
}

TEST(ResultJsonTest, CompositionTypeFromString) {
  EXPECT_EQ(result_json::compositionTypeFromString("rule_of_thirds"), CompositionType::RuleOfThirds);
  EXPECT_EQ(result_json::compositionTypeFromString("center_framing"), CompositionType::CenterFraming);
  EXPECT_EQ(result_json::compositionTypeFromString("symmetry"), CompositionType::Symmetry);
  EXPECT_FALSE(result_json::compositionTypeFromString("golden_ratio").has_value());
  EXPECT_FALSE(result_json::compositionTypeFromString("").has_value());
}

TEST(ResultJsonTest, Round2) {
  EXPECT_DOUBLE_EQ(result_json::round2(0.004), 0.0);
  EXPECT_DOUBLE_EQ(result_json::round2(0.996), 1.0);
  EXPECT_DOUBLE_EQ(result_json::round2(-0.456), -0.46);
}

TEST(ResultJsonTest, StringFormParsesBack) {
  const auto r = sampleResult();
  EXPECT_EQ(nlohmann::json::parse(result_json::toJsonString(r, true)), result_json::toJson(r, true));
}

}  // namespace
