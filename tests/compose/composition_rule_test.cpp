// Tests for compose/CompositionRule -- variant construction and dispatch.

#include "compose/CompositionRule.hpp"

#include <gtest/gtest.h>

#include <variant>

#include "test_helpers.h"

namespace {

using test_helpers::kFrame1000;
using test_helpers::observationAt;

TEST(CompositionRuleTest, MakeRuleHoldsMatchingService) {
  EXPECT_TRUE(std::holds_alternative<RuleOfThirdsService>(makeCompositionRule(CompositionType::RuleOfThirds)));
  EXPECT_TRUE(std::holds_alternative<CenterFramingService>(makeCompositionRule(CompositionType::CenterFraming)));
  EXPECT_TRUE(std::holds_alternative<SymmetryService>(makeCompositionRule(CompositionType::Symmetry)));
}

TEST(CompositionRuleTest, TypeOfRoundTrips) {
  for (auto type : {CompositionType::RuleOfThirds, CompositionType::CenterFraming, CompositionType::Symmetry}) {
    EXPECT_EQ(compositionTypeOf(makeCompositionRule(type)), type);
  }
}

TEST(CompositionRuleTest, RuleNames) {
  EXPECT_STREQ(compositionRuleName(makeCompositionRule(CompositionType::RuleOfThirds)), "Rule of Thirds");
  EXPECT_STREQ(compositionRuleName(makeCompositionRule(CompositionType::CenterFraming)), "Center Framing");
  EXPECT_STREQ(compositionRuleName(makeCompositionRule(CompositionType::Symmetry)), "Symmetry");
}

TEST(CompositionRuleTest, EvaluateDispatchesToActiveService) {
  const auto obs = observationAt(0.6, 0.5);
  const auto viaRule = evaluateRule(makeCompositionRule(CompositionType::CenterFraming), obs, kFrame1000);
  const auto direct = CenterFramingService().evaluate(obs, kFrame1000);

  EXPECT_EQ(viaRule.compositionType, CompositionType::CenterFraming);
  EXPECT_DOUBLE_EQ(viaRule.score, direct.score);
  EXPECT_EQ(viaRule.suggestion, direct.suggestion);
}

TEST(CompositionRuleTest, PixelsReachSymmetryService) {
  const auto r = evaluateRule(makeCompositionRule(CompositionType::Symmetry), observationAt(0.5, 0.5), kFrame1000,
                              test_helpers::leftHeavyImage());
  ASSERT_TRUE(r.symmetry.has_value());
  EXPECT_FALSE(r.context.reducedConfidence);
  EXPECT_EQ(r.symmetry->balance, Balance::LeftWeighted);
}

}  // namespace
