// Tests for analysis/SymmetryAnalyzer -- mirror similarity and luminance balance.

#include "analysis/SymmetryAnalyzer.hpp"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace {

TEST(SymmetryAnalyzerTest, MirroredImageIsFullySymmetric) {
  SymmetryAnalyzer analyzer;
  const auto m = analyzer.measure(test_helpers::mirroredImage());
  ASSERT_TRUE(m.valid);
  EXPECT_NEAR(m.similarity, 1.0, 1e-6);
  EXPECT_NEAR(m.imbalance, 0.0, 1e-6);
  EXPECT_EQ(m.balance, Balance::Balanced);
}

TEST(SymmetryAnalyzerTest, HalfWhiteHalfBlack) {
  SymmetryAnalyzer analyzer;
  const auto m = analyzer.measure(test_helpers::leftHeavyImage());
  ASSERT_TRUE(m.valid);
  EXPECT_NEAR(m.similarity, 0.0, 1e-6);
  EXPECT_NEAR(m.imbalance, 1.0, 1e-6);
  EXPECT_EQ(m.balance, Balance::LeftWeighted);
}

TEST(SymmetryAnalyzerTest, RightHeavyImage) {
  cv::Mat img = test_helpers::leftHeavyImage();
  cv::flip(img, img, 1);
  SymmetryAnalyzer analyzer;
  const auto m = analyzer.measure(img);
  ASSERT_TRUE(m.valid);
  EXPECT_EQ(m.balance, Balance::RightWeighted);
}

TEST(SymmetryAnalyzerTest, AcceptsGrayAndBgra) {
  SymmetryAnalyzer analyzer;
  cv::Mat gray(100, 160, CV_8UC1, cv::Scalar(90));
  cv::Mat bgra(100, 160, CV_8UC4, cv::Scalar(10, 20, 30, 255));
  EXPECT_TRUE(analyzer.measure(gray).valid);
  EXPECT_TRUE(analyzer.measure(bgra).valid);
  EXPECT_NEAR(analyzer.measure(gray).similarity, 1.0, 1e-6);
}

TEST(SymmetryAnalyzerTest, RejectsMissingOrUnsupportedPixels) {
  SymmetryAnalyzer analyzer;
  EXPECT_FALSE(analyzer.measure(cv::Mat()).valid);
  EXPECT_FALSE(analyzer.measure(cv::Mat(64, 64, CV_32FC1, cv::Scalar(0.5))).valid);
}

TEST(SymmetryAnalyzerTest, BlackFrameIsBalanced) {
  SymmetryAnalyzer analyzer;
  const auto m = analyzer.measure(test_helpers::uniformImage(64, 0));
  ASSERT_TRUE(m.valid);
  EXPECT_DOUBLE_EQ(m.imbalance, 0.0);
  EXPECT_EQ(m.balance, Balance::Balanced);
}

TEST(SymmetryAnalyzerTest, ClassifyBalanceThreshold) {
  EXPECT_EQ(SymmetryAnalyzer::classifyBalance(0.05, 0.05), Balance::Balanced);
  EXPECT_EQ(SymmetryAnalyzer::classifyBalance(-0.05, 0.05), Balance::Balanced);
  EXPECT_EQ(SymmetryAnalyzer::classifyBalance(0.06, 0.05), Balance::LeftWeighted);
  EXPECT_EQ(SymmetryAnalyzer::classifyBalance(-0.06, 0.05), Balance::RightWeighted);
}

}  // namespace
