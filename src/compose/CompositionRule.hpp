#pragma once
#include <variant>
#include <opencv2/core.hpp>
#include "compose/RuleOfThirdsService.hpp"
#include "compose/CenterFramingService.hpp"
#include "compose/SymmetryService.hpp"

// 닫힌 규칙 집합
using CompositionRule = std::variant<RuleOfThirdsService, CenterFramingService, SymmetryService>;

CompositionRule makeCompositionRule(CompositionType type);
CompositionType compositionTypeOf(const CompositionRule& rule);
const char* compositionRuleName(const CompositionRule& rule);

CompositionResult evaluateRule(const CompositionRule& rule,
							   const SubjectObservation& obs,
							   const cv::Size& frameSize,
							   const cv::Mat& pixels = cv::Mat());
