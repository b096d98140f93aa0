#include "compose/CompositionRule.hpp"
#include <type_traits>

CompositionRule makeCompositionRule(CompositionType type)
{
	switch (type) {
		case CompositionType::RuleOfThirds:		return RuleOfThirdsService{};
		case CompositionType::CenterFraming:	return CenterFramingService{};
		case CompositionType::Symmetry:			return SymmetryService{};
	}
	return RuleOfThirdsService{};
}

CompositionType compositionTypeOf(const CompositionRule& rule)
{
	return std::visit([](const auto& svc) { return std::decay_t<decltype(svc)>::kType; }, rule);
}

const char* compositionRuleName(const CompositionRule& rule)
{
	return std::visit([](const auto& svc) { return svc.name(); }, rule);
}

CompositionResult evaluateRule(const CompositionRule& rule,
							   const SubjectObservation& obs,
							   const cv::Size& frameSize,
							   const cv::Mat& pixels)
{
	return std::visit([&](const auto& svc) { return svc.evaluate(obs, frameSize, pixels); }, rule);
}
