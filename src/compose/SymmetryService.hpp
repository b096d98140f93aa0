#pragma once
#include <string>
#include <opencv2/core.hpp>
#include "analysis/ContextAnalyzer.hpp"
#include "analysis/SymmetryAnalyzer.hpp"
#include "compose/CenterFramingService.hpp"
#include "include/types.hpp"

// 좌우 대칭. 픽셀이 없으면 위치 기반 점수로 대체 (reducedConfidence)
class SymmetryService {
public:
	static constexpr CompositionType kType = CompositionType::Symmetry;

	struct Params {
		double perfectAbove		= 0.8;
		double goodAbove		= 0.6;
		double leftBelow		= 0.45;		// 폴백: bbox 중심 x 로 균형 추정
		double rightAbove		= 0.55;
		SymmetryAnalyzer::Params analyzer;
	};

	SymmetryService() : SymmetryService(Params{}) {}
	explicit SymmetryService(const Params& p) : p_(p), symmetry_(p.analyzer) {}

	const char* name() const { return "Symmetry"; }
	const Params& params() const { return p_; }

	CompositionResult evaluate(const SubjectObservation& obs,
							   const cv::Size& frameSize,
							   const cv::Mat& pixels = cv::Mat()) const;

	Balance balanceFromCenter(double cx) const;

private:
	static std::string suggestionFor(CompositionStatus status, Balance balance);

	Params p_;
	ContextAnalyzer analyzer_;
	SymmetryAnalyzer symmetry_;
	CenterFramingService center_;
};
