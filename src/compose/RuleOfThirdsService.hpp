#pragma once
#include <string>
#include <opencv2/core.hpp>
#include "analysis/ContextAnalyzer.hpp"
#include "include/types.hpp"

// 3분할: 교차점 4개 + 분할선 4개, 크기별 허용 오차
class RuleOfThirdsService {
public:
	static constexpr CompositionType kType = CompositionType::RuleOfThirds;

	struct Params {
		double smallTolerance	= 0.12;
		double mediumTolerance	= 0.15;
		double largeTolerance	= 0.18;
		double lineWeight		= 0.7;		// 선 정렬은 교차점보다 낮게
		double perfectAbove		= 0.8;
		double goodAbove		= 0.5;
		double directionThr		= 0.05;
	};

	struct Scores {
		double	intersection = 0.0;
		double	line = 0.0;
		int		nearest = 0;				// kIntersections 인덱스
	};

	RuleOfThirdsService() = default;
	explicit RuleOfThirdsService(const Params& p) : p_(p) {}

	const char* name() const { return "Rule of Thirds"; }
	const Params& params() const { return p_; }

	CompositionResult evaluate(const SubjectObservation& obs,
							   const cv::Size& frameSize,
							   const cv::Mat& pixels = cv::Mat()) const;

	double toleranceFor(SizeClass size) const;
	Scores score(const cv::Point2d& center, double tolerance) const;

	static int nearestIntersection(const cv::Point2d& center);
	static cv::Point2d intersection(int idx);
	static const char* thirdName(int idx);

private:
	std::string suggestionFor(CompositionStatus status, const Scores& s,
							  const cv::Point2d& center, const CompositionContext& ctx) const;

	Params p_;
	ContextAnalyzer analyzer_;
};
