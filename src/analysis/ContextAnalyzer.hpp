#pragma once
#include <opencv2/core.hpp>
#include "include/types.hpp"

// 규칙 독립 컨텍스트 (크기/오프셋/가장자리/헤드룸). 상태 없음.
class ContextAnalyzer {
public:
	CompositionContext analyze(const SubjectObservation& obs, const cv::Size& frameSize) const;

	static SizeClass classifySize(double areaFraction);
	static EdgeProximity edgeProximity(const cv::Rect2d& box);
	static Headroom headroom(const cv::Rect2d& box);
};
