#pragma once
#include <string>
#include <opencv2/core.hpp>
#include "analysis/ContextAnalyzer.hpp"
#include "analysis/SymmetryAnalyzer.hpp"
#include "include/types.hpp"

// 중앙 구도. 중앙에 있으면 대칭 보너스 (픽셀 있을 때만)
class CenterFramingService {
public:
	static constexpr CompositionType kType = CompositionType::CenterFraming;

	struct Params {
		double tolerance		= 0.12;		// 중앙까지 유클리드 거리
		double insideFloor		= 0.7;		// 허용 범위 안 최소 점수
		double symmetryMin		= 0.8;		// 보너스 적용 최소 유사도
		double symmetryWeight	= 0.2;
		double directionThr		= 0.05;
	};

	CenterFramingService() = default;
	explicit CenterFramingService(const Params& p) : p_(p) {}

	const char* name() const { return "Center Framing"; }
	const Params& params() const { return p_; }

	CompositionResult evaluate(const SubjectObservation& obs,
							   const cv::Size& frameSize,
							   const cv::Mat& pixels = cv::Mat()) const;

	// 위치만으로 계산한 점수 [0,1]
	double offsetScore(const cv::Point2d& center) const;
	bool isCentered(const cv::Point2d& center) const;

	// 피사체 오프셋 방향 그대로 카메라 이동 ("right", "left and down")
	std::string directionHint(const cv::Point2d& center) const;

private:
	Params p_;
	ContextAnalyzer analyzer_;
	SymmetryAnalyzer symmetry_;
};
