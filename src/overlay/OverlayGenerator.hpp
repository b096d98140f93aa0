#pragma once
#include <opencv2/core.hpp>
#include "include/types.hpp"
#include "include/overlay_types.hpp"
#include "include/compose_params.hpp"

// 결과 -> 오버레이 기술자 (순수 함수, 상태 없음)
class OverlayGenerator {
public:
	struct Params {
		double	gridOpacity			= 0.6;
		double	crosshairOpacity	= 0.8;
		double	crosshairSize		= 24.0;
		double	symmetryOpacity		= 0.4;
		double	safetyInset			= 0.05;		// 프레임 폭 비율
		double	safetyOpacity		= 0.7;
		double	warningMargin		= compose::EDGE_CRITICAL;
		float	strokeWidth			= 1.0f;
	};

	OverlayGenerator() = default;
	explicit OverlayGenerator(const Params& p) : p_(p) {}

	OverlayList generate(const CompositionResult& result,
						 const CompositionContext& context,
						 const cv::Size& frameSize) const;

	// 규칙별 정적 가이드만
	OverlayList basicOverlays(CompositionType type, const cv::Size& frameSize) const;

	GridOverlay			thirdsGrid(const cv::Size& frameSize, const cv::Scalar& color) const;
	CrosshairOverlay	crosshair(const cv::Size& frameSize, const cv::Scalar& color) const;
	SymmetryLineOverlay symmetryLine(const cv::Size& frameSize, const cv::Scalar& color) const;
	SafetyZoneOverlay	safetyZone(const EdgeProximity& ep, const cv::Size& frameSize) const;

	static cv::Scalar guideColor(CompositionStatus status);

private:
	void appendGuide(OverlayList& out, CompositionType type,
					 const cv::Size& frameSize, const cv::Scalar& color) const;

	Params p_;
};
