#pragma once
#include <string>
#include <opencv2/core.hpp>
#include "include/overlay_types.hpp"

enum class Anchor {
	TopLeft, TopCenter, TopRight,
	CenterLeft, Center, CenterRight,
	BottomLeft, BottomCenter, BottomRight
};

// 오버레이 기술자를 BGR 프레임 위에 그린다 (알파 블렌딩)
void drawOverlays(cv::Mat& frame, const OverlayList& overlays);

void drawSuggestion(cv::Mat& frame,
					const std::string& text,
					Anchor anchor,
					int margin,
					double fontScale = 0.7,
					const cv::Scalar& fg = cv::Scalar(255, 255, 255),
					const cv::Scalar& bg = cv::Scalar(0, 0, 0),
					double bgAlpha = 0.6);
