#pragma once
#include <variant>
#include <vector>
#include <QMetaType>
#include <opencv2/core.hpp>
#include "include/states.hpp"

// 렌더러 독립 오버레이 기술자. 좌표는 프레임 픽셀 단위.
struct OverlayStyle {
	cv::Scalar	color{255, 255, 255};		// BGR
	double		opacity = 1.0;
	float		strokeWidth = 1.0f;

	bool operator==(const OverlayStyle&) const = default;
};

struct OverlayLine {
	cv::Point2d from;
	cv::Point2d to;

	bool operator==(const OverlayLine&) const = default;
};

struct GridOverlay {
	std::vector<OverlayLine> lines;
	OverlayStyle style;

	bool operator==(const GridOverlay&) const = default;
};

struct CrosshairOverlay {
	cv::Point2d center;
	double		size = 24.0;				// 팔 길이(px)
	OverlayStyle style;

	bool operator==(const CrosshairOverlay&) const = default;
};

struct SymmetryLineOverlay {
	double		x = 0.0;
	double		height = 0.0;
	OverlayStyle style;

	bool operator==(const SymmetryLineOverlay&) const = default;
};

struct SafetyZoneOverlay {
	cv::Rect2d		rect;
	SafetySeverity	severity = SafetySeverity::Caution;
	OverlayStyle	style;

	bool operator==(const SafetyZoneOverlay&) const = default;
};

using OverlayElement = std::variant<GridOverlay, CrosshairOverlay, SymmetryLineOverlay, SafetyZoneOverlay>;
using OverlayList	 = std::vector<OverlayElement>;

Q_DECLARE_METATYPE(OverlayList)
