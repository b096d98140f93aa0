#include "overlay/OverlayGenerator.hpp"
#include <algorithm>

namespace {
// BGR
const cv::Scalar kWhite(255, 255, 255);
const cv::Scalar kGreen(0, 200, 0);
const cv::Scalar kCyan(255, 255, 0);
const cv::Scalar kAmber(0, 191, 255);
const cv::Scalar kRed(0, 0, 255);
}

cv::Scalar OverlayGenerator::guideColor(CompositionStatus status)
{
	return status == CompositionStatus::Perfect ? kGreen : kWhite;
}

GridOverlay OverlayGenerator::thirdsGrid(const cv::Size& frameSize, const cv::Scalar& color) const
{
	const double w = frameSize.width;
	const double h = frameSize.height;

	GridOverlay g;
	for (int i = 1; i <= 2; ++i) {
		const double x = w * i / 3.0;
		const double y = h * i / 3.0;
		g.lines.push_back({ cv::Point2d(x, 0.0), cv::Point2d(x, h) });
		g.lines.push_back({ cv::Point2d(0.0, y), cv::Point2d(w, y) });
	}
	g.style = { color, p_.gridOpacity, p_.strokeWidth };
	return g;
}

CrosshairOverlay OverlayGenerator::crosshair(const cv::Size& frameSize, const cv::Scalar& color) const
{
	CrosshairOverlay c;
	c.center = cv::Point2d(frameSize.width * 0.5, frameSize.height * 0.5);
	c.size = p_.crosshairSize;
	c.style = { color, p_.crosshairOpacity, p_.strokeWidth * 2.0f };
	return c;
}

SymmetryLineOverlay OverlayGenerator::symmetryLine(const cv::Size& frameSize, const cv::Scalar& color) const
{
	SymmetryLineOverlay s;
	s.x = frameSize.width * 0.5;
	s.height = frameSize.height;
	s.style = { color, p_.symmetryOpacity, p_.strokeWidth };
	return s;
}

SafetyZoneOverlay OverlayGenerator::safetyZone(const EdgeProximity& ep, const cv::Size& frameSize) const
{
	const double inset = frameSize.width * p_.safetyInset;

	SafetyZoneOverlay z;
	z.rect = cv::Rect2d(inset, inset,
						std::max(0.0, frameSize.width - 2.0 * inset),
						std::max(0.0, frameSize.height - 2.0 * inset));

	const bool critical = ep.marginFraction < p_.warningMargin || ep.dangerousEdges.size() >= 2;
	z.severity = critical ? SafetySeverity::Warning : SafetySeverity::Caution;
	z.style = { critical ? kRed : kAmber, p_.safetyOpacity, p_.strokeWidth * 2.0f };
	return z;
}

void OverlayGenerator::appendGuide(OverlayList& out, CompositionType type,
								   const cv::Size& frameSize, const cv::Scalar& color) const
{
	switch (type) {
		case CompositionType::RuleOfThirds:
			out.emplace_back(thirdsGrid(frameSize, color));
			break;
		case CompositionType::CenterFraming:
			out.emplace_back(crosshair(frameSize, color));
			break;
		case CompositionType::Symmetry:
			// 대칭선은 시안 고정, Perfect 일 때만 초록
			out.emplace_back(symmetryLine(frameSize, color == kGreen ? kGreen : kCyan));
			break;
	}
}

OverlayList OverlayGenerator::basicOverlays(CompositionType type, const cv::Size& frameSize) const
{
	OverlayList out;
	if (frameSize.width <= 0 || frameSize.height <= 0) return out;

	appendGuide(out, type, frameSize, kWhite);
	return out;
}

OverlayList OverlayGenerator::generate(const CompositionResult& result,
									   const CompositionContext& context,
									   const cv::Size& frameSize) const
{
	OverlayList out;
	if (frameSize.width <= 0 || frameSize.height <= 0) return out;

	appendGuide(out, result.compositionType, frameSize, guideColor(result.status));

	if (context.edgeProximity.tooClose) {
		out.emplace_back(safetyZone(context.edgeProximity, frameSize));
	}
	return out;
}
