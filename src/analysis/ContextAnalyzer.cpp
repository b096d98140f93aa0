#include "analysis/ContextAnalyzer.hpp"
#include "include/compose_params.hpp"
#include <algorithm>

SizeClass ContextAnalyzer::classifySize(double areaFraction)
{
	if (areaFraction < compose::SMALL_AREA_MAX) return SizeClass::Small;
	if (areaFraction <= compose::MEDIUM_AREA_MAX) return SizeClass::Medium;
	return SizeClass::Large;
}

EdgeProximity ContextAnalyzer::edgeProximity(const cv::Rect2d& box)
{
	const double top	= box.y;
	const double bottom = 1.0 - (box.y + box.height);
	const double left	= box.x;
	const double right	= 1.0 - (box.x + box.width);

	EdgeProximity ep;
	ep.marginFraction = std::max(0.0, std::min({ top, bottom, left, right }));

	if (top    < compose::EDGE_MARGIN) ep.dangerousEdges.push_back(FrameEdge::Top);
	if (bottom < compose::EDGE_MARGIN) ep.dangerousEdges.push_back(FrameEdge::Bottom);
	if (left   < compose::EDGE_MARGIN) ep.dangerousEdges.push_back(FrameEdge::Left);
	if (right  < compose::EDGE_MARGIN) ep.dangerousEdges.push_back(FrameEdge::Right);
	ep.tooClose = !ep.dangerousEdges.empty();
	return ep;
}

Headroom ContextAnalyzer::headroom(const cv::Rect2d& box)
{
	Headroom h;
	h.ratio = std::max(0.0, box.y);
	h.excessive = h.ratio > compose::HEADROOM_EXCESS;
	h.cutoff = (1.0 - (box.y + box.height)) < compose::CUTOFF_MARGIN;
	h.optimalForPortrait = h.ratio >= compose::PORTRAIT_MIN && h.ratio <= compose::PORTRAIT_MAX;
	return h;
}

CompositionContext ContextAnalyzer::analyze(const SubjectObservation& obs, const cv::Size& frameSize) const
{
	CompositionContext ctx;
	if (frameSize.width <= 0 || frameSize.height <= 0 || !obs.hasSubject()) {
		return ctx;
	}

	// 박스는 이미 프레임 비율이므로 면적 비율 = w * h
	const cv::Rect2d& box = obs.box;
	ctx.areaFraction = box.width * box.height;
	ctx.sizeClass = classifySize(ctx.areaFraction);

	const cv::Point2d c = obs.center();
	ctx.offsetX = c.x - 0.5;
	ctx.offsetY = c.y - 0.5;

	ctx.edgeProximity = edgeProximity(box);
	ctx.headroom = headroom(box);
	ctx.multipleSubjects = false;			// 다중 bbox 검출 전까지 항상 false
	return ctx;
}
