#pragma once
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>
#include "include/states.hpp"

namespace compose {

inline double clamp01(double v) { return std::max(0.0, std::min(1.0, v)); }

// score 초과 여부로 상태 결정
inline CompositionStatus statusForScore(double score, double perfectAbove, double goodAbove)
{
	if (score > perfectAbove) return CompositionStatus::Perfect;
	if (score > goodAbove) return CompositionStatus::Good;
	return CompositionStatus::NeedsAdjustment;
}

// 피사체가 치우친 방향 ("right", "left and down" ...). 임계 미만 축은 생략.
inline std::string directionWords(double dx, double dy, double threshold)
{
	const bool h = std::abs(dx) > threshold;
	const bool v = std::abs(dy) > threshold;
	const std::string hs = dx > 0.0 ? "right" : "left";
	const std::string vs = dy > 0.0 ? "down" : "up";		// 이미지 좌표: y 아래로 증가

	if (h && v) return hs + " and " + vs;
	if (h) return hs;
	if (v) return vs;
	return {};
}

inline const char* edgeName(FrameEdge e)
{
	switch (e) {
		case FrameEdge::Top:	return "top";
		case FrameEdge::Bottom: return "bottom";
		case FrameEdge::Left:	return "left";
		case FrameEdge::Right:	return "right";
	}
	return "";
}

inline std::string stepBackHint(const std::vector<FrameEdge>& edges)
{
	std::string s = "Step back, subject is near the ";
	for (size_t i = 0; i < edges.size(); ++i) {
		if (i > 0) s += (i + 1 == edges.size()) ? " and " : ", ";
		s += edgeName(edges[i]);
	}
	s += edges.size() > 1 ? " edges" : " edge";
	return s;
}

}	// namespace compose
