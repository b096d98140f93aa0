#pragma once
#include <vector>
#include <optional>
#include <string>
#include <cstdint>
#include <QMetaType>
#include <opencv2/core.hpp>
#include "include/states.hpp"

// 백엔드 후보 (픽셀 좌표)
struct SubjectCandidate {
	cv::Rect2d box;
	float score = 0.0f;
};

// 프레임당 1개, 정규화 좌표 [0,1] (좌상단 원점)
struct SubjectObservation {
	cv::Rect2d	box;
	SubjectKind kind = SubjectKind::None;
	float		confidence = 0.0f;

	bool hasSubject() const { return kind != SubjectKind::None && box.area() > 0.0; }
	cv::Point2d center() const { return { box.x + box.width * 0.5, box.y + box.height * 0.5 }; }
};

struct EdgeProximity {
	bool					tooClose = false;
	std::vector<FrameEdge>	dangerousEdges;		// top, bottom, left, right 순서
	double					marginFraction = 0.0;
};

struct Headroom {
	double	ratio = 0.0;				// bbox 위쪽 여백 / 프레임 높이
	bool	excessive = false;
	bool	cutoff = false;				// 아래쪽 여백 부족
	bool	optimalForPortrait = false;
};

struct CompositionContext {
	SizeClass		sizeClass = SizeClass::Small;
	double			areaFraction = 0.0;
	double			offsetX = 0.0;		// 프레임 중앙 기준, 프레임 비율
	double			offsetY = 0.0;
	EdgeProximity	edgeProximity;
	Headroom		headroom;
	bool			multipleSubjects = false;
	bool			reducedConfidence = false;
};

struct SymmetryDetail {
	double	similarity = 0.0;
	Balance balance = Balance::Balanced;
};

struct CompositionResult {
	CompositionType					compositionType = CompositionType::RuleOfThirds;
	double							score = 0.0;
	CompositionStatus				status = CompositionStatus::NeedsAdjustment;
	std::string						suggestion;
	CompositionContext				context;
	std::optional<SymmetryDetail>	symmetry;
	bool							basicOnly = false;		// 비활성/피사체 없음
	uint64_t						frameSeq = 0;
};

Q_DECLARE_METATYPE(CompositionResult)
