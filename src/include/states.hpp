#pragma once
#include <QObject>

enum class SubjectKind {
	None = 0,		// 검출 없음 (정상 결과)
	Face,			// 얼굴 티어
	Human			// 사람(HOG) 티어
};

enum class SizeClass {
	Small = 0,		// 프레임 면적 15% 미만
	Medium,			// 15% ~ 35%
	Large			// 35% 초과
};

enum class FrameEdge { Top = 0, Bottom, Left, Right };

enum class Balance {
	Balanced = 0,
	LeftWeighted,
	RightWeighted
};

enum class CompositionType {
	RuleOfThirds = 0,
	CenterFraming,
	Symmetry
};

enum class CompositionStatus {
	Perfect = 0,
	Good,
	NeedsAdjustment
};

enum class SafetySeverity { Caution = 0, Warning };

Q_DECLARE_METATYPE(SubjectKind)
Q_DECLARE_METATYPE(CompositionType)
Q_DECLARE_METATYPE(CompositionStatus)
