#include "compose/RuleOfThirdsService.hpp"
#include "compose/ScoreUtil.hpp"
#include "log/compose_logging.hpp"
#include <array>
#include <cmath>

namespace {
// 이미지 좌표 (y 아래로 증가)
constexpr double kOne = 1.0 / 3.0;
constexpr double kTwo = 2.0 / 3.0;

const std::array<cv::Point2d, 4> kIntersections = {
	cv::Point2d(kOne, kOne),		// top-left
	cv::Point2d(kTwo, kOne),		// top-right
	cv::Point2d(kOne, kTwo),		// bottom-left
	cv::Point2d(kTwo, kTwo)			// bottom-right
};
const std::array<const char*, 4> kNames = { "top-left", "top-right", "bottom-left", "bottom-right" };
}	// namespace

cv::Point2d RuleOfThirdsService::intersection(int idx)
{
	return kIntersections.at(static_cast<size_t>(idx));
}

const char* RuleOfThirdsService::thirdName(int idx)
{
	return kNames.at(static_cast<size_t>(idx));
}

int RuleOfThirdsService::nearestIntersection(const cv::Point2d& center)
{
	// 동률이면 앞쪽 (top-left 우선). 1/3, 2/3 반올림 오차는 동률로 본다
	constexpr double kTieEps = 1e-9;
	int best = 0;
	double bestDist = cv::norm(center - kIntersections[0]);
	for (int i = 1; i < static_cast<int>(kIntersections.size()); ++i) {
		const double d = cv::norm(center - kIntersections[i]);
		if (d < bestDist - kTieEps) { bestDist = d; best = i; }
	}
	return best;
}

double RuleOfThirdsService::toleranceFor(SizeClass size) const
{
	switch (size) {
		case SizeClass::Small:	return p_.smallTolerance;
		case SizeClass::Medium: return p_.mediumTolerance;
		case SizeClass::Large:	return p_.largeTolerance;
	}
	return p_.smallTolerance;
}

RuleOfThirdsService::Scores RuleOfThirdsService::score(const cv::Point2d& center, double tolerance) const
{
	Scores s;
	if (tolerance <= 0.0) return s;

	s.nearest = nearestIntersection(center);
	const double dIntersection = cv::norm(center - kIntersections[s.nearest]);

	const double dLine = std::min({ std::abs(center.x - kOne), std::abs(center.x - kTwo),
									std::abs(center.y - kOne), std::abs(center.y - kTwo) });

	s.intersection = compose::clamp01(1.0 - dIntersection / tolerance);
	s.line = compose::clamp01(1.0 - dLine / tolerance);
	return s;
}

std::string RuleOfThirdsService::suggestionFor(CompositionStatus status, const Scores& s,
											   const cv::Point2d& center, const CompositionContext& ctx) const
{
	const std::string third = thirdName(s.nearest);

	if (status == CompositionStatus::Perfect) {
		return "Nailed it! Subject is on the " + third + " third";
	}
	if (ctx.edgeProximity.tooClose) {
		return compose::stepBackHint(ctx.edgeProximity.dangerousEdges);
	}
	if (status == CompositionStatus::Good) {
		if (ctx.headroom.excessive) return "Looking good, get a little closer";
		return "Looking good, nudge toward the " + third + " third";
	}

	// 피사체를 목표 교차점 쪽으로
	const cv::Point2d target = kIntersections[s.nearest];
	const std::string dir = compose::directionWords(target.x - center.x, target.y - center.y, p_.directionThr);
	if (dir.empty()) return "Move subject to the " + third + " third";
	return "Move subject " + dir + " to the " + third + " third";
}

CompositionResult RuleOfThirdsService::evaluate(const SubjectObservation& obs,
												const cv::Size& frameSize,
												const cv::Mat& /*pixels*/) const
{
	CompositionResult r;
	r.compositionType = kType;
	r.context = analyzer_.analyze(obs, frameSize);

	const cv::Point2d center = obs.center();
	const double tol = toleranceFor(r.context.sizeClass);
	const Scores s = score(center, tol);

	r.score = compose::clamp01(std::max(s.intersection, s.line * p_.lineWeight));
	r.status = compose::statusForScore(r.score, p_.perfectAbove, p_.goodAbove);
	r.suggestion = suggestionFor(r.status, s, center, r.context);

	qCDebug(LC_COMPOSE) << "[RuleOfThirds] center=" << center.x << center.y
						<< "tol=" << tol
						<< "inter=" << s.intersection << "line=" << s.line
						<< "score=" << r.score;
	return r;
}
