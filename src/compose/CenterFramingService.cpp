#include "compose/CenterFramingService.hpp"
#include "compose/ScoreUtil.hpp"
#include "log/compose_logging.hpp"
#include <cmath>

namespace {
const cv::Point2d kCenter(0.5, 0.5);
// 중앙에서 가장 먼 지점 (모서리)
const double kMaxDist = std::sqrt(0.5);
}

bool CenterFramingService::isCentered(const cv::Point2d& center) const
{
	return cv::norm(center - kCenter) <= p_.tolerance;
}

double CenterFramingService::offsetScore(const cv::Point2d& center) const
{
	const double d = cv::norm(center - kCenter);
	if (d <= p_.tolerance) {
		const double t = p_.tolerance > 0.0 ? d / p_.tolerance : 0.0;
		return compose::clamp01(p_.insideFloor + (1.0 - p_.insideFloor) * (1.0 - t));
	}

	const double span = kMaxDist - p_.tolerance;
	if (span <= 0.0) return 0.0;
	const double falloff = std::max(0.0, 1.0 - (d - p_.tolerance) / span);
	return compose::clamp01(p_.insideFloor * falloff);
}

std::string CenterFramingService::directionHint(const cv::Point2d& center) const
{
	return compose::directionWords(center.x - kCenter.x, center.y - kCenter.y, p_.directionThr);
}

CompositionResult CenterFramingService::evaluate(const SubjectObservation& obs,
												 const cv::Size& frameSize,
												 const cv::Mat& pixels) const
{
	CompositionResult r;
	r.compositionType = kType;
	r.context = analyzer_.analyze(obs, frameSize);

	const cv::Point2d center = obs.center();
	const bool centered = isCentered(center);
	double score = offsetScore(center);
	bool bonus = false;

	if (centered && !pixels.empty()) {
		const SymmetryMeasure m = symmetry_.measure(pixels);
		if (m.valid) {
			r.symmetry = SymmetryDetail{ m.similarity, m.balance };
			if (m.similarity >= p_.symmetryMin) {
				score += p_.symmetryWeight * m.similarity;
				bonus = true;
			}
		}
	}

	r.score = compose::clamp01(score);
	if (centered && bonus)	r.status = CompositionStatus::Perfect;
	else if (centered)		r.status = CompositionStatus::Good;
	else					r.status = CompositionStatus::NeedsAdjustment;

	const std::string dir = directionHint(center);
	if (r.status == CompositionStatus::Perfect) {
		r.suggestion = "Perfect! Centered and symmetric";
	} else if (r.context.edgeProximity.tooClose) {
		r.suggestion = compose::stepBackHint(r.context.edgeProximity.dangerousEdges);
	} else if (centered) {
		r.suggestion = dir.empty() ? "Nice center!" : "Nice center! Nudge " + dir;
	} else {
		r.suggestion = dir.empty() ? "Recenter the subject" : "Move " + dir;
	}

	qCDebug(LC_COMPOSE) << "[CenterFraming] center=" << center.x << center.y
						<< "centered=" << centered << "bonus=" << bonus
						<< "score=" << r.score;
	return r;
}
