#include "compose/SymmetryService.hpp"
#include "compose/ScoreUtil.hpp"
#include "log/compose_logging.hpp"

Balance SymmetryService::balanceFromCenter(double cx) const
{
	if (cx < p_.leftBelow) return Balance::LeftWeighted;
	if (cx > p_.rightAbove) return Balance::RightWeighted;
	return Balance::Balanced;
}

std::string SymmetryService::suggestionFor(CompositionStatus status, Balance balance)
{
	// 무거운 쪽으로 카메라를 돌리면 무게가 중앙으로 온다
	if (status == CompositionStatus::Perfect) return "So balanced! Hold steady";

	if (status == CompositionStatus::Good) {
		switch (balance) {
			case Balance::LeftWeighted:		return "Good balance, pan slightly left";
			case Balance::RightWeighted:	return "Good balance, pan slightly right";
			case Balance::Balanced:			return "Good balance, level the camera";
		}
	}

	switch (balance) {
		case Balance::LeftWeighted:		return "Left side is heavier, pan left";
		case Balance::RightWeighted:	return "Right side is heavier, pan right";
		case Balance::Balanced:			break;
	}
	return "Level the camera and line up the center axis";
}

CompositionResult SymmetryService::evaluate(const SubjectObservation& obs,
											const cv::Size& frameSize,
											const cv::Mat& pixels) const
{
	CompositionResult r;
	r.compositionType = kType;
	r.context = analyzer_.analyze(obs, frameSize);

	SymmetryMeasure m;
	if (!pixels.empty()) m = symmetry_.measure(pixels);

	if (m.valid) {
		r.score = compose::clamp01(m.similarity);
		r.symmetry = SymmetryDetail{ m.similarity, m.balance };
	} else {
		// 픽셀 없음: bbox 위치만
		const cv::Point2d c = obs.center();
		r.score = center_.offsetScore(c);
		r.symmetry = SymmetryDetail{ r.score, balanceFromCenter(c.x) };
		r.context.reducedConfidence = true;
		qCDebug(LC_COMPOSE) << "[Symmetry] no pixel data, geometry fallback";
	}

	r.status = compose::statusForScore(r.score, p_.perfectAbove, p_.goodAbove);
	r.suggestion = suggestionFor(r.status, r.symmetry->balance);

	qCDebug(LC_COMPOSE) << "[Symmetry] score=" << r.score
						<< "balance=" << static_cast<int>(r.symmetry->balance)
						<< "reduced=" << r.context.reducedConfidence;
	return r;
}
