#include "compose/CompositionManager.hpp"
#include "log/compose_logging.hpp"

#include <QMutexLocker>

namespace {
constexpr double kScoreTieEps = 1e-9;

// 동점 우선순위 순서
constexpr std::array<CompositionType, 3> kAllTypes = {
	CompositionType::RuleOfThirds,
	CompositionType::CenterFraming,
	CompositionType::Symmetry
};
}

CompositionManager::CompositionManager(CompositionType initial, QObject* parent)
	: QObject(parent),
	  rules_{ makeCompositionRule(CompositionType::RuleOfThirds),
			  makeCompositionRule(CompositionType::CenterFraming),
			  makeCompositionRule(CompositionType::Symmetry) },
	  type_(initial)
{
	qRegisterMetaType<CompositionResult>("CompositionResult");
	qRegisterMetaType<CompositionType>("CompositionType");
}

bool CompositionManager::isValidFrame(const cv::Size& frameSize)
{
	return frameSize.width > 0 && frameSize.height > 0;
}

CompositionResult CompositionManager::neutralResult(CompositionType type)
{
	CompositionResult r;
	r.compositionType = type;
	r.score = 0.0;
	r.status = CompositionStatus::NeedsAdjustment;
	r.basicOnly = true;
	return r;
}

const CompositionRule& CompositionManager::ruleFor(CompositionType type) const
{
	return rules_[static_cast<size_t>(type)];
}

const char* CompositionManager::currentServiceName() const
{
	return compositionRuleName(ruleFor(type_.load()));
}

std::optional<CompositionResult> CompositionManager::compute(const SubjectObservation& obs,
															 const cv::Size& frameSize,
															 const cv::Mat& pixels) const
{
	const CompositionType type = type_.load();
	if (!obs.hasSubject()) return neutralResult(type);

	return evaluateRule(ruleFor(type), obs, frameSize, pixels);
}

bool CompositionManager::publish(const CompositionResult& result, bool sequenced)
{
	{
		QMutexLocker lk(&mtx_);
		// 비활성화와 경합 시 발행하지 않음
		if (!enabled_.load()) return false;
		if (sequenced) {
			if (result.frameSeq <= lastSeq_) return false;
			lastSeq_ = result.frameSeq;
		}
		last_ = result;
	}
	emit resultPublished(result);
	return true;
}

std::optional<CompositionResult> CompositionManager::evaluate(const SubjectObservation& obs,
															  const cv::Size& frameSize,
															  const cv::Mat& pixels)
{
	if (!isValidFrame(frameSize)) {
		qCWarning(LC_COMPOSE) << "[Manager] invalid frame size" << frameSize.width << "x" << frameSize.height;
		return std::nullopt;
	}
	if (!enabled_.load()) return neutralResult(type_.load());

	auto r = compute(obs, frameSize, pixels);
	if (r) publish(*r, false);
	return r;
}

std::optional<CompositionResult> CompositionManager::evaluateFrame(uint64_t frameSeq,
																   const SubjectObservation& obs,
																   const cv::Size& frameSize,
																   const cv::Mat& pixels,
																   bool* published)
{
	if (published) *published = false;

	if (!isValidFrame(frameSize)) {
		qCWarning(LC_COMPOSE) << "[Manager] invalid frame size" << frameSize.width << "x" << frameSize.height
							  << "seq=" << frameSeq;
		return std::nullopt;
	}
	if (!enabled_.load()) {
		auto n = neutralResult(type_.load());
		n.frameSeq = frameSeq;
		return n;
	}

	auto r = compute(obs, frameSize, pixels);
	if (!r) return r;

	r->frameSeq = frameSeq;
	const bool ok = publish(*r, true);
	if (!ok) {
		qCDebug(LC_COMPOSE) << "[Manager] stale result dropped seq=" << frameSeq
							<< "last=" << lastPublishedSeq();
	}
	if (published) *published = ok;
	return r;
}

void CompositionManager::switchToCompositionType(CompositionType type)
{
	const CompositionType prev = type_.exchange(type);
	if (prev == type) return;

	qCInfo(LC_COMPOSE) << "[Manager] composition type ->" << currentServiceName();
	emit compositionTypeChanged(type);
}

void CompositionManager::setEnabled(bool on)
{
	const bool prev = enabled_.exchange(on);
	if (!on) {
		QMutexLocker lk(&mtx_);
		last_.reset();
	}
	if (prev == on) return;

	qCInfo(LC_COMPOSE) << "[Manager] analysis" << (on ? "enabled" : "disabled");
	emit enabledChanged(on);
}

void CompositionManager::toggleEnabled()
{
	setEnabled(!enabled_.load());
}

std::optional<CompositionResult> CompositionManager::lastResult() const
{
	QMutexLocker lk(&mtx_);
	return last_;
}

uint64_t CompositionManager::lastPublishedSeq() const
{
	QMutexLocker lk(&mtx_);
	return lastSeq_;
}

std::optional<CompositionResult> CompositionManager::getBestCompositionSuggestion(const SubjectObservation& obs,
																				  const cv::Size& frameSize,
																				  const cv::Mat& pixels) const
{
	if (!isValidFrame(frameSize) || !obs.hasSubject()) return std::nullopt;

	std::optional<CompositionResult> best;
	for (CompositionType type : kAllTypes) {
		CompositionResult r = evaluateRule(ruleFor(type), obs, frameSize, pixels);
		// 엄격히 클 때만 교체 -> 앞선 규칙이 동점 승리
		if (!best || r.score > best->score + kScoreTieEps) best = std::move(r);
	}
	return best;
}

std::map<CompositionType, double> CompositionManager::getAllCompositionScores(const SubjectObservation& obs,
																			  const cv::Size& frameSize,
																			  const cv::Mat& pixels) const
{
	std::map<CompositionType, double> scores;
	if (!isValidFrame(frameSize) || !obs.hasSubject()) return scores;

	for (CompositionType type : kAllTypes) {
		scores[type] = evaluateRule(ruleFor(type), obs, frameSize, pixels).score;
	}
	return scores;
}

OverlayList CompositionManager::getBasicOverlays(const cv::Size& frameSize) const
{
	if (!enabled_.load()) return {};
	return overlays_.basicOverlays(type_.load(), frameSize);
}
