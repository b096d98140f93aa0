#pragma once

// Qt
#include <QObject>
#include <QMutex>

// STL
#include <array>
#include <atomic>
#include <map>
#include <optional>

// OpenCV
#include <opencv2/core.hpp>

#include "compose/CompositionRule.hpp"
#include "overlay/OverlayGenerator.hpp"
#include "include/types.hpp"
#include "include/overlay_types.hpp"

// 활성 규칙 선택 + 마지막 결과 보관 + 발행
// evaluate* 는 어느 스레드에서나 호출 가능
class CompositionManager : public QObject {
	Q_OBJECT
public:
	explicit CompositionManager(CompositionType initial = CompositionType::RuleOfThirds,
								QObject* parent = nullptr);

	// 순서 없는 평가 (항상 발행). 프레임이 잘못되면 nullopt
	std::optional<CompositionResult> evaluate(const SubjectObservation& obs,
											  const cv::Size& frameSize,
											  const cv::Mat& pixels = cv::Mat());

	// frameSeq 가 마지막 발행보다 새로울 때만 발행 (last-writer-wins)
	// published: 실제 발행 여부 (nullable)
	std::optional<CompositionResult> evaluateFrame(uint64_t frameSeq,
												   const SubjectObservation& obs,
												   const cv::Size& frameSize,
												   const cv::Mat& pixels = cv::Mat(),
												   bool* published = nullptr);

	void switchToCompositionType(CompositionType type);
	CompositionType compositionType() const { return type_.load(); }
	const char* currentServiceName() const;

	void setEnabled(bool on);
	void toggleEnabled();
	bool isEnabled() const { return enabled_.load(); }

	std::optional<CompositionResult> lastResult() const;
	uint64_t lastPublishedSeq() const;

	// 세 규칙 모두 평가, 최고점 (동점: 3분할 > 중앙 > 대칭). 상태 변경 없음
	std::optional<CompositionResult> getBestCompositionSuggestion(const SubjectObservation& obs,
																  const cv::Size& frameSize,
																  const cv::Mat& pixels = cv::Mat()) const;
	std::map<CompositionType, double> getAllCompositionScores(const SubjectObservation& obs,
															  const cv::Size& frameSize,
															  const cv::Mat& pixels = cv::Mat()) const;

	OverlayList getBasicOverlays(const cv::Size& frameSize) const;

	static bool isValidFrame(const cv::Size& frameSize);
	static CompositionResult neutralResult(CompositionType type);

signals:
	void resultPublished(const CompositionResult& result);
	void compositionTypeChanged(CompositionType type);
	void enabledChanged(bool enabled);

private:
	std::optional<CompositionResult> compute(const SubjectObservation& obs,
											 const cv::Size& frameSize,
											 const cv::Mat& pixels) const;
	const CompositionRule& ruleFor(CompositionType type) const;
	bool publish(const CompositionResult& result, bool sequenced);

	// 규칙은 상태 없는 값 -> 미리 만들어 두고 인덱스로 선택
	const std::array<CompositionRule, 3> rules_;
	OverlayGenerator overlays_;

	std::atomic<CompositionType> type_;
	std::atomic_bool enabled_{true};

	mutable QMutex mtx_;
	std::optional<CompositionResult> last_;
	uint64_t lastSeq_ = 0;
};
