#pragma once

// Qt
#include <QObject>
#include <QThread>
#include <QMutex>
#include <QElapsedTimer>

// STL
#include <atomic>
#include <optional>

// OpenCV
#include <opencv2/core.hpp>

#include "capture/FrameThrottle.hpp"
#include "include/capture/LatestFrameMailbox.hpp"
#include "compose/CompositionManager.hpp"
#include "detect/SubjectDetector.hpp"
#include "overlay/OverlayGenerator.hpp"
#include "include/types.hpp"
#include "include/overlay_types.hpp"

// 프레임 -> 검출 -> 평가 -> 오버레이 -> 발행 (워커 스레드 1개)
class CompositionPipeline : public QObject {
	Q_OBJECT
public:
	struct Params {
		FrameThrottle::Params throttle;
		double	budgetMs = compose::BUDGET_MS;
		bool	dropSupersededResults = true;
	};

	CompositionPipeline(SubjectDetector& detector,
						CompositionManager& manager,
						const Params& p,
						QObject* parent = nullptr);
	~CompositionPipeline() override;

	bool start();
	void stop();
	bool isRunning() const { return running_.load(); }

	// 카메라 재시작 시 워밍업부터 다시
	void restartThrottle();
	void restartThrottleAt(qint64 nowMs);

	// 스로틀 통과 시 메일박스에 게시하고 true
	bool submitFrameAt(const cv::Mat& bgr, qint64 nowMs);

	// 동기 처리 (워커 루프와 테스트에서 사용)
	std::optional<CompositionResult> processFrame(uint64_t seq, const cv::Mat& bgr);

	uint64_t framesAccepted() const  { return accepted_.load(); }
	uint64_t framesProcessed() const { return processed_.load(); }
	uint64_t resultsDiscarded() const { return discarded_.load(); }
	uint64_t overBudgetCount() const { return overBudget_.load(); }

	const LatestFrameMailbox& mailbox() const { return mailbox_; }
	const Params& params() const { return p_; }

public slots:
	void submitFrame(const cv::Mat& bgr);

signals:
	void resultReady(const CompositionResult& result, const OverlayList& overlays);
	void basicOverlaysReady(const OverlayList& overlays);
	void frameDiscarded(quint64 seq);

private:
	void loop();
	void discard(uint64_t seq, const char* why);

	SubjectDetector&	detector_;
	CompositionManager& manager_;
	OverlayGenerator	overlays_;
	Params				p_;

	QMutex				throttleMu_;
	FrameThrottle		throttle_;
	LatestFrameMailbox	mailbox_;
	QElapsedTimer		clock_;				// 단조 시계 (submitFrame)

	QThread*			worker_ = nullptr;
	std::atomic_bool	running_{false};

	std::atomic<uint64_t> accepted_{0};
	std::atomic<uint64_t> processed_{0};
	std::atomic<uint64_t> discarded_{0};
	std::atomic<uint64_t> overBudget_{0};
};
