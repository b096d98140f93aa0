#include "pipeline/CompositionPipeline.hpp"
#include "log/compose_logging.hpp"

#include <QMutexLocker>

CompositionPipeline::CompositionPipeline(SubjectDetector& detector,
										 CompositionManager& manager,
										 const Params& p,
										 QObject* parent)
	: QObject(parent),
	  detector_(detector),
	  manager_(manager),
	  p_(p),
	  throttle_(p.throttle)
{
	qRegisterMetaType<OverlayList>("OverlayList");
	clock_.start();
}

CompositionPipeline::~CompositionPipeline()
{
	stop();
}

bool CompositionPipeline::start()
{
	if (running_.exchange(true)) return false;

	restartThrottle();

	worker_ = QThread::create([this] {
			this->loop();
	});
	worker_->setObjectName(QStringLiteral("CompositionWorker"));
	worker_->setParent(this);			// 이벤트 루프가 없으면 파이프라인과 함께 정리
	QObject::connect(worker_, &QThread::finished, worker_, &QObject::deleteLater);
	worker_->start();

	qCInfo(LC_PIPELINE) << "[Pipeline] started, every" << p_.throttle.everyNth
						<< "frames after" << p_.throttle.warmupMs << "ms warm-up";
	return true;
}

void CompositionPipeline::stop()
{
	running_ = false;
	if (!worker_) return;

	worker_->wait();		// loop() 종료 대기
	worker_ = nullptr;		// finished 연결로 deleteLater 호출됨

	qCInfo(LC_PIPELINE) << "[Pipeline] stopped. accepted=" << framesAccepted()
						<< "processed=" << framesProcessed()
						<< "discarded=" << resultsDiscarded()
						<< "overBudget=" << overBudgetCount();
}

void CompositionPipeline::restartThrottle()
{
	restartThrottleAt(clock_.elapsed());
}

void CompositionPipeline::restartThrottleAt(qint64 nowMs)
{
	QMutexLocker lk(&throttleMu_);
	throttle_.restart(nowMs);
}

void CompositionPipeline::submitFrame(const cv::Mat& bgr)
{
	submitFrameAt(bgr, clock_.elapsed());
}

bool CompositionPipeline::submitFrameAt(const cv::Mat& bgr, qint64 nowMs)
{
	if (bgr.empty()) return false;
	{
		QMutexLocker lk(&throttleMu_);
		if (!throttle_.accept(nowMs)) return false;
	}

	const uint64_t seq = mailbox_.publish(bgr);
	++accepted_;
	qCDebug(LC_PIPELINE) << "[Pipeline] frame accepted seq=" << seq;
	return true;
}

void CompositionPipeline::discard(uint64_t seq, const char* why)
{
	++discarded_;
	qCDebug(LC_PIPELINE) << "[Pipeline] result discarded seq=" << seq << why;
	emit frameDiscarded(static_cast<quint64>(seq));
}

std::optional<CompositionResult> CompositionPipeline::processFrame(uint64_t seq, const cv::Mat& bgr)
{
	QElapsedTimer t; t.start();
	const cv::Size size = bgr.size();

	if (!CompositionManager::isValidFrame(size)) {
		qCWarning(LC_PIPELINE) << "[Pipeline] invalid frame skipped seq=" << seq;
		return std::nullopt;
	}

	const SubjectObservation obs = detector_.detect(bgr);

	// 검출 중에 더 새 프레임이 도착
	if (p_.dropSupersededResults && mailbox_.latestSeq() > seq) {
		discard(seq, "(superseded)");
		return std::nullopt;
	}

	bool published = false;
	auto r = manager_.evaluateFrame(seq, obs, size, bgr, &published);
	if (!r) return r;

	// 이미 더 새 프레임이 발행됨 (피사체 없음 결과 포함). 비활성은 그대로 통과
	if (!published && manager_.isEnabled()) {
		discard(seq, "(stale)");
		return std::nullopt;
	}
	++processed_;

	if (r->basicOnly) {
		emit basicOverlaysReady(manager_.getBasicOverlays(size));
	} else {
		emit resultReady(*r, overlays_.generate(*r, r->context, size));
	}

	const double ms = t.nsecsElapsed() / 1e6;
	if (ms > p_.budgetMs) {
		++overBudget_;
		qCWarning(LC_PIPELINE) << "[Pipeline] budget exceeded" << ms << "ms >" << p_.budgetMs
							   << "ms seq=" << seq;
	}
	return r;
}

void CompositionPipeline::loop()
{
	cv::Mat frame;
	uint64_t lastSeq = 0;

	while (running_.load()) {
		if (!mailbox_.tryConsume(frame, lastSeq)) {
			QThread::msleep(2);
			continue;
		}

		try {
			processFrame(lastSeq, frame);
		} catch (const cv::Exception& e) {
			qCWarning(LC_PIPELINE) << "[Pipeline] OpenCV error seq=" << lastSeq << e.what();
		} catch (const std::exception& e) {
			qCWarning(LC_PIPELINE) << "[Pipeline] error seq=" << lastSeq << e.what();
		}
	}
}
