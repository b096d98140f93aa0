// capture/FrameThrottle.hpp
#pragma once
#include <cstdint>
#include <QtGlobal>
#include "include/compose_params.hpp"

// 워밍업 이후 N 번째 프레임만 분석 대상으로 통과
class FrameThrottle {
public:
	struct Params {
		int		everyNth = compose::ANALYZE_EVERY_N;
		qint64	warmupMs = compose::WARMUP_MS;
	};

	FrameThrottle() = default;
	explicit FrameThrottle(const Params& p) : p_(p) {}

	// 카메라 (재)시작 시각
	void restart(qint64 nowMs);

	// 프레임 도착. true 면 분석
	bool accept(qint64 nowMs);

	bool isStarted() const { return started_; }
	uint64_t framesSinceWarmup() const { return frameCount_; }
	const Params& params() const { return p_; }

private:
	Params p_;
	bool started_ = false;
	qint64 startMs_ = 0;
	uint64_t frameCount_ = 0;
};
