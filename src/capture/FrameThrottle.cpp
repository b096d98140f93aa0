#include "capture/FrameThrottle.hpp"

void FrameThrottle::restart(qint64 nowMs)
{
	started_ = true;
	startMs_ = nowMs;
	frameCount_ = 0;
}

bool FrameThrottle::accept(qint64 nowMs)
{
	if (!started_) return false;

	// 센서 안정화 구간은 카운트하지 않음
	if (nowMs - startMs_ < p_.warmupMs) return false;

	++frameCount_;
	const int n = p_.everyNth > 0 ? p_.everyNth : 1;
	return (frameCount_ % static_cast<uint64_t>(n)) == 0;
}
