#pragma once

namespace compose {
	// 크기 분류 (bbox 면적 / 프레임 면적)
	inline constexpr double SMALL_AREA_MAX	= 0.15;
	inline constexpr double MEDIUM_AREA_MAX	= 0.35;

	// 가장자리 / 헤드룸
	inline constexpr double EDGE_MARGIN		= 0.03;
	inline constexpr double EDGE_CRITICAL	= 0.01;
	inline constexpr double HEADROOM_EXCESS	= 0.40;
	inline constexpr double CUTOFF_MARGIN	= 0.02;
	inline constexpr double PORTRAIT_MIN	= 0.10;
	inline constexpr double PORTRAIT_MAX	= 0.25;

	// 파이프라인 스케줄
	inline constexpr int	ANALYZE_EVERY_N	= 3;
	inline constexpr int	WARMUP_MS		= 1000;
	inline constexpr double BUDGET_MS		= 50.0;

	// 대칭 샘플링
	inline constexpr int	SYM_SAMPLE		= 64;
	inline constexpr double BALANCE_THR		= 0.05;
}
