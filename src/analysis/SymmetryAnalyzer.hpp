#pragma once
#include <opencv2/core.hpp>
#include "include/states.hpp"
#include "include/compose_params.hpp"

struct SymmetryMeasure {
	bool	valid = false;
	double	similarity = 0.0;		// 1 - avg|L-R| / 255
	double	imbalance = 0.0;		// (left - right) / (left + right)
	Balance balance = Balance::Balanced;
};

// 좌우 거울 대칭 (64x64 휘도 샘플)
class SymmetryAnalyzer {
public:
	struct Params {
		int		sampleSize = compose::SYM_SAMPLE;
		double	balanceThreshold = compose::BALANCE_THR;
	};

	SymmetryAnalyzer() = default;
	explicit SymmetryAnalyzer(const Params& p) : p_(p) {}

	// pixels 는 호출 동안만 읽음 (BGR / BGRA / GRAY, 8bit)
	SymmetryMeasure measure(const cv::Mat& pixels) const;

	static Balance classifyBalance(double imbalance, double threshold);

private:
	bool toLuma(const cv::Mat& src, cv::Mat& luma) const;

	Params p_;
};
