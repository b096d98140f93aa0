#include "analysis/SymmetryAnalyzer.hpp"
#include "log/compose_logging.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

Balance SymmetryAnalyzer::classifyBalance(double imbalance, double threshold)
{
	if (std::abs(imbalance) <= threshold) return Balance::Balanced;
	return imbalance > 0.0 ? Balance::LeftWeighted : Balance::RightWeighted;
}

bool SymmetryAnalyzer::toLuma(const cv::Mat& src, cv::Mat& luma) const
{
	if (src.empty() || src.depth() != CV_8U) return false;

	cv::Mat gray;
	switch (src.channels()) {
		case 1: gray = src; break;
		case 3: cv::cvtColor(src, gray, cv::COLOR_BGR2GRAY); break;
		case 4: cv::cvtColor(src, gray, cv::COLOR_BGRA2GRAY); break;
		default: return false;
	}

	const int n = std::max(2, p_.sampleSize);
	cv::resize(gray, luma, cv::Size(n, n), 0, 0, cv::INTER_AREA);
	return true;
}

SymmetryMeasure SymmetryAnalyzer::measure(const cv::Mat& pixels) const
{
	SymmetryMeasure m;
	cv::Mat luma;
	if (!toLuma(pixels, luma)) {
		qCDebug(LC_COMPOSE) << "[SymmetryAnalyzer] unsupported pixels"
							<< "type=" << pixels.type() << "empty=" << pixels.empty();
		return m;
	}

	const int w = luma.cols;
	const int half = w / 2;
	double totalDiff = 0.0;
	double leftMass = 0.0;
	double rightMass = 0.0;
	long samples = 0;

	for (int y = 0; y < luma.rows; ++y) {
		const uchar* row = luma.ptr<uchar>(y);
		for (int x = 0; x < half; ++x) {
			const double l = row[x];
			const double r = row[w - 1 - x];
			totalDiff += std::abs(l - r);
			leftMass += l;
			rightMass += r;
			++samples;
		}
	}
	if (samples == 0) return m;

	const double avgDiff = totalDiff / static_cast<double>(samples);
	m.similarity = std::clamp(1.0 - avgDiff / 255.0, 0.0, 1.0);

	const double mass = leftMass + rightMass;
	m.imbalance = mass > 0.0 ? (leftMass - rightMass) / mass : 0.0;
	m.balance = classifyBalance(m.imbalance, p_.balanceThreshold);
	m.valid = true;
	return m;
}
