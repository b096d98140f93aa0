#include "detect/HumanDetector.hpp"
#include "log/compose_logging.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

HumanDetector::HumanDetector() : HumanDetector(Options{}) {}

HumanDetector::HumanDetector(const Options& opt) : opt_(opt)
{
	try {
		hog_.setSVMDetector(cv::HOGDescriptor::getDefaultPeopleDetector());
		ready_ = true;
	} catch (const cv::Exception& e) {
		qCWarning(LC_DETECT) << "[HumanDetector] HOG init failed:" << e.what();
		ready_ = false;
	}
}

std::vector<SubjectCandidate> HumanDetector::detect(const cv::Mat& bgr) const
{
	std::vector<SubjectCandidate> out;
	if (!ready_ || bgr.empty()) return out;

	// 큰 프레임은 축소 (HOG 는 해상도에 비례해 느려짐)
	cv::Mat work = bgr;
	double scale = 1.0;
	if (opt_.maxWidth > 0 && bgr.cols > opt_.maxWidth) {
		scale = static_cast<double>(opt_.maxWidth) / bgr.cols;
		cv::resize(bgr, work, cv::Size(), scale, scale, cv::INTER_AREA);
	}

	// 기본 윈도우 64x128 보다 작으면 검출 불가
	if (work.cols < hog_.winSize.width || work.rows < hog_.winSize.height) {
		return out;
	}

	std::vector<cv::Rect> found;
	std::vector<double> weights;
	hog_.detectMultiScale(work, found, weights, opt_.hitThreshold,
						  cv::Size(8, 8), cv::Size(8, 8), opt_.scale);

	for (size_t i = 0; i < found.size(); ++i) {
		const double w = (i < weights.size()) ? weights[i] : 0.0;
		if (w < opt_.minWeight) continue;

		const cv::Rect& r = found[i];
		SubjectCandidate c;
		c.box = cv::Rect2d(r.x / scale, r.y / scale, r.width / scale, r.height / scale);
		c.score = static_cast<float>(std::min(1.0, w));
		out.push_back(c);
	}

	qCDebug(LC_DETECT) << "[HumanDetector] found=" << static_cast<int>(found.size())
					   << "kept=" << static_cast<int>(out.size());
	return out;
}
