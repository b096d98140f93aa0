#pragma once
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>  // cv::HOGDescriptor
#include "detect/ICandidateDetector.hpp"

// HOG 사람 티어 (얼굴이 없을 때 폴백)
class HumanDetector : public ICandidateDetector {
	public:
		struct Options {
			int		maxWidth = 640;			// 속도를 위해 축소 후 검출
			double	hitThreshold = 0.0;
			double	scale = 1.05;
			double	minWeight = 0.3;		// SVM 가중치 하한
		};

		HumanDetector();
		explicit HumanDetector(const Options& opt);
		~HumanDetector() override = default;

		const char* name() const override { return "HOG"; }
		bool isReady() const override { return ready_; }

		std::vector<SubjectCandidate> detect(const cv::Mat& bgr) const override;

	private:
		Options opt_;
		bool ready_ = false;
		mutable cv::HOGDescriptor hog_;
};
