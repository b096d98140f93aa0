#pragma once
#include <memory>
#include <optional>
#include <opencv2/core.hpp>
#include "detect/ICandidateDetector.hpp"
#include "include/types.hpp"

// 티어 검출: 얼굴 -> 사람 -> 없음. 프레임당 주 피사체 1개.
// 백엔드 오류는 "피사체 없음" 으로 강등되며 밖으로 던지지 않음.
class SubjectDetector {
public:
	SubjectDetector(std::unique_ptr<ICandidateDetector> face,
					std::unique_ptr<ICandidateDetector> human);

	SubjectObservation detect(const cv::Mat& bgr) const;

	bool hasFaceTier() const  { return face_ && face_->isReady(); }
	bool hasHumanTier() const { return human_ && human_->isReady(); }

	// 픽셀 박스 -> [0,1] 정규화 + 클리핑
	static cv::Rect2d normalize(const cv::Rect2d& px, const cv::Size& frame);

private:
	std::optional<SubjectCandidate> runTier(const ICandidateDetector* tier, const cv::Mat& bgr) const;

	std::unique_ptr<ICandidateDetector> face_;
	std::unique_ptr<ICandidateDetector> human_;
};
