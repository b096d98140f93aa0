#pragma once
#include <vector>
#include <opencv2/core.hpp>
#include "include/types.hpp"		// SubjectCandidate

// 검출 백엔드 공통 인터페이스 (얼굴/사람 티어)
class ICandidateDetector {
public:
	virtual ~ICandidateDetector() = default;

	virtual const char* name() const = 0;
	virtual bool isReady() const = 0;

	// 픽셀 좌표 후보 목록. 실패 시 빈 목록 또는 예외.
	virtual std::vector<SubjectCandidate> detect(const cv::Mat& bgr) const = 0;
};
