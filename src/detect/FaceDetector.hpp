#pragma once
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <opencv2/objdetect.hpp>  // cv::FaceDetectorYN
#include "detect/ICandidateDetector.hpp"
#include "include/types.hpp"

// YuNet 얼굴 티어
class FaceDetector : public ICandidateDetector {
	public:
		FaceDetector() = default;
		~FaceDetector() override = default;

		// YuNet 초기화 (modelPath 필수)
		bool init(const std::string& modelPath,
							int inputW = 320, int inputH = 240,
							float scoreThr = 0.6f, float nmsThr = 0.3f, int topK = 500,
							int backend = cv::dnn::DNN_BACKEND_OPENCV,
							int target  = cv::dnn::DNN_TARGET_CPU);

		const char* name() const override { return "YuNet"; }
		bool isReady() const override { return ready_; }

		// 프레임의 전체 얼굴 후보 (원본 좌표계)
		std::vector<SubjectCandidate> detect(const cv::Mat& bgr) const override;

		// YuNet 출력 파서 (box 0~3, score 14)
		static std::vector<SubjectCandidate> parseYuNet(const cv::Mat& dets, float scoreThresh);

	private:
		bool ready_ = false;
		int inW_ = 320;
		int inH_ = 240;
		float scoreThr_ = 0.6f;
		float nmsThr_ = 0.3f;
		int topK_ = 500;
		int backend_  = cv::dnn::DNN_BACKEND_OPENCV;
		int target_   = cv::dnn::DNN_TARGET_CPU;

		std::string modelPath_;
		cv::Ptr<cv::FaceDetectorYN> yunet_;		// YuNet 핸들
		mutable cv::Size yunet_InputSize_{0, 0};  // setInputSize cache
};
