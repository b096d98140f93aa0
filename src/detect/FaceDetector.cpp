#include "detect/FaceDetector.hpp"
#include "log/compose_logging.hpp"
#include <filesystem>
#include <QString>

bool FaceDetector::init(const std::string& modelPath,
												int inputW, int inputH,
												float scoreThr, float nmsThr, int topK,
												int backend, int target)
{
	modelPath_ = modelPath;
	inW_ = inputW; inH_ = inputH;
	scoreThr_ = scoreThr; nmsThr_ = nmsThr;
	topK_ = topK; backend_ = backend; target_ = target;
	ready_ = false;

	std::error_code ec;
	if (!std::filesystem::is_regular_file(modelPath_, ec)) {
		qCWarning(LC_DETECT) << "[FaceDetector] model not found:" << QString::fromStdString(modelPath_);
		return false;
	}

	try {
		yunet_ = cv::FaceDetectorYN::create(
				modelPath_, /*config=*/"", cv::Size(inW_, inH_),
				scoreThr_, nmsThr_, topK_, backend_, target_);
	} catch (const cv::Exception& e) {
		qCWarning(LC_DETECT) << "[FaceDetector] YuNet create failed:" << e.what();
		return false;
	}

	ready_ = (yunet_ != nullptr);
	yunet_InputSize_ = cv::Size(0, 0);			// 첫 프레임에서 갱신
	if (!ready_) {
		qCWarning(LC_DETECT) << "[FaceDetector] YuNet not ready";
		return false;
	}

	qCInfo(LC_DETECT) << "[FaceDetector] YuNet init Ok"
					 << "model=" << QString::fromStdString(modelPath_)
					 << "in="    << inW_		  << "x" << inH_
					 << "thr="   << scoreThr_ <<  "/" << nmsThr_
					 << "topK="  << topK_;

	return true;
}

std::vector<SubjectCandidate> FaceDetector::parseYuNet(const cv::Mat& dets, float scoreThresh)
{
	std::vector<SubjectCandidate> out;
	if (dets.empty() || dets.cols < 15) return out;

	// 행: x, y, w, h, 랜드마크 10개, score
	for (int i = 0; i < dets.rows; ++i) {
		const float score = dets.at<float>(i, 14);
		if (score < scoreThresh) continue;

		const cv::Rect2d box(dets.at<float>(i, 0), dets.at<float>(i, 1),
							 dets.at<float>(i, 2), dets.at<float>(i, 3));
		out.push_back(SubjectCandidate{ box, score });
	}

	return out;
}

std::vector<SubjectCandidate> FaceDetector::detect(const cv::Mat& bgr) const
{
	std::vector<SubjectCandidate> out;
	if (!ready_) return out;
	if (bgr.empty()) return out;

	// YuNet 입력 크기 갱신 (프레임 크기 변경 시 필수)
	const cv::Size cur = bgr.size();
	if (yunet_ && cur != yunet_InputSize_) {
		yunet_->setInputSize(cur);
		yunet_InputSize_ = cur;
	}

	// 예외는 SubjectDetector 가 흡수
	cv::Mat dets;
	yunet_->detect(bgr, dets);

	out = parseYuNet(dets, scoreThr_);

	qCDebug(LC_DETECT) << "[FaceDetector] dets rows=" << dets.rows
					   << "parsed faces=" << static_cast<int>(out.size());
	return out;
}
