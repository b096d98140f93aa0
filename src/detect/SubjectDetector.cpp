#include "detect/SubjectDetector.hpp"
#include "log/compose_logging.hpp"
#include <algorithm>
#include <exception>

SubjectDetector::SubjectDetector(std::unique_ptr<ICandidateDetector> face,
								 std::unique_ptr<ICandidateDetector> human)
	: face_(std::move(face)), human_(std::move(human))
{
	qCInfo(LC_DETECT) << "[SubjectDetector] tiers"
					  << "face=" << (hasFaceTier() ? face_->name() : "off")
					  << "human=" << (hasHumanTier() ? human_->name() : "off");
}

cv::Rect2d SubjectDetector::normalize(const cv::Rect2d& px, const cv::Size& frame)
{
	if (frame.width <= 0 || frame.height <= 0) return cv::Rect2d();

	const double x1 = std::clamp(px.x / frame.width, 0.0, 1.0);
	const double y1 = std::clamp(px.y / frame.height, 0.0, 1.0);
	const double x2 = std::clamp((px.x + px.width) / frame.width, 0.0, 1.0);
	const double y2 = std::clamp((px.y + px.height) / frame.height, 0.0, 1.0);
	if (x2 <= x1 || y2 <= y1) return cv::Rect2d();

	return cv::Rect2d(x1, y1, x2 - x1, y2 - y1);
}

std::optional<SubjectCandidate> SubjectDetector::runTier(const ICandidateDetector* tier, const cv::Mat& bgr) const
{
	if (!tier || !tier->isReady()) return std::nullopt;

	std::vector<SubjectCandidate> found;
	try {
		found = tier->detect(bgr);
	} catch (const cv::Exception& e) {
		qCWarning(LC_DETECT) << "[SubjectDetector]" << tier->name() << "failed:" << e.what();
		return std::nullopt;
	} catch (const std::exception& e) {
		qCWarning(LC_DETECT) << "[SubjectDetector]" << tier->name() << "failed:" << e.what();
		return std::nullopt;
	}

	// 정규화 후 면적 0 인 박스는 버림
	std::optional<SubjectCandidate> best;
	for (const auto& c : found) {
		SubjectCandidate n{ normalize(c.box, bgr.size()), c.score };
		if (n.box.area() <= 0.0) continue;
		if (!best || n.score > best->score) best = n;
	}
	return best;
}

SubjectObservation SubjectDetector::detect(const cv::Mat& bgr) const
{
	SubjectObservation obs;
	if (bgr.empty()) return obs;

	if (auto face = runTier(face_.get(), bgr)) {
		obs.box = face->box;
		obs.kind = SubjectKind::Face;
		obs.confidence = face->score;
		return obs;
	}

	if (auto human = runTier(human_.get(), bgr)) {
		obs.box = human->box;
		obs.kind = SubjectKind::Human;
		obs.confidence = human->score;
		return obs;
	}

	return obs;
}
