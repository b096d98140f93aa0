#include "util/overlayDrawUtil.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <variant>

namespace {

int thickness(const OverlayStyle& s)
{
	return std::max(1, static_cast<int>(s.strokeWidth + 0.5f));
}

// layer 에 그린 뒤 opacity 로 합성
template <typename DrawFn>
void blended(cv::Mat& frame, double opacity, DrawFn draw)
{
	if (opacity >= 1.0) { draw(frame); return; }
	if (opacity <= 0.0) return;

	cv::Mat layer = frame.clone();
	draw(layer);
	cv::addWeighted(layer, opacity, frame, 1.0 - opacity, 0.0, frame);
}

struct Painter {
	cv::Mat& frame;

	void operator()(const GridOverlay& g) const {
		blended(frame, g.style.opacity, [&](cv::Mat& dst) {
			for (const auto& l : g.lines)
				cv::line(dst, l.from, l.to, g.style.color, thickness(g.style), cv::LINE_AA);
		});
	}

	void operator()(const CrosshairOverlay& c) const {
		blended(frame, c.style.opacity, [&](cv::Mat& dst) {
			const cv::Point2d dx(c.size, 0.0), dy(0.0, c.size);
			cv::line(dst, c.center - dx, c.center + dx, c.style.color, thickness(c.style), cv::LINE_AA);
			cv::line(dst, c.center - dy, c.center + dy, c.style.color, thickness(c.style), cv::LINE_AA);
		});
	}

	void operator()(const SymmetryLineOverlay& s) const {
		blended(frame, s.style.opacity, [&](cv::Mat& dst) {
			cv::line(dst, cv::Point2d(s.x, 0.0), cv::Point2d(s.x, s.height),
					 s.style.color, thickness(s.style), cv::LINE_AA);
		});
	}

	void operator()(const SafetyZoneOverlay& z) const {
		blended(frame, z.style.opacity, [&](cv::Mat& dst) {
			cv::rectangle(dst, cv::Rect(z.rect), z.style.color, thickness(z.style), cv::LINE_AA);
		});
	}
};

cv::Point anchorOrigin(const cv::Mat& frame, const cv::Size& box, Anchor anchor, int margin)
{
	int x = margin, y = margin;
	switch (anchor) {
		case Anchor::TopLeft:		break;
		case Anchor::TopCenter:		x = (frame.cols - box.width) / 2; break;
		case Anchor::TopRight:		x = frame.cols - box.width - margin; break;
		case Anchor::CenterLeft:	y = (frame.rows - box.height) / 2; break;
		case Anchor::Center:		x = (frame.cols - box.width) / 2; y = (frame.rows - box.height) / 2; break;
		case Anchor::CenterRight:	x = frame.cols - box.width - margin; y = (frame.rows - box.height) / 2; break;
		case Anchor::BottomLeft:	y = frame.rows - box.height - margin; break;
		case Anchor::BottomCenter:	x = (frame.cols - box.width) / 2; y = frame.rows - box.height - margin; break;
		case Anchor::BottomRight:	x = frame.cols - box.width - margin; y = frame.rows - box.height - margin; break;
	}
	return { std::max(0, x), std::max(0, y) };
}

}	// namespace

void drawOverlays(cv::Mat& frame, const OverlayList& overlays)
{
	if (frame.empty() || frame.type() != CV_8UC3) return;

	Painter p{ frame };
	for (const auto& o : overlays) std::visit(p, o);
}

void drawSuggestion(cv::Mat& frame,
					const std::string& text,
					Anchor anchor,
					int margin,
					double fontScale,
					const cv::Scalar& fg,
					const cv::Scalar& bg,
					double bgAlpha)
{
	if (frame.empty() || text.empty()) return;

	const int font = cv::FONT_HERSHEY_SIMPLEX;
	const int thick = 2;
	int baseline = 0;
	const cv::Size ts = cv::getTextSize(text, font, fontScale, thick, &baseline);

	const int padX = 12, padY = 8;
	const cv::Size box(ts.width + padX * 2, ts.height + baseline + padY * 2);
	const cv::Point org = anchorOrigin(frame, box, anchor, margin);
	const cv::Rect bgRect = cv::Rect(org, box) & cv::Rect(0, 0, frame.cols, frame.rows);

	blended(frame, bgAlpha, [&](cv::Mat& dst) {
		cv::rectangle(dst, bgRect, bg, cv::FILLED);
	});

	const cv::Point textOrg(org.x + padX, org.y + padY + ts.height);
	// 외곽선 후 본문
	cv::putText(frame, text, textOrg, font, fontScale, cv::Scalar(0, 0, 0), thick + 2, cv::LINE_AA);
	cv::putText(frame, text, textOrg, font, fontScale, fg, thick, cv::LINE_AA);
}
