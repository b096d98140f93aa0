// capture/FrameCapture.cpp
#include "capture/FrameCapture.hpp"
#include "log/compose_logging.hpp"
#include <QThread>

FrameCapture::FrameCapture() 
		: QObject(nullptr)
{	
    qRegisterMetaType<cv::Mat>("cv::Mat");
    connect(&worker_, &QThread::started, this, &FrameCapture::loop, Qt::QueuedConnection);
    moveToThread(&worker_);
}
FrameCapture::~FrameCapture(){ 
	stop(); 

	if (worker_.isRunning()) {
		worker_.quit(); 
		worker_.wait(); 
	}
}

void FrameCapture::start(){ 
	if (running_.exchange(true)) return; 
	worker_.start(); 
}
void FrameCapture::stop() { running_ = false; }

bool FrameCapture::openSource() {
    closeSource();
    if (isFileSource()) {
        if (!cap_.open(filePath_.toStdString())) return false;
        // 파일은 원본 fps 로 재생
        const double fileFps = cap_.get(cv::CAP_PROP_FPS);
        if (fileFps > 0) fpsReq_ = fileFps;
    } else {
        const int api = useV4L2_ ? cv::CAP_V4L2 : cv::CAP_ANY;
        if (!cap_.open(useIndex_, api)) return false;
        cap_.set(cv::CAP_PROP_BUFFERSIZE, 1);
        if (w_>0) cap_.set(cv::CAP_PROP_FRAME_WIDTH,  w_);
        if (h_>0) cap_.set(cv::CAP_PROP_FRAME_HEIGHT, h_);
        if (fpsReq_>0) cap_.set(cv::CAP_PROP_FPS, fpsReq_);
    }
    qCInfo(LC_CAPTURE) << "[FrameCapture] opened" << (isFileSource() ? "[file] " + filePath_ : QString("[index]%1").arg(useIndex_))
            << " -> " << int(cap_.get(cv::CAP_PROP_FRAME_WIDTH)) << "x" << int(cap_.get(cv::CAP_PROP_FRAME_HEIGHT))
            << "@" << cap_.get(cv::CAP_PROP_FPS);
    emit started();
    return true;
}
void FrameCapture::closeSource(){ if (cap_.isOpened()) cap_.release(); }

bool FrameCapture::readOne(cv::Mat& out) {
    return cap_.read(out) && !out.empty();
}

void FrameCapture::loop() {
    int tries = 0;
    while (running_.load() && !openSource()) {
        if (isFileSource() || ++tries >= maxOpenRetries_) {
            const QString msg = QString("[FrameCapture] open failed: %1")
                    .arg(isFileSource() ? filePath_ : QString::number(useIndex_));
            qCWarning(LC_CAPTURE) << msg;
            emit cameraError(msg);
            running_ = false;
            break;
        }
        QThread::msleep(reopenSleepMs_);
    }

    QElapsedTimer tick; tick.start();
    const int sleepFloorMs = 1;

    while (running_.load()) {
        if (!cap_.isOpened()) { if (!openSource()) { QThread::msleep(reopenSleepMs_); continue; } }

        cv::Mat bgr;
        if (!readOne(bgr)) {
            if (isFileSource()) {
                qCInfo(LC_CAPTURE) << "[FrameCapture] end of stream";
                break;
            }
            if (++failCount_ >= maxFailBeforeReopen_) {
                qCWarning(LC_CAPTURE) << "[FrameCapture] read fail threshold, reopening...";
                emit cameraError("[FrameCapture] read fail threshold, reopening...");
                closeSource(); QThread::msleep(reopenSleepMs_); failCount_ = 0;
            } else {
                QThread::msleep(5);
            }
            continue;
        }
        failCount_ = 0;
        emit frameReady(bgr);

        if (fpsReq_ > 0) {
            int targetMs = int(1000.0 / fpsReq_);
            int sleepMs = targetMs - int(tick.restart());
            if (sleepMs < sleepFloorMs) sleepMs = sleepFloorMs;
            QThread::msleep(sleepMs);
        } else {
            QThread::msleep(sleepFloorMs);
        }
    }
    closeSource();
    running_ = false;
    emit finished();
}
