// capture/FrameCapture.hpp
#pragma once
#include <atomic>
#include <QObject>
#include <QThread>
#include <QElapsedTimer>
#include <QMetaType>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

Q_DECLARE_METATYPE(cv::Mat)

// 카메라 또는 동영상 파일 소스. 전용 QThread 에서 읽고 frameReady 로 전달
class FrameCapture : public QObject {
	Q_OBJECT
public:
    explicit FrameCapture();
    ~FrameCapture();

    void setFile(const QString& path) { filePath_ = path; useIndex_ = -1; }
    void setCameraIndex(int idx) { useIndex_ = idx; filePath_.clear(); }
    void setResolution(int w, int h) { w_ = w; h_ = h; }
    void setFps(double fps) { fpsReq_ = fps; }
    void setUseV4L2(bool v) { useV4L2_ = v; }

    bool isFileSource() const { return !filePath_.isEmpty(); }

public slots:
    void start();
    void stop();

signals:
    void started();                       // 장치 열림 (스로틀 재시작 기준)
    void frameReady(const cv::Mat& bgr);
    void cameraError(const QString& msg);
    void finished();                      // 파일 끝 또는 stop

private slots:
    void loop();

private:
    bool openSource();
    void closeSource();
    bool readOne(cv::Mat& out);

    cv::VideoCapture cap_;
    QString filePath_;
    int useIndex_{0};
    int w_{640}, h_{480};
    double fpsReq_{30.0};
    bool useV4L2_{true};

    QThread worker_;
    std::atomic_bool running_{false};
    int failCount_{0};
    const int maxFailBeforeReopen_{10};
    const int reopenSleepMs_{300};
    const int maxOpenRetries_{10};
};
