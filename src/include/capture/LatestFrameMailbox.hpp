#pragma once
#include <atomic>
#include <cstdint>
#include <QMutex>
#include <QMutexLocker>
#include <opencv2/core.hpp>

// 단일 슬롯: 소비 전 새 프레임이 오면 이전 프레임은 버려짐
class LatestFrameMailbox {
public:
    // 생산자: 최신 프레임 게시, 부여된 시퀀스 반환
    uint64_t publish(const cv::Mat& bgr) {
        cv::Mat copy = bgr.clone();            // deep copy 1회 (락 밖)
        QMutexLocker lk(&mu_);
        frame_ = std::move(copy);
        const uint64_t s = seq_.load(std::memory_order_relaxed) + 1;
        seq_.store(s, std::memory_order_release);
        return s;
    }

    // 소비자: lastSeq 이후 새 프레임이 있으면 가져옴
    bool tryConsume(cv::Mat& out, uint64_t& lastSeq) {
        if (seq_.load(std::memory_order_acquire) == lastSeq) return false;   // 새 프레임 없음
        QMutexLocker lk(&mu_);
        out = frame_;                          // shallow (ref-count 증가)
        lastSeq = seq_.load(std::memory_order_relaxed);
        return !out.empty();
    }

    uint64_t latestSeq() const { return seq_.load(std::memory_order_acquire); }

private:
    QMutex mu_;
    cv::Mat frame_;
    std::atomic<uint64_t> seq_{0};
};
