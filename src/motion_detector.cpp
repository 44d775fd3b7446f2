#include "motion_detector.hpp"

#include <vector>

#include <opencv2/imgproc.hpp>

namespace camingest {

MotionDetector::MotionDetector(const MotionConfig& cfg) : cfg_(cfg) {
    if (cfg_.blur_kernel % 2 == 0) cfg_.blur_kernel += 1;
}

cv::Mat MotionDetector::preprocess(const cv::Mat& frame) const {
    cv::Mat gray;
    if (frame.channels() == 3) {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    } else if (frame.channels() == 4) {
        cv::cvtColor(frame, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = frame.clone();
    }
    if (cfg_.blur_kernel > 1) {
        cv::GaussianBlur(gray, gray, cv::Size(cfg_.blur_kernel, cfg_.blur_kernel), 0);
    }
    return gray;
}

bool MotionDetector::detect(const cv::Mat& gray, double now) {
    if (reference_.empty() || reference_.size() != gray.size() || reference_.type() != gray.type()) {
        // cold start, or the stream changed resolution
        reference_ = gray.clone();
        return false;
    }

    if (now < cooldown_until_) {
        reference_ = gray.clone();
        return false;
    }

    cv::Mat diff, mask;
    cv::absdiff(reference_, gray, diff);
    cv::threshold(diff, mask, cfg_.diff_threshold, 255, cv::THRESH_BINARY);
    cv::dilate(mask, mask, cv::Mat(), cv::Point(-1, -1), cfg_.dilate_iterations);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    bool motion = false;
    for (const auto& c : contours) {
        if (cv::contourArea(c) > cfg_.min_area) {
            motion = true;
            break;
        }
    }

    if (motion) cooldown_until_ = now + cfg_.cooldown_sec;
    reference_ = gray.clone();
    return motion;
}

void MotionDetector::reset() {
    reference_.release();
    cooldown_until_ = 0.0;
}

}  // namespace camingest
