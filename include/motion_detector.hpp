#pragma once

#include <opencv2/core.hpp>

namespace camingest {

struct MotionConfig {
    double min_area{1500.0};      // contour area in pixels
    double cooldown_sec{1.0};
    int diff_threshold{25};
    int dilate_iterations{2};
    int blur_kernel{21};
};

// Frame differencing against the immediately preceding frame. Owns its
// reference frame and cooldown; one instance per camera.
class MotionDetector {
public:
    explicit MotionDetector(const MotionConfig& cfg = MotionConfig{});

    // Single-channel, blurred copy of a BGR (or already gray) frame.
    cv::Mat preprocess(const cv::Mat& frame) const;

    // `gray` must come from preprocess(). `now` is unix seconds.
    bool detect(const cv::Mat& gray, double now);

    bool has_reference() const { return !reference_.empty(); }
    double cooldown_until() const { return cooldown_until_; }
    void reset();

private:
    MotionConfig cfg_;
    cv::Mat reference_;
    double cooldown_until_{0.0};
};

}  // namespace camingest
