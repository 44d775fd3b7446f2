#include <gtest/gtest.h>

#include "motion_detector.hpp"
#include "test_support.hpp"

using camingest::MotionConfig;
using camingest::MotionDetector;
using namespace camingest::testing;

namespace {
MotionConfig config() {
    MotionConfig cfg;
    cfg.min_area = 1500.0;
    cfg.cooldown_sec = 2.0;
    return cfg;
}
}  // namespace

TEST(MotionDetector, ColdStartReportsNoMotion) {
    MotionDetector det(config());
    EXPECT_FALSE(det.has_reference());
    EXPECT_FALSE(det.detect(det.preprocess(frame_with_square(50, 50, 100)), 10.0));
    EXPECT_TRUE(det.has_reference());
}

TEST(MotionDetector, PreprocessProducesBlurredGray) {
    MotionDetector det(config());
    cv::Mat gray = det.preprocess(frame_with_square(50, 50, 100));
    EXPECT_EQ(gray.channels(), 1);
    EXPECT_EQ(gray.size(), cv::Size(320, 240));
    // edge of the square is softened by the blur
    int edge = gray.at<uchar>(100, 50);
    EXPECT_GT(edge, 0);
    EXPECT_LT(edge, 255);
}

TEST(MotionDetector, IdenticalFramesNeverTrigger) {
    MotionDetector det(config());
    cv::Mat gray = det.preprocess(frame_with_square(50, 50, 60));
    double t = 0.0;
    for (int i = 0; i < 20; ++i) {
        EXPECT_FALSE(det.detect(gray, t));
        t += 5.0;
    }
}

TEST(MotionDetector, LargeChangeTriggersOnceThenCoolsDown) {
    MotionDetector det(config());
    det.detect(det.preprocess(blank_frame()), 100.0);

    EXPECT_TRUE(det.detect(det.preprocess(frame_with_square(50, 50, 100)), 100.1));
    EXPECT_DOUBLE_EQ(det.cooldown_until(), 102.1);

    // Different again, but still inside the cooldown window
    EXPECT_FALSE(det.detect(det.preprocess(frame_with_square(180, 100, 100)), 100.5));
    EXPECT_FALSE(det.detect(det.preprocess(blank_frame()), 101.9));

    // After the cooldown the next real change fires again
    EXPECT_TRUE(det.detect(det.preprocess(frame_with_square(180, 100, 100)), 102.5));
}

TEST(MotionDetector, ReferenceRefreshesDuringCooldown) {
    MotionDetector det(config());
    det.detect(det.preprocess(blank_frame()), 0.0);
    ASSERT_TRUE(det.detect(det.preprocess(frame_with_square(50, 50, 100)), 1.0));

    // Moved during cooldown: becomes the new reference
    det.detect(det.preprocess(frame_with_square(180, 100, 100)), 2.0);

    // Same picture after the cooldown is not motion against the refreshed reference
    EXPECT_FALSE(det.detect(det.preprocess(frame_with_square(180, 100, 100)), 10.0));
}

TEST(MotionDetector, SmallRegionBelowMinimumAreaIsIgnored) {
    MotionDetector det(config());
    det.detect(det.preprocess(blank_frame()), 0.0);
    EXPECT_FALSE(det.detect(det.preprocess(frame_with_square(100, 100, 10)), 1.0));
}

TEST(MotionDetector, ResolutionChangeRestartsCold) {
    MotionDetector det(config());
    det.detect(det.preprocess(blank_frame(320, 240)), 0.0);
    EXPECT_FALSE(det.detect(det.preprocess(frame_with_square(50, 50, 100, 640, 480)), 1.0));
    EXPECT_TRUE(det.detect(det.preprocess(blank_frame(640, 480)), 2.0));
}

TEST(MotionDetector, ResetClearsReferenceAndCooldown) {
    MotionDetector det(config());
    det.detect(det.preprocess(blank_frame()), 0.0);
    ASSERT_TRUE(det.detect(det.preprocess(frame_with_square(50, 50, 100)), 1.0));
    det.reset();
    EXPECT_FALSE(det.has_reference());
    EXPECT_DOUBLE_EQ(det.cooldown_until(), 0.0);
}
