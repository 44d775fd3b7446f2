#pragma once

#include <string>

#include "inference_engine.hpp"
#include "motion_detector.hpp"

namespace camingest {

// Everything a camera worker needs to know. Shared by all cameras.
struct PipelineConfig {
    size_t buffer_capacity{10};
    bool detection_enabled{true};
    int frame_skip{5};                    // analyse every K-th frame
    double event_interval_sec{1.0};       // frame.ingested throttle
    double inference_cooldown_sec{3.0};   // min gap between motion-triggered inference runs
    double person_cooldown_sec{10.0};     // suppresses repeated person alerts
    MotionConfig motion{};
    double reconnect_initial_sec{1.0};
    double reconnect_max_sec{60.0};
    double error_pause_sec{5.0};
    std::string snapshot_dir{"/tmp/camera_frames"};  // empty disables snapshots
    int stream_fps{30};                   // live MJPEG pacing
};

struct AppConfig {
    std::string host{"0.0.0.0"};
    int port{8000};
    PipelineConfig pipeline{};
    DetectorConfig detector{};
    std::string events_jsonl{"events.jsonl"};
    size_t event_queue{256};
    size_t recent_events{500};
    int open_timeout_ms{5000};
    int read_timeout_ms{5000};
    std::string onvif_url_template{"rtsp://{user}:{password}@{host}:554/"};
};

// Defaults, then environment, then flags. Throws ValidationError on bad values.
AppConfig parse_args(int argc, char** argv);

// Range checks shared by parse_args and tests.
void validate(const AppConfig& cfg);

std::string usage();

}  // namespace camingest
