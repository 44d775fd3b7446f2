#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <opencv2/core.hpp>

#include "config.hpp"
#include "events.hpp"
#include "frame_buffer.hpp"
#include "frame_types.hpp"
#include "inference_engine.hpp"
#include "metrics.hpp"
#include "motion_detector.hpp"
#include "stream_source.hpp"

namespace camingest {

enum class WorkerPhase { STOPPED, STARTING, CONNECTING, STREAMING, DISCONNECTED };

// Everything the state machine mutates besides the buffer and the motion
// detector. Timestamps are unix seconds from the worker's clock.
struct WorkerState {
    WorkerPhase phase{WorkerPhase::STOPPED};
    double reconnect_delay{1.0};
    double last_event_pub{0.0};
    double inference_cooldown_until{0.0};
    double person_cooldown_until{0.0};
    int frame_counter{0};
    uint64_t frames_processed{0};
    uint64_t inference_runs{0};
};

// Doubles `current`, capped at `cap`.
double next_backoff(double current, double cap);

using Clock = std::function<double()>;

// Unix time in seconds.
double wall_clock();

struct WorkerDeps {
    std::shared_ptr<StreamSource> source;          // required for pull cameras
    std::shared_ptr<InferenceBackend> inference;   // optional
    std::shared_ptr<EventSink> events;             // optional
    std::shared_ptr<Metrics> metrics;              // optional
    Clock clock;                                   // wall_clock when empty
};

// One camera's ingestion pipeline. Pull cameras own a read-loop thread that
// connects, reads and reconnects with backoff. Push cameras have no thread;
// frames arrive through process_frame() from the ingestion endpoint.
class CameraWorker {
public:
    CameraWorker(const Camera& camera, const PipelineConfig& cfg, WorkerDeps deps);
    ~CameraWorker();

    CameraWorker(const CameraWorker&) = delete;
    CameraWorker& operator=(const CameraWorker&) = delete;

    void start();

    // Idempotent. On return the read loop has exited and joined, and no
    // process_frame() call is still running.
    void stop();

    bool running() const { return running_.load(); }
    bool is_push() const { return is_push_source(camera_.source_type); }

    // Buffers, counts, throttles frame.ingested and runs the motion/inference
    // gate. Returns false when the worker is not running.
    bool process_frame(const cv::Mat& image, double timestamp);

    FramePtr latest_frame() const { return buffer_.get_latest(); }
    const FrameBuffer& buffer() const { return buffer_; }

    const std::string& camera_id() const { return camera_.id; }
    SourceType source_type() const { return camera_.source_type; }
    CameraStatus status() const;
    StreamMetadata stream_metadata() const;
    WorkerState state() const;

private:
    void run();
    bool stop_requested();
    bool sleep_for(double seconds);  // false if interrupted by stop()
    void set_phase(WorkerPhase phase);
    void handle_connect(const StreamMetadata& meta);
    void handle_disconnect(const std::string& reason);
    void analyse(const cv::Mat& image, double now);
    void run_inference(const cv::Mat& image, double now);
    std::string save_snapshot(const cv::Mat& image, double now);
    void emit(Event ev);
    double now() const { return deps_.clock(); }

    Camera camera_;
    PipelineConfig cfg_;
    WorkerDeps deps_;
    std::string channel_;
    FrameBuffer buffer_;
    MotionDetector motion_;

    mutable std::mutex state_mu_;
    WorkerState state_;
    CameraStatus status_{CameraStatus::REGISTERED};
    StreamMetadata meta_;
    uint64_t snapshot_seq_{0};

    std::mutex lifecycle_mu_;
    std::mutex process_mu_;
    std::mutex stop_mu_;
    std::condition_variable stop_cv_;
    bool stop_requested_{false};
    std::atomic<bool> running_{false};
    std::thread thread_;
};

}  // namespace camingest
