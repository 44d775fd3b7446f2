#include "camera_worker.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <opencv2/imgcodecs.hpp>

#include "log.hpp"

namespace camingest {

double next_backoff(double current, double cap) {
    return std::min(cap, current * 2.0);
}

double wall_clock() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

CameraWorker::CameraWorker(const Camera& camera, const PipelineConfig& cfg, WorkerDeps deps)
    : camera_(camera),
      cfg_(cfg),
      deps_(std::move(deps)),
      channel_(channel_for(camera.id)),
      buffer_(cfg.buffer_capacity),
      motion_(cfg.motion) {
    if (!deps_.clock) deps_.clock = wall_clock;
    if (!is_push() && !deps_.source) {
        throw std::invalid_argument("pull camera " + camera_.id + " needs a stream source");
    }
    if (cfg_.frame_skip < 1) cfg_.frame_skip = 1;
    state_.reconnect_delay = cfg_.reconnect_initial_sec;
}

CameraWorker::~CameraWorker() {
    stop();
}

void CameraWorker::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
    if (running_) return;
    if (thread_.joinable()) thread_.join();
    {
        std::lock_guard<std::mutex> lock(stop_mu_);
        stop_requested_ = false;
    }
    running_ = true;

    if (is_push()) {
        {
            std::lock_guard<std::mutex> lock(state_mu_);
            state_.phase = WorkerPhase::STREAMING;
            status_ = CameraStatus::CONNECTED;
        }
        if (deps_.metrics) deps_.metrics->set_camera_status(camera_.id, true);
        log_info("worker " + camera_.id, "push worker initialized");
        return;
    }

    set_phase(WorkerPhase::STARTING);
    thread_ = std::thread(&CameraWorker::run, this);
    log_info("worker " + camera_.id, "started");
}

void CameraWorker::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
    if (!running_ && !thread_.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(stop_mu_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    {
        // waits out a push frame that is mid-flight
        std::lock_guard<std::mutex> lock(process_mu_);
        running_ = false;
    }
    {
        std::lock_guard<std::mutex> lock(state_mu_);
        state_.phase = WorkerPhase::STOPPED;
        status_ = CameraStatus::DISCONNECTED;
    }
    if (deps_.metrics) deps_.metrics->set_camera_status(camera_.id, false);
    log_info("worker " + camera_.id, "stopped");
}

bool CameraWorker::stop_requested() {
    std::lock_guard<std::mutex> lock(stop_mu_);
    return stop_requested_;
}

bool CameraWorker::sleep_for(double seconds) {
    std::unique_lock<std::mutex> lock(stop_mu_);
    auto dur = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::duration<double>(seconds));
    return !stop_cv_.wait_for(lock, dur, [&] { return stop_requested_; });
}

void CameraWorker::set_phase(WorkerPhase phase) {
    std::lock_guard<std::mutex> lock(state_mu_);
    state_.phase = phase;
}

CameraStatus CameraWorker::status() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return status_;
}

StreamMetadata CameraWorker::stream_metadata() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return meta_;
}

WorkerState CameraWorker::state() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return state_;
}

void CameraWorker::run() {
    const std::string tag = "worker " + camera_.id;

    while (!stop_requested()) {
        try {
            set_phase(WorkerPhase::CONNECTING);
            std::unique_ptr<FrameStream> stream = deps_.source->open(camera_.source_url);
            if (!stream) {
                handle_disconnect("Failed to open stream: " + camera_.source_url);
                double delay;
                {
                    std::lock_guard<std::mutex> lock(state_mu_);
                    delay = state_.reconnect_delay;
                }
                log_info(tag, "retrying in " + cv::format("%.1f", delay) + "s");
                if (!sleep_for(delay)) break;
                std::lock_guard<std::mutex> lock(state_mu_);
                state_.reconnect_delay = next_backoff(delay, cfg_.reconnect_max_sec);
                continue;
            }

            handle_connect(stream->metadata());

            while (!stop_requested()) {
                cv::Mat frame;
                if (!stream->read(frame)) {
                    handle_disconnect("Stream closed or error occurred.");
                    break;
                }
                if (stop_requested()) break;
                process_frame(frame, now());
            }
        } catch (const std::exception& e) {
            log_error(tag, std::string("error in run loop: ") + e.what());
            handle_disconnect(std::string("internal error: ") + e.what());
            if (!sleep_for(cfg_.error_pause_sec)) break;
        }
    }
}

void CameraWorker::handle_connect(const StreamMetadata& meta) {
    {
        std::lock_guard<std::mutex> lock(state_mu_);
        meta_ = meta;
        status_ = CameraStatus::CONNECTED;
        state_.phase = WorkerPhase::STREAMING;
        state_.reconnect_delay = cfg_.reconnect_initial_sec;
    }
    if (deps_.metrics) deps_.metrics->set_camera_status(camera_.id, true);

    Event ev;
    ev.kind = EventKind::CAMERA_CONNECTED;
    ev.stream = meta;
    emit(ev);
    log_info("worker " + camera_.id, "connected " + std::to_string(meta.width) + "x" +
                                         std::to_string(meta.height) + " @ " + cv::format("%.2f", meta.fps) + " fps");
}

void CameraWorker::handle_disconnect(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(state_mu_);
        status_ = CameraStatus::DISCONNECTED;
        state_.phase = WorkerPhase::DISCONNECTED;
    }
    if (deps_.metrics) deps_.metrics->set_camera_status(camera_.id, false);

    Event ev;
    ev.kind = EventKind::CAMERA_DISCONNECTED;
    ev.reason = reason;
    emit(ev);
    log_warn("worker " + camera_.id, "disconnected: " + reason);
}

bool CameraWorker::process_frame(const cv::Mat& image, double timestamp) {
    std::lock_guard<std::mutex> lock(process_mu_);
    if (!running_ || image.empty()) return false;

    auto frame = std::make_shared<Frame>();
    frame->image = image;
    frame->timestamp = timestamp;
    frame->source = camera_.source_type;
    buffer_.put(std::move(frame));

    if (deps_.metrics) {
        deps_.metrics->inc_frames_ingested(camera_.id, source_type_to_string(camera_.source_type));
        deps_.metrics->set_last_frame_timestamp(camera_.id, timestamp);
    }

    const double t = now();
    bool publish = false;
    {
        std::lock_guard<std::mutex> state_lock(state_mu_);
        state_.frames_processed++;
        if (t - state_.last_event_pub > cfg_.event_interval_sec) {
            state_.last_event_pub = t;
            publish = true;
        }
    }
    if (publish) {
        Event ev;
        ev.kind = EventKind::FRAME_INGESTED;
        ev.timestamp = timestamp;
        ev.source = camera_.source_type;
        emit(ev);
    }

    if (cfg_.detection_enabled) analyse(image, t);
    return true;
}

void CameraWorker::analyse(const cv::Mat& image, double t) {
    {
        std::lock_guard<std::mutex> lock(state_mu_);
        if (++state_.frame_counter < cfg_.frame_skip) return;
        state_.frame_counter = 0;
        if (t < state_.inference_cooldown_until) return;
    }

    cv::Mat gray = motion_.preprocess(image);
    if (!motion_.detect(gray, t)) return;

    bool person_cooldown;
    {
        std::lock_guard<std::mutex> lock(state_mu_);
        state_.inference_cooldown_until = t + cfg_.inference_cooldown_sec;
        person_cooldown = t < state_.person_cooldown_until;
    }
    if (deps_.metrics) deps_.metrics->inc_motion_detected(camera_.id);

    Event ev;
    ev.kind = EventKind::MOTION_DETECTED;
    ev.timestamp = t;
    emit(ev);

    if (!deps_.inference || !deps_.inference->ready() || person_cooldown) return;
    log_info("worker " + camera_.id, "significant motion detected, running inference");
    run_inference(image.clone(), t);
}

void CameraWorker::run_inference(const cv::Mat& image, double t) {
    {
        std::lock_guard<std::mutex> lock(state_mu_);
        state_.inference_runs++;
    }

    InferenceResult result;
    try {
        result = deps_.inference->infer(image);
    } catch (const std::exception& e) {
        log_warn("worker " + camera_.id, std::string("inference failed, treating as no detection: ") + e.what());
        return;
    }
    if (result.dets.empty()) return;

    {
        std::lock_guard<std::mutex> lock(state_mu_);
        state_.person_cooldown_until = t + cfg_.person_cooldown_sec;
    }
    if (deps_.metrics) deps_.metrics->inc_person_detected(camera_.id);

    Event ev;
    ev.kind = EventKind::PERSON_DETECTED;
    ev.timestamp = t;
    ev.person_count = static_cast<int>(result.dets.size());
    ev.frame_path = save_snapshot(result.annotated.empty() ? image : result.annotated, t);
    emit(ev);
    log_info("worker " + camera_.id, "found " + std::to_string(ev.person_count) + " person(s), event published");
}

std::string CameraWorker::save_snapshot(const cv::Mat& image, double t) {
    if (cfg_.snapshot_dir.empty()) return {};

    std::string safe_id = camera_.id;
    std::replace_if(safe_id.begin(), safe_id.end(),
                    [](char c) { return !(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_'); }, '_');
    uint64_t seq;
    {
        std::lock_guard<std::mutex> lock(state_mu_);
        seq = ++snapshot_seq_;
    }
    std::ostringstream name;
    name << safe_id << '_' << static_cast<long long>(t * 1000.0) << '_' << seq << ".jpg";
    const std::filesystem::path path = std::filesystem::path(cfg_.snapshot_dir) / name.str();

    try {
        std::filesystem::create_directories(cfg_.snapshot_dir);
        if (!cv::imwrite(path.string(), image)) {
            log_warn("worker " + camera_.id, "unable to write snapshot: " + path.string());
            return {};
        }
    } catch (const std::exception& e) {
        log_warn("worker " + camera_.id, std::string("snapshot failed: ") + e.what());
        return {};
    }
    return path.string();
}

void CameraWorker::emit(Event ev) {
    if (!deps_.events) return;
    ev.camera_id = camera_.id;
    if (ev.timestamp == 0.0) ev.timestamp = now();
    try {
        deps_.events->publish(channel_, ev);
    } catch (const std::exception& e) {
        log_warn("worker " + camera_.id, std::string("event publish failed: ") + e.what());
    }
}

}  // namespace camingest
