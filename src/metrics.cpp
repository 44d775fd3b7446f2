#include "metrics.hpp"

#include <iomanip>
#include <sstream>

namespace camingest {

namespace {

std::string escape_label(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        if (c == '\\') out += "\\\\";
        else if (c == '"') out += "\\\"";
        else if (c == '\n') out += "\\n";
        else out.push_back(c);
    }
    return out;
}

void header(std::ostringstream& oss, const char* name, const char* help, const char* type) {
    oss << "# HELP " << name << ' ' << help << '\n'
        << "# TYPE " << name << ' ' << type << '\n';
}

template <typename Map>
double lookup(const Map& m, const typename Map::key_type& key) {
    auto it = m.find(key);
    return it == m.end() ? 0.0 : static_cast<double>(it->second);
}

}  // namespace

void Metrics::set_camera_status(const std::string& camera_id, bool connected) {
    std::lock_guard<std::mutex> lock(mu_);
    status_[camera_id] = connected ? 1.0 : 0.0;
}

void Metrics::inc_frames_ingested(const std::string& camera_id, const std::string& source_type) {
    std::lock_guard<std::mutex> lock(mu_);
    frames_[{camera_id, source_type}]++;
}

void Metrics::inc_motion_detected(const std::string& camera_id) {
    std::lock_guard<std::mutex> lock(mu_);
    motion_[camera_id]++;
}

void Metrics::inc_person_detected(const std::string& camera_id) {
    std::lock_guard<std::mutex> lock(mu_);
    persons_[camera_id]++;
}

void Metrics::set_last_frame_timestamp(const std::string& camera_id, double ts) {
    std::lock_guard<std::mutex> lock(mu_);
    last_frame_ts_[camera_id] = ts;
}

void Metrics::remove_camera(const std::string& camera_id) {
    std::lock_guard<std::mutex> lock(mu_);
    status_.erase(camera_id);
    motion_.erase(camera_id);
    persons_.erase(camera_id);
    last_frame_ts_.erase(camera_id);
    for (auto it = frames_.begin(); it != frames_.end();) {
        if (it->first.first == camera_id) it = frames_.erase(it);
        else ++it;
    }
}

void Metrics::set_dropped_events_source(std::function<uint64_t()> fn) {
    std::lock_guard<std::mutex> lock(mu_);
    dropped_fn_ = std::move(fn);
}

uint64_t Metrics::frames_ingested(const std::string& camera_id, const std::string& source_type) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = frames_.find({camera_id, source_type});
    return it == frames_.end() ? 0 : it->second;
}

uint64_t Metrics::motion_detected(const std::string& camera_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = motion_.find(camera_id);
    return it == motion_.end() ? 0 : it->second;
}

double Metrics::camera_status(const std::string& camera_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return lookup(status_, camera_id);
}

double Metrics::last_frame_timestamp(const std::string& camera_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return lookup(last_frame_ts_, camera_id);
}

std::string Metrics::render() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::ostringstream oss;
    oss << std::setprecision(15);

    header(oss, "camera_ingest_status",
           "Current connection status of the camera (0=disconnected, 1=connected)", "gauge");
    for (const auto& kv : status_) {
        oss << "camera_ingest_status{camera_id=\"" << escape_label(kv.first) << "\"} " << kv.second << '\n';
    }

    header(oss, "camera_ingest_frames_total", "Total number of frames ingested from all sources", "counter");
    for (const auto& kv : frames_) {
        oss << "camera_ingest_frames_total{camera_id=\"" << escape_label(kv.first.first)
            << "\",source_type=\"" << escape_label(kv.first.second) << "\"} " << kv.second << '\n';
    }

    header(oss, "camera_ingest_motion_total", "Total number of motion detection events", "counter");
    for (const auto& kv : motion_) {
        oss << "camera_ingest_motion_total{camera_id=\"" << escape_label(kv.first) << "\"} " << kv.second << '\n';
    }

    header(oss, "camera_ingest_person_total", "Total number of person detection alerts", "counter");
    for (const auto& kv : persons_) {
        oss << "camera_ingest_person_total{camera_id=\"" << escape_label(kv.first) << "\"} " << kv.second << '\n';
    }

    header(oss, "camera_ingest_last_frame_timestamp", "Unix timestamp of the last ingested frame", "gauge");
    for (const auto& kv : last_frame_ts_) {
        oss << "camera_ingest_last_frame_timestamp{camera_id=\"" << escape_label(kv.first) << "\"} "
            << std::fixed << std::setprecision(3) << kv.second << std::defaultfloat << std::setprecision(15) << '\n';
    }

    header(oss, "camera_ingest_events_dropped_total", "Events discarded because the publish queue was full", "counter");
    oss << "camera_ingest_events_dropped_total " << (dropped_fn_ ? dropped_fn_() : 0) << '\n';

    return oss.str();
}

}  // namespace camingest
