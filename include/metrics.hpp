#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace camingest {

// Process-local counters and gauges, rendered in Prometheus text format.
class Metrics {
public:
    void set_camera_status(const std::string& camera_id, bool connected);
    void inc_frames_ingested(const std::string& camera_id, const std::string& source_type);
    void inc_motion_detected(const std::string& camera_id);
    void inc_person_detected(const std::string& camera_id);
    void set_last_frame_timestamp(const std::string& camera_id, double ts);

    // Drops every series labelled with this camera.
    void remove_camera(const std::string& camera_id);

    // Read at render time, e.g. the publisher's drop counter.
    void set_dropped_events_source(std::function<uint64_t()> fn);

    uint64_t frames_ingested(const std::string& camera_id, const std::string& source_type) const;
    uint64_t motion_detected(const std::string& camera_id) const;
    double camera_status(const std::string& camera_id) const;
    double last_frame_timestamp(const std::string& camera_id) const;

    std::string render() const;

private:
    mutable std::mutex mu_;
    std::map<std::string, double> status_;
    std::map<std::pair<std::string, std::string>, uint64_t> frames_;
    std::map<std::string, uint64_t> motion_;
    std::map<std::string, uint64_t> persons_;
    std::map<std::string, double> last_frame_ts_;
    std::function<uint64_t()> dropped_fn_;
};

}  // namespace camingest
