#pragma once

#include <string>

#include "frame_types.hpp"

namespace camingest {

enum class EventKind { CAMERA_CONNECTED, CAMERA_DISCONNECTED, FRAME_INGESTED, MOTION_DETECTED, PERSON_DETECTED };

inline const char* event_kind_to_string(EventKind kind) {
    switch (kind) {
        case EventKind::CAMERA_CONNECTED: return "camera.connected";
        case EventKind::CAMERA_DISCONNECTED: return "camera.disconnected";
        case EventKind::FRAME_INGESTED: return "frame.ingested";
        case EventKind::MOTION_DETECTED: return "motion.detected";
        case EventKind::PERSON_DETECTED: return "person.detected";
    }
    return "unknown";
}

struct Event {
    EventKind kind{EventKind::FRAME_INGESTED};
    std::string camera_id;
    double timestamp{0.0};

    std::string reason;             // camera.disconnected
    SourceType source{SourceType::RTSP};  // frame.ingested
    StreamMetadata stream;          // camera.connected
    int person_count{0};            // person.detected
    std::string frame_path;         // person.detected, may be empty
};

inline std::string channel_for(const std::string& camera_id) {
    return "camera:" + camera_id;
}

// {"channel":...,"event_type":...,"data":{...}} on one line.
std::string event_to_json(const std::string& channel, const Event& ev);

// Receives events from the publisher's dispatcher thread. Implementations may
// throw; the publisher contains the failure to that one sink.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void publish(const std::string& channel, const Event& ev) = 0;
};

}  // namespace camingest
