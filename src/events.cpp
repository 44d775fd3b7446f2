#include "events.hpp"

#include <iomanip>
#include <sstream>

#include "json_util.hpp"

namespace camingest {

std::string event_to_json(const std::string& channel, const Event& ev) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);
    oss << "{\"channel\":" << json_quote(channel)
        << ",\"event_type\":\"" << event_kind_to_string(ev.kind) << "\""
        << ",\"data\":{"
        << "\"camera_id\":" << json_quote(ev.camera_id)
        << ",\"timestamp\":" << ev.timestamp;

    switch (ev.kind) {
        case EventKind::CAMERA_CONNECTED:
            oss << ",\"width\":" << ev.stream.width
                << ",\"height\":" << ev.stream.height
                << ",\"fps\":" << std::setprecision(2) << ev.stream.fps;
            break;
        case EventKind::CAMERA_DISCONNECTED:
            oss << ",\"reason\":" << json_quote(ev.reason);
            break;
        case EventKind::FRAME_INGESTED:
            oss << ",\"source\":\"" << source_type_to_string(ev.source) << "\"";
            break;
        case EventKind::MOTION_DETECTED:
            break;
        case EventKind::PERSON_DETECTED:
            oss << ",\"person_count\":" << ev.person_count
                << ",\"frame_path\":";
            if (ev.frame_path.empty()) {
                oss << "null";
            } else {
                oss << json_quote(ev.frame_path);
            }
            break;
    }
    oss << "}}";
    return oss.str();
}

}  // namespace camingest
