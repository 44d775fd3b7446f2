#pragma once

#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace camingest {

enum class SourceType { RTSP, MJPEG, HTTP_PUSH, ONVIF };

enum class CameraStatus { REGISTERED, CONNECTED, DISCONNECTED };

inline const char* source_type_to_string(SourceType type) {
    switch (type) {
        case SourceType::RTSP: return "rtsp";
        case SourceType::MJPEG: return "mjpeg";
        case SourceType::HTTP_PUSH: return "http_push";
        case SourceType::ONVIF: return "onvif";
    }
    return "rtsp";
}

// Throws ValidationError for anything that is not a known source type.
SourceType source_type_from_string(const std::string& s);

inline bool is_push_source(SourceType type) { return type == SourceType::HTTP_PUSH; }

inline const char* camera_status_to_string(CameraStatus status) {
    switch (status) {
        case CameraStatus::REGISTERED: return "registered";
        case CameraStatus::CONNECTED: return "connected";
        default: return "disconnected";
    }
}

struct Camera {
    std::string id;
    SourceType source_type{SourceType::RTSP};
    std::string source_url;   // pull sources, or resolved discovery URL
    std::string ip_address;   // onvif only
    int onvif_port{80};
    std::string username;
    std::string password;
    CameraStatus status{CameraStatus::REGISTERED};
};

struct Frame {
    cv::Mat image;                 // BGR image, never mutated after buffering
    double timestamp{0.0};         // unix seconds
    SourceType source{SourceType::RTSP};
};

using FramePtr = std::shared_ptr<const Frame>;

struct StreamMetadata {
    int width{0};
    int height{0};
    double fps{0.0};
};

struct Detection {
    std::string label;
    float confidence{0.0f};
    cv::Rect bbox;
};

struct InferenceResult {
    std::vector<Detection> dets;   // detections of interest above threshold
    cv::Mat annotated;             // copy of the input with boxes drawn
};

}  // namespace camingest
