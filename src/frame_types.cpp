#include "frame_types.hpp"

#include <cctype>

#include "errors.hpp"

namespace camingest {

SourceType source_type_from_string(const std::string& s) {
    std::string c;
    c.reserve(s.size());
    for (char ch : s) c.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));

    if (c == "rtsp") return SourceType::RTSP;
    if (c == "mjpeg") return SourceType::MJPEG;
    if (c == "http_push") return SourceType::HTTP_PUSH;
    if (c == "onvif") return SourceType::ONVIF;
    throw ValidationError("Unknown source type '" + s + "'. Expected rtsp, mjpeg, http_push or onvif.");
}

}  // namespace camingest
