#pragma once

#include <string>
#include <vector>

#include "frame_types.hpp"

namespace camingest {

// Registration body -> Camera. Throws ValidationError for missing id or
// source_type, or an unknown source_type. Kind-specific checks are the
// supervisor's.
Camera camera_from_json(const std::string& body);

// The password is never written out.
std::string camera_to_json(const Camera& camera);

// {"<id>": {...}, ...}
std::string cameras_to_json(const std::vector<Camera>& cameras);

std::string error_json(const std::string& detail);

}  // namespace camingest
