#pragma once

#include <string>

namespace camingest {

// One line per call, "[LEVEL] [component] message". INFO goes to stdout,
// WARN and ERROR to stderr.
void log_info(const std::string& component, const std::string& msg);
void log_warn(const std::string& component, const std::string& msg);
void log_error(const std::string& component, const std::string& msg);

}  // namespace camingest
