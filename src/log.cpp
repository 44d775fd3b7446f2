#include "log.hpp"

#include <iostream>
#include <mutex>

namespace camingest {

namespace {
std::mutex& log_mutex() {
    static std::mutex mu;
    return mu;
}

void write_line(std::ostream& os, const char* level, const std::string& component, const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    os << "[" << level << "] [" << component << "] " << msg << std::endl;
}
}  // namespace

void log_info(const std::string& component, const std::string& msg) {
    write_line(std::cout, "INFO", component, msg);
}

void log_warn(const std::string& component, const std::string& msg) {
    write_line(std::cerr, "WARN", component, msg);
}

void log_error(const std::string& component, const std::string& msg) {
    write_line(std::cerr, "ERROR", component, msg);
}

}  // namespace camingest
