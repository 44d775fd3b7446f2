#pragma once

#include <stdexcept>
#include <string>

namespace camingest {

// Caller-side mistakes: bad registration parameters, bad configuration values.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

}  // namespace camingest
