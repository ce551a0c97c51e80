#pragma once

#include <stdexcept>
#include <string>

namespace kitchen {

// Malformed detection/classification batch. The whole frame is rejected.
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace kitchen
