#pragma once

#include <stdexcept>
#include <string>

class ArcpackException : public std::runtime_error {
public:
    explicit ArcpackException(const std::string& message)
        : std::runtime_error(message) {}
};
