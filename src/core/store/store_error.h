#pragma once

#include <stdexcept>
#include <string>

namespace aq {

// Thrown by stores when their backing data cannot be read.
class DataSourceError : public std::runtime_error {
public:
    explicit DataSourceError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace aq
