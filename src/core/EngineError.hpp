/**
 * @file EngineError.hpp
 * @brief Exception types reported by the synthesis engine.
 */

#ifndef HANDTONE_ENGINE_ERROR_HPP
#define HANDTONE_ENGINE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace handtone {

enum class ErrorKind {
    DeviceUnavailable, // Output device could not be opened or configured
    StreamFault,       // Running stream failed mid-block
    InvalidParameter   // Engine built from an invalid configuration
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DeviceUnavailable: return "DeviceUnavailable";
        case ErrorKind::StreamFault: return "StreamFault";
        case ErrorKind::InvalidParameter: return "InvalidParameter";
    }
    return "Unknown";
}

/**
 * @brief Base class for all engine errors.
 */
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& what)
        : std::runtime_error(std::string(to_string(kind)) + ": " + what)
        , kind_(kind)
    {
    }

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class DeviceUnavailable : public EngineError {
public:
    explicit DeviceUnavailable(const std::string& what)
        : EngineError(ErrorKind::DeviceUnavailable, what) {}
};

class StreamFault : public EngineError {
public:
    explicit StreamFault(const std::string& what)
        : EngineError(ErrorKind::StreamFault, what) {}
};

class InvalidParameter : public EngineError {
public:
    explicit InvalidParameter(const std::string& what)
        : EngineError(ErrorKind::InvalidParameter, what) {}
};

} // namespace handtone

#endif // HANDTONE_ENGINE_ERROR_HPP
