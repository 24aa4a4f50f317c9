#include "core/types/Error.hpp"

namespace lanwatch::core {

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::Timeout:
        return "Timeout";
    case ErrorCode::Unreachable:
        return "Unreachable";
    case ErrorCode::ConnectionRefused:
        return "ConnectionRefused";
    case ErrorCode::PermissionDenied:
        return "PermissionDenied";
    case ErrorCode::Unsupported:
        return "Unsupported";
    case ErrorCode::DiscoveryFailed:
        return "DiscoveryFailed";
    case ErrorCode::InvalidTarget:
        return "InvalidTarget";
    case ErrorCode::InvalidConfiguration:
        return "InvalidConfiguration";
    }
    return "Unknown";
}

ErrorCode errorCodeFromString(const std::string& str) {
    if (str == "Unreachable")
        return ErrorCode::Unreachable;
    if (str == "ConnectionRefused")
        return ErrorCode::ConnectionRefused;
    if (str == "PermissionDenied")
        return ErrorCode::PermissionDenied;
    if (str == "Unsupported")
        return ErrorCode::Unsupported;
    if (str == "DiscoveryFailed")
        return ErrorCode::DiscoveryFailed;
    if (str == "InvalidTarget")
        return ErrorCode::InvalidTarget;
    if (str == "InvalidConfiguration")
        return ErrorCode::InvalidConfiguration;
    return ErrorCode::Timeout;
}

EngineError::EngineError(ErrorCode code, const std::string& message)
    : std::runtime_error(errorCodeToString(code) + ": " + message), code_(code) {}

} // namespace lanwatch::core
