/**
 * @file Error.hpp
 * @brief Error taxonomy shared by probes, discovery and monitoring.
 *
 * Probe-level causes are carried inside results; engine-level failures are
 * thrown as EngineError.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace lanwatch::core {

/**
 * @brief Failure causes reported by the engine.
 */
enum class ErrorCode : int {
    Timeout = 0,            ///< No answer within the caller-specified timeout
    Unreachable = 1,        ///< Network or host reported unreachable
    ConnectionRefused = 2,  ///< Target actively refused the TCP handshake
    PermissionDenied = 3,   ///< Raw/ICMP socket not permitted for this process
    Unsupported = 4,        ///< Target does not run a bandwidth service
    DiscoveryFailed = 5,    ///< No usable network interface for a scan
    InvalidTarget = 6,      ///< Malformed address or address range
    InvalidConfiguration = 7 ///< Rejected engine parameters
};

/**
 * @brief Converts an error code to its canonical name.
 * @param code The error code.
 * @return Name such as "Timeout" or "ConnectionRefused".
 */
std::string errorCodeToString(ErrorCode code);

/**
 * @brief Parses a canonical error name.
 * @param str The name to parse.
 * @return The matching code, Timeout when the name is not recognised.
 */
ErrorCode errorCodeFromString(const std::string& str);

/**
 * @brief Exception thrown for engine-level failures.
 *
 * Only DiscoveryFailed, InvalidTarget and InvalidConfiguration are thrown;
 * per-probe causes are folded into results instead.
 */
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace lanwatch::core
