#include "core/types/ProbeResult.hpp"

namespace lanwatch::core {

std::string ProbeResult::kindToString() const {
    return probeKindToString(kind);
}

ProbeResult ProbeResult::succeeded(const std::string& address, ProbeKind kind,
                                   std::chrono::system_clock::time_point timestamp,
                                   std::chrono::microseconds rtt) {
    ProbeResult result;
    result.address = address;
    result.kind = kind;
    result.timestamp = timestamp;
    result.success = true;
    result.rtt = rtt;
    return result;
}

ProbeResult ProbeResult::failed(const std::string& address, ProbeKind kind,
                                std::chrono::system_clock::time_point timestamp,
                                ErrorCode cause) {
    ProbeResult result;
    result.address = address;
    result.kind = kind;
    result.timestamp = timestamp;
    result.success = false;
    result.error = cause;
    return result;
}

std::string probeKindToString(ProbeKind kind) {
    switch (kind) {
    case ProbeKind::Icmp:
        return "ICMP";
    case ProbeKind::TcpPort:
        return "TCP";
    case ProbeKind::Bandwidth:
        return "Bandwidth";
    }
    return "Unknown";
}

std::string bandwidthDirectionToString(BandwidthDirection direction) {
    return direction == BandwidthDirection::Upload ? "upload" : "download";
}

BandwidthDirection bandwidthDirectionFromString(const std::string& str) {
    return str == "upload" ? BandwidthDirection::Upload : BandwidthDirection::Download;
}

} // namespace lanwatch::core
