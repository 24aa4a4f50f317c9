#include "core/types/Device.hpp"

#include "core/types/AddressRange.hpp"
#include "core/types/DeviceClassifier.hpp"

namespace lanwatch::core {

namespace {

int64_t toEpochMs(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

bool Device::isValid() const {
    return parseIpv4(address).has_value();
}

std::string Device::classToString() const {
    return deviceClassToString(deviceClass);
}

std::string Device::reachabilityToString() const {
    return reachabilityToString(reachability);
}

std::string Device::deviceClassToString(DeviceClass cls) {
    switch (cls) {
    case DeviceClass::Unknown:
        return "unknown";
    case DeviceClass::Router:
        return "router";
    case DeviceClass::Server:
        return "server";
    case DeviceClass::Desktop:
        return "desktop";
    case DeviceClass::Laptop:
        return "laptop";
    case DeviceClass::Phone:
        return "phone";
    case DeviceClass::Printer:
        return "printer";
    case DeviceClass::Camera:
        return "camera";
    }
    return "unknown";
}

DeviceClass Device::classFromString(const std::string& str) {
    if (str == "router")
        return DeviceClass::Router;
    if (str == "server")
        return DeviceClass::Server;
    if (str == "desktop")
        return DeviceClass::Desktop;
    if (str == "laptop")
        return DeviceClass::Laptop;
    if (str == "phone")
        return DeviceClass::Phone;
    if (str == "printer")
        return DeviceClass::Printer;
    if (str == "camera")
        return DeviceClass::Camera;
    return DeviceClass::Unknown;
}

std::string Device::reachabilityToString(Reachability state) {
    switch (state) {
    case Reachability::Unknown:
        return "unknown";
    case Reachability::Online:
        return "online";
    case Reachability::Offline:
        return "offline";
    }
    return "unknown";
}

Reachability Device::reachabilityFromString(const std::string& str) {
    if (str == "online")
        return Reachability::Online;
    if (str == "offline")
        return Reachability::Offline;
    return Reachability::Unknown;
}

std::string Device::defaultName(const std::string& address) {
    auto pos = address.rfind('.');
    if (pos == std::string::npos) {
        return "Device-" + address;
    }
    return "Device-" + address.substr(pos + 1);
}

void to_json(nlohmann::json& j, const Device& device) {
    j = nlohmann::json{{"address", device.address},
                       {"name", device.name},
                       {"class", device.classToString()},
                       {"reachability", device.reachabilityToString()},
                       {"open_ports", device.openPorts},
                       {"first_seen_ms", toEpochMs(device.firstSeen)}};

    auto services = nlohmann::json::array();
    for (uint16_t port : device.openPorts) {
        auto service = DeviceClassifier::detectService(port);
        if (!service.empty()) {
            services.push_back({{"port", port}, {"service", service}});
        }
    }
    j["services"] = std::move(services);

    j["mac"] = device.macAddress ? nlohmann::json(*device.macAddress) : nlohmann::json(nullptr);
    j["hostname"] = device.hostname ? nlohmann::json(*device.hostname) : nlohmann::json(nullptr);
    if (device.lastRtt) {
        j["last_rtt_us"] = device.lastRtt->count();
    }
    if (device.lastSeen) {
        j["last_seen_ms"] = toEpochMs(*device.lastSeen);
    }
}

} // namespace lanwatch::core
