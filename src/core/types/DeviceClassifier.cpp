#include "core/types/DeviceClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace lanwatch::core {

namespace {

bool hasPort(const std::vector<uint16_t>& ports, uint16_t port) {
    return std::find(ports.begin(), ports.end(), port) != ports.end();
}

std::vector<std::string> splitTokens(const std::string& name) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current.push_back(c);
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

// Short keywords must be a whole token, optionally numbered ("cam2"); keywords
// of five or more characters may also appear inside a token ("macbookpro").
bool tokenMatches(const std::string& token, const std::string& keyword) {
    if (token.compare(0, keyword.size(), keyword) == 0 &&
        std::all_of(token.begin() + static_cast<std::ptrdiff_t>(keyword.size()), token.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return true;
    }
    return keyword.size() >= 5 && token.find(keyword) != std::string::npos;
}

bool matchesAny(const std::string& name, const std::vector<std::string>& tokens,
                std::initializer_list<const char*> keywords) {
    return std::any_of(keywords.begin(), keywords.end(), [&](const char* keyword) {
        std::string key(keyword);
        if (key.find('.') != std::string::npos) {
            return name.find(key) != std::string::npos;
        }
        return std::any_of(tokens.begin(), tokens.end(),
                           [&key](const std::string& token) { return tokenMatches(token, key); });
    });
}

} // namespace

DeviceClass DeviceClassifier::classify(const ClassificationInput& input) {
    if (input.isDefaultGateway) {
        return DeviceClass::Router;
    }
    if (auto byPorts = classifyPorts(input.openPorts)) {
        return *byPorts;
    }
    if (input.macAddress) {
        if (auto byVendor = classifyVendor(*input.macAddress)) {
            return *byVendor;
        }
    }
    if (input.hostname) {
        if (auto byName = classifyHostname(*input.hostname)) {
            return *byName;
        }
    }
    return DeviceClass::Unknown;
}

std::optional<DeviceClass> DeviceClassifier::classifyPorts(const std::vector<uint16_t>& openPorts) {
    // Print spoolers: JetDirect, LPD, IPP
    if (hasPort(openPorts, 9100) || hasPort(openPorts, 515) || hasPort(openPorts, 631)) {
        return DeviceClass::Printer;
    }
    // RTSP streams
    if (hasPort(openPorts, 554)) {
        return DeviceClass::Camera;
    }
    // iOS lockdownd
    if (hasPort(openPorts, 62078)) {
        return DeviceClass::Phone;
    }
    if (hasPort(openPorts, 3389)) {
        return DeviceClass::Desktop;
    }
    if (hasPort(openPorts, 22) &&
        (hasPort(openPorts, 80) || hasPort(openPorts, 443) || hasPort(openPorts, 445))) {
        return DeviceClass::Server;
    }
    return std::nullopt;
}

std::optional<DeviceClass> DeviceClassifier::classifyVendor(const std::string& macAddress) {
    auto prefix = vendorPrefix(macAddress);
    if (prefix.empty()) {
        return std::nullopt;
    }

    const auto& vendors = getKnownVendors();
    auto it = vendors.find(prefix);
    if (it == vendors.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<DeviceClass> DeviceClassifier::classifyHostname(const std::string& hostname) {
    std::string name = hostname;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto tokens = splitTokens(name);

    if (matchesAny(name, tokens, {"router", "gateway", "fritz.box", "openwrt"})) {
        return DeviceClass::Router;
    }
    if (matchesAny(name, tokens, {"server", "nas", "srv"})) {
        return DeviceClass::Server;
    }
    if (matchesAny(name, tokens, {"printer", "print"})) {
        return DeviceClass::Printer;
    }
    if (matchesAny(name, tokens, {"cam", "ipcam", "nvr"})) {
        return DeviceClass::Camera;
    }
    if (matchesAny(name, tokens, {"phone", "mobile", "android", "galaxy"})) {
        return DeviceClass::Phone;
    }
    if (matchesAny(name, tokens, {"laptop", "notebook", "macbook"})) {
        return DeviceClass::Laptop;
    }
    if (matchesAny(name, tokens, {"desktop", "pc", "workstation", "imac"})) {
        return DeviceClass::Desktop;
    }
    return std::nullopt;
}

std::string DeviceClassifier::vendorPrefix(const std::string& macAddress) {
    std::string hex;
    for (char c : macAddress) {
        if (std::isxdigit(static_cast<unsigned char>(c))) {
            hex.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        } else if (c != ':' && c != '-' && c != '.') {
            return {};
        }
    }
    if (hex.size() != 12) {
        return {};
    }
    return hex.substr(0, 2) + ":" + hex.substr(2, 2) + ":" + hex.substr(4, 2);
}

const std::unordered_map<std::string, DeviceClass>& DeviceClassifier::getKnownVendors() {
    static const std::unordered_map<std::string, DeviceClass> vendors = {
        // Network equipment
        {"24:A4:3C", DeviceClass::Router},  {"80:2A:A8", DeviceClass::Router},
        {"A0:40:A0", DeviceClass::Router},  {"C0:25:E9", DeviceClass::Router},
        // Single-board computers and storage appliances
        {"B8:27:EB", DeviceClass::Server},  {"DC:A6:32", DeviceClass::Server},
        {"E4:5F:01", DeviceClass::Server},  {"00:11:32", DeviceClass::Server},
        // Printers
        {"00:80:77", DeviceClass::Printer}, {"00:1B:A9", DeviceClass::Printer},
        {"00:26:AB", DeviceClass::Printer}, {"00:00:85", DeviceClass::Printer},
        // Cameras
        {"00:40:8C", DeviceClass::Camera},  {"AC:CC:8E", DeviceClass::Camera},
        {"44:19:B6", DeviceClass::Camera}};
    return vendors;
}

std::string DeviceClassifier::detectService(uint16_t port) {
    static const std::unordered_map<uint16_t, std::string> services = {
        {22, "ssh"},    {23, "telnet"},    {53, "dns"},        {80, "http"},
        {139, "netbios"}, {443, "https"},  {445, "smb"},       {515, "lpd"},
        {554, "rtsp"},  {631, "ipp"},      {3389, "rdp"},      {5900, "vnc"},
        {8080, "http-alt"}, {8443, "https-alt"}, {9100, "jetdirect"}, {62078, "iphone-sync"}};
    auto it = services.find(port);
    return it != services.end() ? it->second : "";
}

} // namespace lanwatch::core
