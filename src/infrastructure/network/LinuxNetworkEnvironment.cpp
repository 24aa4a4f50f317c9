#include "infrastructure/network/LinuxNetworkEnvironment.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <future>
#include <memory>
#include <sstream>
#include <thread>

#include <arpa/inet.h>

#ifdef __linux__
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#endif

namespace lanwatch::infra {

namespace {

std::optional<std::string> resolveName(const std::string& address) {
#ifdef __linux__
    struct sockaddr_in addr {};
    addr.sin_family = AF_INET;
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return std::nullopt;
    }

    char host[NI_MAXHOST];
    int rc = getnameinfo(reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr), host,
                         sizeof(host), nullptr, 0, NI_NAMEREQD);
    if (rc != 0) {
        return std::nullopt;
    }
    return std::string(host);
#else
    (void)address;
    return std::nullopt;
#endif
}

constexpr unsigned long ATF_COMPLETE_FLAG = 0x02;
constexpr unsigned long RTF_UP_FLAG = 0x0001;
constexpr unsigned long RTF_GATEWAY_FLAG = 0x0002;

std::optional<unsigned long> parseHex(const std::string& text) {
    try {
        size_t consumed = 0;
        unsigned long value = std::stoul(text, &consumed, 16);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

std::vector<core::NetworkInterface> LinuxNetworkEnvironment::interfaces() const {
    return core::NetworkInterfaceEnumerator::enumerate();
}

std::optional<std::string> LinuxNetworkEnvironment::defaultGateway() const {
    std::ifstream file("/proc/net/route");
    if (!file) {
        spdlog::debug("Cannot read /proc/net/route");
        return std::nullopt;
    }
    return parseDefaultGateway(file);
}

std::unordered_map<std::string, std::string> LinuxNetworkEnvironment::neighborTable() const {
    std::ifstream file("/proc/net/arp");
    if (!file) {
        spdlog::debug("Cannot read /proc/net/arp");
        return {};
    }
    return parseNeighborTable(file);
}

std::optional<std::string> LinuxNetworkEnvironment::reverseLookup(
    const std::string& address, std::chrono::milliseconds timeout) const {
    if (timeout.count() <= 0) {
        return std::nullopt;
    }

    // The helper owns its state, so it may outlive this call and this object.
    auto promise = std::make_shared<std::promise<std::optional<std::string>>>();
    auto answer = promise->get_future();
    std::thread([address, promise]() { promise->set_value(resolveName(address)); }).detach();

    if (answer.wait_for(timeout) != std::future_status::ready) {
        spdlog::debug("Reverse lookup of {} timed out after {} ms", address, timeout.count());
        return std::nullopt;
    }
    return answer.get();
}

std::unordered_map<std::string, std::string> LinuxNetworkEnvironment::parseNeighborTable(
    std::istream& input) {
    std::unordered_map<std::string, std::string> table;
    std::string line;

    // IP address  HW type  Flags  HW address  Mask  Device
    std::getline(input, line);
    while (std::getline(input, line)) {
        std::istringstream fields(line);
        std::string ip;
        std::string hwType;
        std::string flags;
        std::string mac;
        if (!(fields >> ip >> hwType >> flags >> mac)) {
            continue;
        }

        auto flagValue = parseHex(flags.rfind("0x", 0) == 0 ? flags.substr(2) : flags);
        if (!flagValue || (*flagValue & ATF_COMPLETE_FLAG) == 0) {
            continue;
        }
        if (mac == "00:00:00:00:00:00") {
            continue;
        }

        std::transform(mac.begin(), mac.end(), mac.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        table[ip] = mac;
    }

    return table;
}

std::optional<std::string> LinuxNetworkEnvironment::parseDefaultGateway(std::istream& input) {
    std::string line;

    // Iface  Destination  Gateway  Flags  RefCnt  Use  Metric  Mask ...
    std::getline(input, line);
    while (std::getline(input, line)) {
        std::istringstream fields(line);
        std::string iface;
        std::string destination;
        std::string gateway;
        std::string flags;
        if (!(fields >> iface >> destination >> gateway >> flags)) {
            continue;
        }

        auto dest = parseHex(destination);
        auto gw = parseHex(gateway);
        auto flagValue = parseHex(flags);
        if (!dest || !gw || !flagValue || *dest != 0 || *gw == 0) {
            continue;
        }
        if ((*flagValue & RTF_UP_FLAG) == 0 || (*flagValue & RTF_GATEWAY_FLAG) == 0) {
            continue;
        }

        // The kernel prints the network-order word as a native integer, so
        // the parsed value has the in-memory layout of s_addr on this host.
        struct in_addr addr {};
        addr.s_addr = static_cast<uint32_t>(*gw);
        char text[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &addr, text, sizeof(text)) == nullptr) {
            continue;
        }
        return std::string(text);
    }

    return std::nullopt;
}

} // namespace lanwatch::infra
