#include "core/types/NetworkInterface.hpp"

#include <fstream>

#ifdef __linux__
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#endif

namespace lanwatch::core {

std::vector<NetworkInterface> NetworkInterfaceEnumerator::enumerate() {
    std::vector<NetworkInterface> interfaces;

#ifdef __linux__
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        return interfaces;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr) {
            continue;
        }

        if (ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        NetworkInterface iface;
        iface.name = ifa->ifa_name;
        iface.isUp = (ifa->ifa_flags & IFF_UP) != 0;
        iface.isLoopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;

        char ipStr[INET_ADDRSTRLEN];
        auto* addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        inet_ntop(AF_INET, &addr->sin_addr, ipStr, INET_ADDRSTRLEN);
        iface.ipAddress = ipStr;

        if (ifa->ifa_netmask != nullptr) {
            auto* mask = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_netmask);
            inet_ntop(AF_INET, &mask->sin_addr, ipStr, INET_ADDRSTRLEN);
            iface.netmask = ipStr;
        }

        iface.macAddress = readMacAddress(iface.name);
        iface.speedMbps = readSpeed(iface.name);
        interfaces.push_back(std::move(iface));
    }

    freeifaddrs(ifaddr);
#endif

    return interfaces;
}

std::string NetworkInterfaceEnumerator::readMacAddress(const std::string& interfaceName) {
    std::string mac;
#ifdef __linux__
    std::ifstream file("/sys/class/net/" + interfaceName + "/address");
    if (file) {
        file >> mac;
    }
#endif
    return mac;
}

std::optional<int> NetworkInterfaceEnumerator::readSpeed(const std::string& interfaceName) {
#ifdef __linux__
    std::ifstream file("/sys/class/net/" + interfaceName + "/speed");
    int speed = 0;
    // Virtual links report -1 or fail the read with EINVAL
    if (file && (file >> speed) && speed > 0) {
        return speed;
    }
#endif
    return std::nullopt;
}

} // namespace lanwatch::core
