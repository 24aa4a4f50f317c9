#include "core/types/AddressRange.hpp"

#include "core/types/Error.hpp"

#include <algorithm>
#include <charconv>

namespace lanwatch::core {

namespace {

std::optional<int> parseNumber(const std::string& text, int maxValue) {
    if (text.empty() || text.size() > 3) {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value < 0 || value > maxValue) {
        return std::nullopt;
    }
    return value;
}

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

uint32_t prefixMask(int prefix) {
    return prefix == 0 ? 0 : ~uint32_t{0} << (32 - prefix);
}

} // namespace

std::optional<uint32_t> parseIpv4(const std::string& address) {
    uint32_t result = 0;
    size_t start = 0;

    for (int octet = 0; octet < 4; ++octet) {
        size_t end = address.find('.', start);
        if (octet < 3 && end == std::string::npos) {
            return std::nullopt;
        }
        if (octet == 3) {
            if (end != std::string::npos) {
                return std::nullopt;
            }
            end = address.size();
        }

        auto value = parseNumber(address.substr(start, end - start), 255);
        if (!value) {
            return std::nullopt;
        }
        result = (result << 8) | static_cast<uint32_t>(*value);
        start = end + 1;
    }

    return result;
}

std::string formatIpv4(uint32_t address) {
    return std::to_string((address >> 24) & 0xFF) + "." + std::to_string((address >> 16) & 0xFF) +
           "." + std::to_string((address >> 8) & 0xFF) + "." + std::to_string(address & 0xFF);
}

AddressRange::AddressRange(uint32_t first, uint32_t last) : first_(first), last_(last) {
    if (last_ < first_) {
        throw EngineError(ErrorCode::InvalidTarget,
                          "range end " + formatIpv4(last) + " precedes start " + formatIpv4(first));
    }
}

AddressRange AddressRange::fromCidr(uint32_t base, int prefix) {
    uint32_t mask = prefixMask(prefix);
    uint32_t network = base & mask;
    uint32_t broadcast = network | ~mask;

    if (prefix <= 29) {
        return AddressRange(network + 1, broadcast - 1);
    }
    // A /30 keeps its top address: small point-to-point and lab segments use it as a host.
    if (prefix == 30) {
        return AddressRange(network + 1, broadcast);
    }
    return AddressRange(network, broadcast);
}

AddressRange AddressRange::parse(const std::string& rawSpec) {
    std::string spec = trim(rawSpec);
    AddressRange range;

    if (auto slash = spec.find('/'); slash != std::string::npos) {
        auto base = parseIpv4(spec.substr(0, slash));
        auto prefix = parseNumber(spec.substr(slash + 1), 32);
        if (!base || !prefix) {
            throw EngineError(ErrorCode::InvalidTarget, "malformed CIDR range '" + spec + "'");
        }
        range = fromCidr(*base, *prefix);
    } else if (auto dash = spec.find('-'); dash != std::string::npos) {
        auto first = parseIpv4(trim(spec.substr(0, dash)));
        std::string tail = trim(spec.substr(dash + 1));
        if (!first) {
            throw EngineError(ErrorCode::InvalidTarget, "malformed range start in '" + spec + "'");
        }

        std::optional<uint32_t> last;
        if (tail.find('.') == std::string::npos) {
            if (auto octet = parseNumber(tail, 255)) {
                last = (*first & 0xFFFFFF00u) | static_cast<uint32_t>(*octet);
            }
        } else {
            last = parseIpv4(tail);
        }
        if (!last) {
            throw EngineError(ErrorCode::InvalidTarget, "malformed range end in '" + spec + "'");
        }
        range = AddressRange(*first, *last);
    } else {
        auto single = parseIpv4(spec);
        if (!single) {
            throw EngineError(ErrorCode::InvalidTarget, "malformed address '" + spec + "'");
        }
        range = AddressRange(*single, *single);
    }

    if (range.size() > kMaxAddresses) {
        throw EngineError(ErrorCode::InvalidTarget,
                          "range '" + spec + "' has " + std::to_string(range.size()) +
                              " addresses (limit " + std::to_string(kMaxAddresses) + ")");
    }
    return range;
}

AddressRange AddressRange::fromInterface(const std::string& address, const std::string& netmask,
                                         int minPrefix) {
    auto ip = parseIpv4(address);
    auto mask = parseIpv4(netmask);
    if (!ip || !mask) {
        throw EngineError(ErrorCode::InvalidTarget,
                          "malformed interface address " + address + "/" + netmask);
    }

    int prefix = 0;
    for (uint32_t m = *mask; m & 0x80000000u; m <<= 1) {
        ++prefix;
    }
    return fromCidr(*ip, std::max(prefix, minPrefix));
}

size_t AddressRange::size() const {
    return static_cast<size_t>(last_ - first_) + 1;
}

bool AddressRange::contains(const std::string& address) const {
    auto ip = parseIpv4(address);
    return ip && *ip >= first_ && *ip <= last_;
}

std::vector<std::string> AddressRange::addresses() const {
    std::vector<std::string> result;
    result.reserve(size());
    for (uint64_t ip = first_; ip <= last_; ++ip) {
        result.push_back(formatIpv4(static_cast<uint32_t>(ip)));
    }
    return result;
}

std::string AddressRange::toString() const {
    if (first_ == last_) {
        return formatIpv4(first_);
    }
    return formatIpv4(first_) + "-" + formatIpv4(last_);
}

} // namespace lanwatch::core
