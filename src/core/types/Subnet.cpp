#include "core/types/Subnet.hpp"

#include <algorithm>
#include <bit>
#include <charconv>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace netscan::core {

namespace {

uint32_t maskForPrefix(int prefix) {
    if (prefix <= 0) {
        return 0;
    }
    if (prefix >= 32) {
        return 0xFFFFFFFFu;
    }
    return 0xFFFFFFFFu << (32 - prefix);
}

} // namespace

uint32_t Subnet::mask() const {
    return maskForPrefix(prefix);
}

uint32_t Subnet::broadcast() const {
    return (network & mask()) | ~mask();
}

bool Subnet::contains(const std::string& ip) const {
    auto value = ipToUInt32(ip);
    return value && (*value & mask()) == (network & mask());
}

std::string Subnet::toString() const {
    return uint32ToIp(network) + "/" + std::to_string(prefix);
}

std::optional<uint32_t> ipToUInt32(const std::string& ip) {
    struct in_addr addr {};
    if (inet_pton(AF_INET, ip.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return ntohl(addr.s_addr);
}

std::string uint32ToIp(uint32_t value) {
    struct in_addr addr {};
    addr.s_addr = htonl(value);

    char buffer[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr, buffer, INET_ADDRSTRLEN) == nullptr) {
        return {};
    }
    return buffer;
}

int prefixFromNetmask(const std::string& netmask) {
    auto value = ipToUInt32(netmask);
    if (!value) {
        return 0;
    }
    return std::popcount(*value);
}

int effectivePrefix(int prefix) {
    return (prefix >= kMinSweepPrefix && prefix <= kMaxSweepPrefix) ? prefix
                                                                    : kDefaultSweepPrefix;
}

std::optional<Subnet> sweepSubnet(const std::string& address, const std::string& netmask) {
    auto base = ipToUInt32(address);
    if (!base) {
        return std::nullopt;
    }

    Subnet subnet;
    subnet.prefix = effectivePrefix(prefixFromNetmask(netmask));
    subnet.network = *base & subnet.mask();
    return subnet;
}

std::vector<std::string> enumerateHosts(const std::string& address, const std::string& netmask) {
    std::vector<std::string> hosts;

    auto subnet = sweepSubnet(address, netmask);
    if (!subnet) {
        return hosts;
    }

    uint32_t first = subnet->network + 1;
    uint32_t last = subnet->broadcast();
    hosts.reserve(last - first);
    for (uint32_t addr = first; addr < last; ++addr) {
        hosts.push_back(uint32ToIp(addr));
    }

    return hosts;
}

std::string subnetLabel(const std::string& ip, int prefix) {
    return ip + "/" + std::to_string(effectivePrefix(prefix));
}

std::vector<int> ipToSortable(const std::string& ip) {
    std::vector<int> parts;
    std::istringstream stream(ip);
    std::string token;

    while (std::getline(stream, token, '.')) {
        int value = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec != std::errc() || ptr != token.data() + token.size()) {
            value = 0;
        }
        parts.push_back(value);
    }

    return parts;
}

bool ipLess(const std::string& a, const std::string& b) {
    auto lhs = ipToSortable(a);
    auto rhs = ipToSortable(b);
    size_t n = std::max(lhs.size(), rhs.size());

    for (size_t i = 0; i < n; ++i) {
        int l = i < lhs.size() ? lhs[i] : 0;
        int r = i < rhs.size() ? rhs[i] : 0;
        if (l != r) {
            return l < r;
        }
    }
    return false;
}

} // namespace netscan::core
