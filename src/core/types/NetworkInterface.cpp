#include "core/types/NetworkInterface.hpp"

#ifdef __linux__
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#endif

namespace netscan::core {

namespace {

#ifdef __linux__
std::string formatAddress(const struct sockaddr* sa) {
    if (sa == nullptr || sa->sa_family != AF_INET) {
        return {};
    }

    char buffer[INET_ADDRSTRLEN];
    const auto* addr = reinterpret_cast<const struct sockaddr_in*>(sa);
    if (inet_ntop(AF_INET, &addr->sin_addr, buffer, INET_ADDRSTRLEN) == nullptr) {
        return {};
    }
    return buffer;
}
#endif

} // namespace

bool NetworkInterface::isUsable() const {
    return isUp && isRunning && !isLoopback && !ipAddress.empty();
}

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
        iface.isRunning = (ifa->ifa_flags & IFF_RUNNING) != 0;
        iface.isLoopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
        iface.ipAddress = formatAddress(ifa->ifa_addr);
        iface.netmask = formatAddress(ifa->ifa_netmask);

        interfaces.push_back(std::move(iface));
    }

    freeifaddrs(ifaddr);
#endif

    return interfaces;
}

std::optional<InterfaceInfo>
NetworkInterfaceEnumerator::selectPrimary(const std::vector<NetworkInterface>& interfaces,
                                          const std::string& preferredName) {
    std::optional<InterfaceInfo> best;

    for (const auto& iface : interfaces) {
        if (!iface.isUsable()) {
            continue;
        }

        InterfaceInfo info{iface.name, iface.ipAddress, iface.netmask};
        if (!preferredName.empty() && iface.name == preferredName) {
            return info;
        }
        if (!best) {
            best = std::move(info);
        }
    }

    return best;
}

} // namespace netscan::core
