#include "infrastructure/network/SystemEnvironment.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>

#ifdef __linux__
#include <linux/wireless.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace netscan::infra {

SystemEnvironment::SystemEnvironment(std::string preferredInterface,
                                     std::filesystem::path wirelessPath)
    : preferredInterface_(std::move(preferredInterface)), wirelessPath_(std::move(wirelessPath)) {}

std::optional<core::InterfaceInfo> SystemEnvironment::selectInterface() {
    auto interfaces = core::NetworkInterfaceEnumerator::enumerate();
    auto selected = core::NetworkInterfaceEnumerator::selectPrimary(interfaces, preferredInterface_);

    if (selected) {
        spdlog::debug("Selected interface {} ({}/{})", selected->name, selected->address,
                      selected->netmask);
    } else {
        spdlog::warn("No active IPv4 interface among {} addresses", interfaces.size());
    }
    return selected;
}

std::vector<std::string> SystemEnvironment::parseWirelessInterfaces(std::istream& input) {
    std::vector<std::string> names;
    std::string line;

    std::getline(input, line); // "Inter-| sta-|   Quality ..."
    std::getline(input, line); // " face | tus | link level noise ..."

    while (std::getline(input, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        auto name = line.substr(0, colon);
        name.erase(0, name.find_first_not_of(" \t"));
        name.erase(name.find_last_not_of(" \t") + 1);
        if (!name.empty()) {
            names.push_back(name);
        }
    }

    return names;
}

std::optional<std::string> SystemEnvironment::currentNetworkName() {
    std::ifstream file(wirelessPath_);
    if (!file) {
        spdlog::debug("No wireless status table at {}", wirelessPath_.string());
        return std::nullopt;
    }

    auto interfaces = parseWirelessInterfaces(file);
    auto preferred = std::find(interfaces.begin(), interfaces.end(), preferredInterface_);
    if (preferred != interfaces.end()) {
        std::rotate(interfaces.begin(), preferred, preferred + 1);
    }

    for (const auto& name : interfaces) {
        if (auto essid = readEssid(name)) {
            spdlog::debug("Interface {} is associated with \"{}\"", name, *essid);
            return essid;
        }
    }

    return std::nullopt;
}

std::optional<std::string> SystemEnvironment::readEssid(const std::string& interfaceName) const {
#ifdef __linux__
    if (interfaceName.size() >= IFNAMSIZ) {
        return std::nullopt;
    }

    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        spdlog::debug("Cannot open control socket for {}: {}", interfaceName,
                      std::strerror(errno));
        return std::nullopt;
    }

    std::array<char, IW_ESSID_MAX_SIZE + 1> essid{};
    struct iwreq request {};
    std::strncpy(request.ifr_name, interfaceName.c_str(), IFNAMSIZ - 1);
    request.u.essid.pointer = essid.data();
    request.u.essid.length = IW_ESSID_MAX_SIZE;

    int rc = ioctl(fd, SIOCGIWESSID, &request);
    close(fd);

    if (rc < 0) {
        spdlog::debug("SIOCGIWESSID failed for {}: {}", interfaceName, std::strerror(errno));
        return std::nullopt;
    }

    size_t length = std::min<size_t>(request.u.essid.length, IW_ESSID_MAX_SIZE);
    std::string name(essid.data(), length);
    if (name.empty()) {
        return std::nullopt;
    }
    return name;
#else
    (void)interfaceName;
    return std::nullopt;
#endif
}

} // namespace netscan::infra
