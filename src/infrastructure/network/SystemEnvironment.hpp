#pragma once

#include "core/services/INetworkEnvironment.hpp"

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace netscan::infra {

/**
 * @brief Linux implementation of core::INetworkEnvironment.
 *
 * Interfaces are enumerated with getifaddrs(). The SSID is read with the
 * wireless extensions SIOCGIWESSID ioctl from each interface listed in
 * /proc/net/wireless, starting with the preferred one.
 */
class SystemEnvironment : public core::INetworkEnvironment {
public:
    /**
     * @brief Constructs the environment.
     * @param preferredInterface Name of the primary wireless interface.
     * @param wirelessPath Path of the wireless status table.
     */
    explicit SystemEnvironment(std::string preferredInterface = "wlan0",
                               std::filesystem::path wirelessPath = "/proc/net/wireless");

    std::optional<core::InterfaceInfo> selectInterface() override;

    std::optional<std::string> currentNetworkName() override;

    /**
     * @brief Lists interface names from /proc/net/wireless text.
     * @param input Stream positioned at the first header line.
     * @return Interface names in table order.
     */
    static std::vector<std::string> parseWirelessInterfaces(std::istream& input);

private:
    std::optional<std::string> readEssid(const std::string& interfaceName) const;

    std::string preferredInterface_;
    std::filesystem::path wirelessPath_;
};

} // namespace netscan::infra
