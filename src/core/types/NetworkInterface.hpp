/**
 * @file NetworkInterface.hpp
 * @brief Network interface types and enumeration utilities.
 *
 * This file defines structures for representing local IPv4 interfaces along
 * with the enumerator and selection policy used to pick the interface whose
 * subnet a discovery sweep covers.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace netscan::core {

/**
 * @brief Represents one IPv4 address assignment of a system interface.
 */
struct NetworkInterface {
    std::string name;       ///< System name of the interface (e.g., "wlan0", "eth0")
    std::string ipAddress;  ///< IPv4 address assigned to the interface
    std::string netmask;    ///< IPv4 netmask of the assignment
    bool isUp{false};       ///< Whether the interface is administratively up
    bool isRunning{false};  ///< Whether the interface has carrier / is operational
    bool isLoopback{false}; ///< Whether this is a loopback interface

    /**
     * @brief Checks whether the interface can carry a sweep.
     * @return True if up, running, not loopback, and has an address.
     */
    [[nodiscard]] bool isUsable() const;

    bool operator==(const NetworkInterface& other) const = default;
};

/**
 * @brief The interface selected for a sweep.
 */
struct InterfaceInfo {
    std::string name;    ///< Interface name, used for labels and logs
    std::string address; ///< IPv4 address
    std::string netmask; ///< IPv4 netmask

    bool operator==(const InterfaceInfo& other) const = default;
};

/**
 * @brief Utility class for enumerating and selecting network interfaces.
 */
class NetworkInterfaceEnumerator {
public:
    /**
     * @brief Enumerates all IPv4 interface addresses on the system.
     * @return Interfaces in the order the operating system reports them.
     */
    static std::vector<NetworkInterface> enumerate();

    /**
     * @brief Applies the selection policy to an enumerated list.
     *
     * Only usable interfaces are considered. An interface named
     * @p preferredName wins immediately; otherwise the first usable one in
     * enumeration order is returned.
     *
     * @param interfaces Enumerated interfaces.
     * @param preferredName Name of the conventional primary wireless interface.
     * @return The selected interface, or std::nullopt if none is usable.
     */
    static std::optional<InterfaceInfo> selectPrimary(const std::vector<NetworkInterface>& interfaces,
                                                      const std::string& preferredName);
};

} // namespace netscan::core
