/**
 * @file INetworkEnvironment.hpp
 * @brief Interface to the host's network configuration.
 *
 * This file defines the abstract interface used to select the interface a
 * sweep runs on and to read the name of the network it is attached to.
 */

#pragma once

#include "core/types/NetworkInterface.hpp"

#include <optional>
#include <string>

namespace netscan::core {

/**
 * @brief Interface for querying the local network environment.
 */
class INetworkEnvironment {
public:
    virtual ~INetworkEnvironment() = default;

    /**
     * @brief Selects the active IPv4 interface for a sweep.
     * @return The selected interface, or std::nullopt if no interface is
     *         up, running and non-loopback.
     */
    virtual std::optional<InterfaceInfo> selectInterface() = 0;

    /**
     * @brief Reads the SSID of the associated wireless network.
     * @return The SSID, or std::nullopt when no wireless interface is
     *         associated.
     */
    virtual std::optional<std::string> currentNetworkName() = 0;
};

} // namespace netscan::core
