/**
 * @file Network.hpp
 * @brief Network record grouping the devices seen on one SSID.
 *
 * This file defines the Network structure held by the catalog and the
 * identifier helper shared by network and device records.
 */

#pragma once

#include "core/types/Device.hpp"

#include <chrono>
#include <map>
#include <string>

namespace netscan::core {

/**
 * @brief Name used for networks whose SSID cannot be determined.
 *
 * Ethernet links and disassociated wireless interfaces all resolve to this
 * name, so they share a single catalog record.
 */
inline constexpr const char* kUnknownNetworkName = "Unknown";

/**
 * @brief Emoji given to newly created networks.
 */
inline constexpr const char* kDefaultNetworkEmoji = "📶";

/**
 * @brief A network and the devices observed on it.
 */
struct Network {
    std::string id;                       ///< Stable record identifier (UUID)
    std::string ssid;                     ///< Network name, or kUnknownNetworkName
    std::string emoji{kDefaultNetworkEmoji}; ///< User-editable display tag
    std::map<std::string, Device> devices; ///< Devices keyed by normalized MAC
    std::chrono::system_clock::time_point lastSeen; ///< Time of the latest merge

    /**
     * @brief Checks whether this is the shared record for unnamed networks.
     */
    [[nodiscard]] bool isUnknown() const { return ssid == kUnknownNetworkName; }

    /**
     * @brief Counts devices currently marked online.
     */
    [[nodiscard]] size_t onlineCount() const;

    /**
     * @brief Finds a device by its record identifier.
     * @return Pointer into the device map, or nullptr if absent.
     */
    [[nodiscard]] const Device* findDeviceById(const std::string& deviceId) const;

    bool operator==(const Network& other) const = default;
};

/**
 * @brief Generates a random RFC 4122 version 4 identifier.
 * @return Lowercase UUID string such as "3f2b...-4...-a...".
 */
std::string generateId();

} // namespace netscan::core
