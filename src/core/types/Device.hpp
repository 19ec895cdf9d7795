/**
 * @file Device.hpp
 * @brief Device definition and status types for discovered hosts.
 *
 * This file defines the Device structure which represents a host observed on
 * the local network, keyed by its hardware address once it is cataloged.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace netscan::core {

/**
 * @brief Reachability of a cataloged device as of the latest sweep.
 */
enum class DeviceStatus : int {
    Offline = 0, ///< Absent from the latest sweep of its network
    Online = 1   ///< Present in the latest sweep of its network
};

/**
 * @brief Represents a host observed by a discovery sweep.
 *
 * A device without a hardware address has no durable identity: it can be
 * listed in a sweep result but is never merged into the catalog.
 */
struct Device {
    std::string id;                         ///< Stable record identifier (UUID)
    std::string ip;                         ///< Last observed IPv4 address
    std::optional<std::string> mac;         ///< Hardware address, uppercase and colon separated
    std::optional<std::string> hostname;    ///< Last observed reverse-DNS name
    std::optional<std::string> customIconPath; ///< Icon assigned by the user, if any
    std::string owner;                      ///< User-entered owner
    std::string brand;                      ///< Vendor, detected or user-entered
    std::string model;                      ///< User-entered model
    std::chrono::system_clock::time_point lastSeen; ///< When the device was last observed
    DeviceStatus status{DeviceStatus::Offline}; ///< Derived on every merge

    /**
     * @brief Returns the name shown for the device.
     * @return The hostname when it is non-empty and differs from the IP,
     *         otherwise the IP.
     */
    [[nodiscard]] std::string displayName() const;

    /**
     * @brief Guesses an emoji for the device from its hostname.
     */
    [[nodiscard]] std::string iconEmoji() const;

    /**
     * @brief Checks whether the device has a durable identity.
     */
    [[nodiscard]] bool hasIdentity() const { return mac.has_value() && !mac->empty(); }

    /**
     * @brief Converts the device status to a human-readable string.
     * @return "online" or "offline".
     */
    [[nodiscard]] std::string statusToString() const;

    bool operator==(const Device& other) const = default;
};

/**
 * @brief Copies descriptive fields that are empty on @p target from @p source.
 *
 * Applies to owner, brand, model, hostname and customIconPath. Identity,
 * address, timestamps and status are left untouched, so repeated calls over
 * a list give "first non-empty wins" semantics.
 */
void fillMissingFields(Device& target, const Device& source);

/**
 * @brief Normalizes a hardware address to uppercase with colon separators.
 *
 * Single-digit octets as printed by some tools ("a:b:c:...") are zero padded.
 *
 * @param mac Address as reported by the system or the user.
 * @return Normalized address, e.g. "A4:83:E7:01:02:03".
 */
std::string normalizeMac(const std::string& mac);

} // namespace netscan::core
