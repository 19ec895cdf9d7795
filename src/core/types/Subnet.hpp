/**
 * @file Subnet.hpp
 * @brief IPv4 address arithmetic and subnet host enumeration.
 *
 * This file defines helpers for converting between dotted-quad strings and
 * integers, deriving prefix lengths from netmasks, and enumerating the host
 * addresses of the subnet a discovery sweep covers.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netscan::core {

/**
 * @brief Smallest prefix length that is enumerated as-is.
 *
 * Interfaces with a natural prefix outside [kMinSweepPrefix, kMaxSweepPrefix]
 * are swept as if they were a /24.
 */
constexpr int kMinSweepPrefix = 24;
constexpr int kMaxSweepPrefix = 30;
constexpr int kDefaultSweepPrefix = 24;

/**
 * @brief An IPv4 subnet identified by its network address and prefix length.
 */
struct Subnet {
    uint32_t network{0}; ///< Network base address (host byte order)
    int prefix{kDefaultSweepPrefix}; ///< Prefix length in bits

    /**
     * @brief Returns the netmask for this subnet's prefix (host byte order).
     */
    [[nodiscard]] uint32_t mask() const;

    /**
     * @brief Returns the broadcast address of the subnet (host byte order).
     */
    [[nodiscard]] uint32_t broadcast() const;

    /**
     * @brief Checks whether an address lies inside the subnet.
     * @param ip Dotted-quad address to test.
     * @return True if the address parses and shares the subnet's network bits.
     */
    [[nodiscard]] bool contains(const std::string& ip) const;

    /**
     * @brief Formats the subnet as "a.b.c.d/N".
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const Subnet& other) const = default;
};

/**
 * @brief Parses a dotted-quad IPv4 address.
 * @param ip Address string such as "192.168.1.10".
 * @return Address in host byte order, or std::nullopt if not a valid address.
 */
std::optional<uint32_t> ipToUInt32(const std::string& ip);

/**
 * @brief Formats a host-byte-order address as a dotted-quad string.
 */
std::string uint32ToIp(uint32_t value);

/**
 * @brief Counts the set bits of a dotted-quad netmask.
 * @param netmask Netmask string such as "255.255.255.0".
 * @return Prefix length, or 0 if the netmask does not parse.
 */
int prefixFromNetmask(const std::string& netmask);

/**
 * @brief Clamps a natural prefix to the range the sweep enumerates.
 * @return The prefix itself when inside [24,30], otherwise 24.
 */
int effectivePrefix(int prefix);

/**
 * @brief Derives the subnet a sweep covers for an interface address.
 * @param address Interface address.
 * @param netmask Interface netmask.
 * @return The subnet with its effective prefix, or std::nullopt if the
 *         address does not parse.
 */
std::optional<Subnet> sweepSubnet(const std::string& address, const std::string& netmask);

/**
 * @brief Enumerates the host addresses of the swept subnet.
 *
 * Excludes the network and broadcast addresses and returns the remaining
 * addresses in ascending numeric order.
 *
 * @param address Interface address.
 * @param netmask Interface netmask.
 * @return Ordered host addresses; empty if the address does not parse.
 */
std::vector<std::string> enumerateHosts(const std::string& address, const std::string& netmask);

/**
 * @brief Formats "ip/prefix" using the effective prefix.
 */
std::string subnetLabel(const std::string& ip, int prefix);

/**
 * @brief Splits an address into numeric components for ordering.
 *
 * Components that are missing or not numeric are reported as 0.
 */
std::vector<int> ipToSortable(const std::string& ip);

/**
 * @brief Strict weak ordering of dotted-quad strings by numeric value.
 *
 * Components are compared left to right as integers; a missing component on
 * either side is treated as 0, so malformed input is still totally ordered.
 */
bool ipLess(const std::string& a, const std::string& b);

} // namespace netscan::core
