/**
 * @file IProbeService.hpp
 * @brief Interface for the per-host probes used by a discovery sweep.
 *
 * This file defines the abstract interface for liveness checks, neighbor
 * table lookups and reverse DNS resolution. Every probe is bounded by its own
 * timeout and reports failure as a negative result rather than an error.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace netscan::core {

/**
 * @brief A resolved entry of the system neighbor (ARP) table.
 */
struct NeighborEntry {
    std::string ip;     ///< IPv4 address of the neighbor
    std::string mac;    ///< Normalized hardware address
    std::string device; ///< Interface the entry was learned on

    bool operator==(const NeighborEntry& other) const = default;
};

/**
 * @brief Interface for host probes.
 *
 * Implementations must never throw from these methods; any transport,
 * permission or parsing failure is reported as "not alive" or absent.
 */
class IProbeService {
public:
    /**
     * @brief Default wait budget of the liveness probe.
     */
    static constexpr std::chrono::milliseconds kDefaultPingTimeout{700};

    /**
     * @brief Default wait budget of the reverse DNS probe.
     */
    static constexpr std::chrono::milliseconds kDefaultDnsTimeout{1000};

    virtual ~IProbeService() = default;

    /**
     * @brief Sends a single ICMP echo request and waits for the reply.
     * @param ip Target IPv4 address.
     * @param timeout Maximum time to wait for the reply.
     * @return True if a matching echo reply arrived in time.
     */
    virtual bool isAlive(const std::string& ip, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Looks up the hardware address of an IP in the neighbor table.
     * @param ip Target IPv4 address.
     * @return The normalized MAC, or std::nullopt for missing or incomplete entries.
     */
    virtual std::optional<std::string> resolveNeighbor(const std::string& ip) = 0;

    /**
     * @brief Resolves the PTR name of an IP.
     * @param ip Target IPv4 address.
     * @param timeout Maximum time to wait for the resolver.
     * @return The host name, or std::nullopt on failure, timeout or no PTR record.
     */
    virtual std::optional<std::string> resolveHostname(const std::string& ip,
                                                       std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Dumps every complete entry of the neighbor table.
     */
    virtual std::vector<NeighborEntry> snapshotNeighborTable() = 0;
};

} // namespace netscan::core
