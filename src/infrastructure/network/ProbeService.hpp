#pragma once

#include "core/services/IProbeService.hpp"
#include "infrastructure/network/NeighborTable.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace netscan::infra {

/**
 * @brief Host probes backed by ICMP sockets, the kernel neighbor table and
 *        the system resolver.
 *
 * Implements the core::IProbeService interface. All methods are safe to call
 * concurrently from the sweep's worker pool.
 *
 * @note The liveness probe first tries an unprivileged ICMP datagram socket
 *       (governed by net.ipv4.ping_group_range) and falls back to a raw
 *       socket, which requires CAP_NET_RAW.
 */
class ProbeService : public core::IProbeService {
public:
    static constexpr size_t kDefaultMaxPendingLookups = 128;

    /**
     * @brief Constructs a ProbeService reading the given neighbor table.
     * @param neighbors Neighbor table reader.
     * @param maxPendingLookups Upper bound on reverse lookups still running.
     */
    explicit ProbeService(NeighborTable neighbors = NeighborTable(),
                          size_t maxPendingLookups = kDefaultMaxPendingLookups);

    bool isAlive(const std::string& ip, std::chrono::milliseconds timeout) override;

    std::optional<std::string> resolveNeighbor(const std::string& ip) override;

    /**
     * @brief Reverse lookup bounded by @p timeout.
     *
     * getnameinfo() cannot be interrupted, so each lookup runs on a detached
     * thread that is abandoned when the timeout expires and finishes on its
     * own. While maxPendingLookups of those threads are still running, further
     * lookups return std::nullopt without starting a thread.
     */
    std::optional<std::string> resolveHostname(const std::string& ip,
                                               std::chrono::milliseconds timeout) override;

    /**
     * @brief Number of reverse lookups whose thread has not finished.
     */
    size_t pendingLookups() const { return pendingLookups_->load(); }

    std::vector<core::NeighborEntry> snapshotNeighborTable() override;

    // ICMP helpers
    static uint16_t calculateChecksum(const uint8_t* data, size_t length);
    static std::vector<uint8_t> buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence);

private:
    NeighborTable neighbors_;
    std::atomic<uint16_t> sequenceNumber_{0};
    uint16_t identifier_;
    size_t maxPendingLookups_;
    // Shared with the lookup threads, which can outlive the service.
    std::shared_ptr<std::atomic<size_t>> pendingLookups_;
};

} // namespace netscan::infra
