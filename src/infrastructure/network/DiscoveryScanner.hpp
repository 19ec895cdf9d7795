#pragma once

#include "core/services/IDiscoveryScanner.hpp"
#include "core/services/INetworkEnvironment.hpp"
#include "core/services/IProbeService.hpp"
#include "core/types/Subnet.hpp"
#include "infrastructure/catalog/ReconciliationEngine.hpp"
#include "infrastructure/storage/BrandResolver.hpp"
#include "infrastructure/storage/IconStore.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <thread>

namespace netscan::infra {

class AsioContext;

/**
 * @brief Bounded-concurrency subnet sweep feeding the reconciliation engine.
 *
 * Each sweep runs on its own coordinator thread. The coordinator admits at
 * most SweepConfig::concurrency probe tasks onto a dedicated AsioContext
 * pool, collects their results from a queue, runs the neighbor table
 * fallback, sorts the devices by address and hands them to the
 * ReconciliationEngine. Only the coordinator touches the result list.
 * Implements the core::IDiscoveryScanner interface.
 *
 * @note Callbacks run on the coordinator thread.
 */
class DiscoveryScanner : public core::IDiscoveryScanner {
public:
    /**
     * @brief Constructs a scanner.
     *
     * All references must outlive the scanner.
     *
     * @param environment Interface selection and SSID source.
     * @param probes Per-host probes.
     * @param brands Brand lookup for discovered MACs.
     * @param icons Icon lookup for discovered MACs; may be nullptr.
     * @param reconciler Catalog writer.
     */
    DiscoveryScanner(core::INetworkEnvironment& environment, core::IProbeService& probes,
                     BrandResolver& brands, IconStore* icons, ReconciliationEngine& reconciler);

    /**
     * @brief Destructor. Cancels an active sweep and waits for it to wind down.
     */
    ~DiscoveryScanner() override;

    DiscoveryScanner(const DiscoveryScanner&) = delete;
    DiscoveryScanner& operator=(const DiscoveryScanner&) = delete;

    bool scanAsync(const core::SweepConfig& config, ProgressCallback onProgress,
                   CompletionCallback onComplete) override;

    void cancel() override;

    bool isScanning() const override;

    core::SweepState state() const override;

private:
    void run(core::SweepConfig config, ProgressCallback onProgress,
             CompletionCallback onComplete);

    std::optional<core::Device> probeHost(const std::string& ip,
                                          const core::SweepConfig& config);

    core::Device describe(const std::string& ip, std::optional<std::string> mac,
                          const core::SweepConfig& config);

    void fallbackFromNeighborTable(AsioContext& pool, const core::Subnet& subnet,
                                   const core::SweepConfig& config,
                                   std::vector<core::Device>& devices);

    void setState(core::SweepState state, core::SweepProgress& progress,
                  const ProgressCallback& onProgress);

    core::INetworkEnvironment& environment_;
    core::IProbeService& probes_;
    BrandResolver& brands_;
    IconStore* icons_;
    ReconciliationEngine& reconciler_;

    std::atomic<bool> scanning_{false};
    std::atomic<bool> cancelled_{false};
    std::atomic<core::SweepState> state_{core::SweepState::Idle};
    std::thread coordinator_;
    std::mutex threadMutex_;
};

} // namespace netscan::infra
