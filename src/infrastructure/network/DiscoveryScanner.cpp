#include "infrastructure/network/DiscoveryScanner.hpp"

#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/ThreadSafeQueue.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace netscan::infra {

namespace {

struct ProbeOutcome {
    std::optional<core::Device> device;
};

void sortByAddress(std::vector<core::Device>& devices) {
    std::stable_sort(devices.begin(), devices.end(),
                     [](const core::Device& a, const core::Device& b) {
                         return core::ipLess(a.ip, b.ip);
                     });
}

void adoptCatalogFields(core::Device& scanned, const core::Device& record) {
    scanned.id = record.id;
    scanned.owner = record.owner;
    scanned.brand = record.brand;
    scanned.model = record.model;
    scanned.customIconPath = record.customIconPath;
    scanned.status = record.status;
}

} // namespace

DiscoveryScanner::DiscoveryScanner(core::INetworkEnvironment& environment,
                                   core::IProbeService& probes, BrandResolver& brands,
                                   IconStore* icons, ReconciliationEngine& reconciler)
    : environment_(environment), probes_(probes), brands_(brands), icons_(icons),
      reconciler_(reconciler) {}

DiscoveryScanner::~DiscoveryScanner() {
    cancel();
    std::lock_guard lock(threadMutex_);
    if (coordinator_.joinable()) {
        coordinator_.join();
    }
}

bool DiscoveryScanner::scanAsync(const core::SweepConfig& config, ProgressCallback onProgress,
                                 CompletionCallback onComplete) {
    if (scanning_.exchange(true)) {
        spdlog::warn("Sweep already in progress, ignoring start request");
        return false;
    }

    cancelled_ = false;

    std::lock_guard lock(threadMutex_);
    if (coordinator_.joinable()) {
        // A completion callback may start the next sweep from the coordinator itself.
        if (coordinator_.get_id() == std::this_thread::get_id()) {
            coordinator_.detach();
        } else {
            coordinator_.join();
        }
    }
    coordinator_ = std::thread([this, config, onProgress = std::move(onProgress),
                                onComplete = std::move(onComplete)]() mutable {
        run(config, std::move(onProgress), std::move(onComplete));
    });
    return true;
}

void DiscoveryScanner::cancel() {
    if (scanning_) {
        spdlog::info("Cancelling sweep");
        cancelled_ = true;
    }
}

bool DiscoveryScanner::isScanning() const {
    return scanning_.load();
}

core::SweepState DiscoveryScanner::state() const {
    return state_.load();
}

void DiscoveryScanner::setState(core::SweepState state, core::SweepProgress& progress,
                                const ProgressCallback& onProgress) {
    state_ = state;
    progress.state = state;
    spdlog::debug("Sweep state: {}", core::sweepStateToString(state));
    if (onProgress) {
        onProgress(progress);
    }
}

void DiscoveryScanner::run(core::SweepConfig config, ProgressCallback onProgress,
                           CompletionCallback onComplete) {
    core::SweepProgress progress;
    core::SweepOutcome outcome;

    auto finish = [&](core::SweepState finalState) {
        outcome.state = finalState;
        state_ = finalState;
        scanning_ = false;
        spdlog::info("{}", outcome.message);
        if (onComplete) {
            onComplete(outcome);
        }
    };

    setState(core::SweepState::ResolvingInterface, progress, onProgress);

    auto interface = environment_.selectInterface();
    std::optional<core::Subnet> subnet;
    if (interface) {
        subnet = core::sweepSubnet(interface->address, interface->netmask);
    }
    if (!subnet) {
        outcome.error = core::SweepError::NoActiveInterface;
        outcome.message = "No active network interface";
        finish(core::SweepState::Done);
        return;
    }

    auto hosts = core::enumerateHosts(interface->address, interface->netmask);
    outcome.subnet = subnet->toString();
    progress.subnet = outcome.subnet;
    progress.totalHosts = static_cast<int>(hosts.size());
    spdlog::info("Sweeping {} ({} hosts) on {}", outcome.subnet, hosts.size(), interface->name);

    setState(core::SweepState::Sweeping, progress, onProgress);

    auto width = static_cast<size_t>(std::max(config.concurrency, 1));
    AsioContext pool(std::min(width, std::max<size_t>(hosts.size(), 1)), "sweep");
    pool.start();

    ThreadSafeQueue<ProbeOutcome> completions;
    std::vector<core::Device> devices;
    size_t next = 0;
    size_t inFlight = 0;

    while (true) {
        while (!cancelled_ && inFlight < width && next < hosts.size()) {
            pool.post([this, &completions, &config, ip = hosts[next]]() {
                // Every admitted host must produce a completion.
                ProbeOutcome outcome;
                try {
                    outcome.device = probeHost(ip, config);
                } catch (const std::exception& e) {
                    spdlog::debug("Probe of {} failed: {}", ip, e.what());
                }
                completions.push(std::move(outcome));
            });
            ++next;
            ++inFlight;
        }

        if (inFlight == 0) {
            break;
        }

        auto completed = completions.pop();
        --inFlight;

        if (completed.device) {
            devices.push_back(std::move(*completed.device));
            progress.foundHosts = static_cast<int>(devices.size());
        }
        ++progress.processedHosts;
        if (onProgress) {
            onProgress(progress);
        }
    }

    if (cancelled_) {
        pool.stop();
        sortByAddress(devices);
        outcome.devices = std::move(devices);
        outcome.message =
            "Scan cancelled (" + std::to_string(outcome.devices.size()) + " devices found)";
        finish(core::SweepState::Cancelled);
        return;
    }

    if (config.neighborFallback) {
        fallbackFromNeighborTable(pool, *subnet, config, devices);
        progress.foundHosts = static_cast<int>(devices.size());
    }
    pool.stop();

    sortByAddress(devices);

    setState(core::SweepState::Reconciling, progress, onProgress);

    outcome.networkName = reconciler_.resolveNetworkIdentity();
    auto network = reconciler_.merge(outcome.networkName, devices);

    // Several addresses can answer for one MAC (proxy ARP, VM hosts); each
    // keeps its observed address and name.
    for (auto& device : devices) {
        if (!device.hasIdentity()) {
            continue;
        }
        auto it = network.devices.find(core::normalizeMac(*device.mac));
        if (it != network.devices.end()) {
            adoptCatalogFields(device, it->second);
        }
    }

    outcome.devices = std::move(devices);
    outcome.message = "Found " + std::to_string(outcome.devices.size()) + " devices on " +
                      outcome.networkName + " (" + outcome.subnet + ")";
    finish(core::SweepState::Done);
}

std::optional<core::Device> DiscoveryScanner::probeHost(const std::string& ip,
                                                        const core::SweepConfig& config) {
    if (!probes_.isAlive(ip, config.pingTimeout)) {
        return std::nullopt;
    }

    spdlog::debug("Host {} is alive", ip);
    return describe(ip, probes_.resolveNeighbor(ip), config);
}

core::Device DiscoveryScanner::describe(const std::string& ip, std::optional<std::string> mac,
                                        const core::SweepConfig& config) {
    core::Device device;
    device.ip = ip;
    device.hostname = probes_.resolveHostname(ip, config.dnsTimeout);
    device.lastSeen = std::chrono::system_clock::now();
    device.status = core::DeviceStatus::Online;

    if (mac && !mac->empty()) {
        device.mac = core::normalizeMac(*mac);
        device.brand = brands_.brandOf(*device.mac);
        if (icons_ != nullptr) {
            device.customIconPath = icons_->iconPathFor(*device.mac);
        }
    }

    return device;
}

void DiscoveryScanner::fallbackFromNeighborTable(AsioContext& pool, const core::Subnet& subnet,
                                                 const core::SweepConfig& config,
                                                 std::vector<core::Device>& devices) {
    std::set<std::string> known;
    for (const auto& device : devices) {
        known.insert(device.ip);
    }

    // Entries are described on the pool so reverse lookups overlap.
    ThreadSafeQueue<ProbeOutcome> described;
    size_t pending = 0;
    for (const auto& entry : probes_.snapshotNeighborTable()) {
        if (!subnet.contains(entry.ip) || known.contains(entry.ip)) {
            continue;
        }
        known.insert(entry.ip);
        pool.post([this, &described, &config, entry]() {
            ProbeOutcome outcome;
            try {
                outcome.device = describe(entry.ip, entry.mac, config);
            } catch (const std::exception& e) {
                spdlog::debug("Describing neighbor {} failed: {}", entry.ip, e.what());
            }
            described.push(std::move(outcome));
        });
        ++pending;
    }

    size_t added = 0;
    for (; pending > 0; --pending) {
        auto completed = described.pop();
        if (completed.device) {
            devices.push_back(std::move(*completed.device));
            ++added;
        }
    }

    spdlog::debug("Neighbor table fallback added {} devices", added);
}

} // namespace netscan::infra
