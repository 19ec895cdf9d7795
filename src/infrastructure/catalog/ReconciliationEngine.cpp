#include "infrastructure/catalog/ReconciliationEngine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace netscan::infra {

namespace {

std::vector<core::Network>::iterator findNetworkById(std::vector<core::Network>& networks,
                                                     const std::string& networkId) {
    return std::find_if(networks.begin(), networks.end(),
                        [&networkId](const core::Network& n) { return n.id == networkId; });
}

void applyScan(core::Device& existing, const core::Device& scanned) {
    existing.ip = scanned.ip;
    existing.hostname = scanned.hostname;
    if (scanned.customIconPath) {
        existing.customIconPath = scanned.customIconPath;
    }
    if (existing.brand.empty()) {
        existing.brand = scanned.brand;
    }
    existing.lastSeen = scanned.lastSeen;
    existing.status = core::DeviceStatus::Online;
}

core::Device newCatalogDevice(const core::Device& scanned, const std::string& mac) {
    core::Device device = scanned;
    if (device.id.empty()) {
        device.id = core::generateId();
    }
    device.mac = mac;
    device.status = core::DeviceStatus::Online;
    return device;
}

} // namespace

ReconciliationEngine::ReconciliationEngine(Catalog& catalog,
                                           core::INetworkEnvironment& environment)
    : catalog_(catalog), environment_(environment) {}

std::string ReconciliationEngine::resolveNetworkIdentity() {
    auto name = environment_.currentNetworkName();
    if (!name || name->empty()) {
        spdlog::debug("No SSID available, using '{}'", core::kUnknownNetworkName);
        return core::kUnknownNetworkName;
    }
    return *name;
}

core::Network ReconciliationEngine::merge(const std::string& networkName,
                                          const std::vector<core::Device>& scannedDevices) {
    auto now = std::chrono::system_clock::now();

    return catalog_.transaction([&](std::vector<core::Network>& networks) {
        auto it = std::find_if(networks.begin(), networks.end(),
                               [&networkName](const core::Network& n) {
                                   return n.ssid == networkName;
                               });

        if (it == networks.end()) {
            core::Network network;
            network.id = core::generateId();
            network.ssid = networkName;
            networks.push_back(std::move(network));
            it = std::prev(networks.end());
            spdlog::info("Created network record '{}'", networkName);
        }

        auto& network = *it;
        std::set<std::string> seen;
        size_t added = 0;
        size_t dropped = 0;

        for (const auto& scanned : scannedDevices) {
            if (!scanned.hasIdentity()) {
                ++dropped;
                continue;
            }

            auto mac = core::normalizeMac(*scanned.mac);
            seen.insert(mac);

            auto existing = network.devices.find(mac);
            if (existing == network.devices.end()) {
                network.devices.emplace(mac, newCatalogDevice(scanned, mac));
                ++added;
            } else {
                applyScan(existing->second, scanned);
            }
        }

        for (auto& [mac, device] : network.devices) {
            if (!seen.contains(mac)) {
                device.status = core::DeviceStatus::Offline;
            }
        }

        network.lastSeen = now;

        spdlog::info("Merged {} devices into '{}' ({} new, {} without MAC dropped)",
                     seen.size(), network.ssid, added, dropped);
        return network;
    });
}

bool ReconciliationEngine::updateEmoji(const std::string& networkId, const std::string& emoji) {
    return catalog_.transaction([&](std::vector<core::Network>& networks) {
        auto it = findNetworkById(networks, networkId);
        if (it == networks.end()) {
            spdlog::warn("updateEmoji: no network with id {}", networkId);
            return false;
        }
        it->emoji = emoji;
        return true;
    });
}

bool ReconciliationEngine::updateDevice(const std::string& networkId,
                                        const core::Device& device) {
    return catalog_.transaction([&](std::vector<core::Network>& networks) {
        auto it = findNetworkById(networks, networkId);
        if (it == networks.end()) {
            spdlog::warn("updateDevice: no network with id {}", networkId);
            return false;
        }

        core::Device* target = nullptr;
        if (device.hasIdentity()) {
            auto found = it->devices.find(core::normalizeMac(*device.mac));
            if (found != it->devices.end()) {
                target = &found->second;
            }
        }
        if (target == nullptr) {
            for (auto& [mac, candidate] : it->devices) {
                if (candidate.id == device.id) {
                    target = &candidate;
                    break;
                }
            }
        }
        if (target == nullptr) {
            spdlog::warn("updateDevice: device {} not found in '{}'", device.id, it->ssid);
            return false;
        }

        target->owner = device.owner;
        target->brand = device.brand;
        target->model = device.model;
        target->hostname = device.hostname;
        target->customIconPath = device.customIconPath;
        return true;
    });
}

bool ReconciliationEngine::deleteNetwork(const std::string& networkId) {
    bool removed = catalog_.transaction([&](std::vector<core::Network>& networks) {
        auto it = findNetworkById(networks, networkId);
        if (it == networks.end()) {
            return false;
        }
        spdlog::info("Deleted network '{}' with {} devices", it->ssid, it->devices.size());
        networks.erase(it);
        return true;
    });

    if (removed) {
        std::lock_guard lock(selectionMutex_);
        if (selectedNetworkId_ == networkId) {
            selectedNetworkId_.reset();
        }
    }
    return removed;
}

std::optional<core::Device>
ReconciliationEngine::mergeDevices(const std::string& networkId,
                                   const std::vector<std::string>& deviceIds) {
    return catalog_.transaction(
        [&](std::vector<core::Network>& networks) -> std::optional<core::Device> {
            auto it = findNetworkById(networks, networkId);
            if (it == networks.end()) {
                spdlog::warn("mergeDevices: no network with id {}", networkId);
                return std::nullopt;
            }

            std::vector<std::string> keys;
            for (const auto& id : deviceIds) {
                for (const auto& [mac, device] : it->devices) {
                    if (device.id == id &&
                        std::find(keys.begin(), keys.end(), mac) == keys.end()) {
                        keys.push_back(mac);
                        break;
                    }
                }
            }

            if (keys.size() < 2) {
                spdlog::warn("mergeDevices: need at least two devices, found {}", keys.size());
                return std::nullopt;
            }

            core::Device merged = it->devices.at(keys.front());
            const core::Device* latest = &it->devices.at(keys.front());
            for (size_t i = 1; i < keys.size(); ++i) {
                const auto& other = it->devices.at(keys[i]);
                core::fillMissingFields(merged, other);
                if (other.lastSeen > latest->lastSeen) {
                    latest = &other;
                }
                if (other.status == core::DeviceStatus::Online) {
                    merged.status = core::DeviceStatus::Online;
                }
            }
            merged.ip = latest->ip;
            merged.lastSeen = latest->lastSeen;

            it->devices[keys.front()] = merged;
            for (size_t i = 1; i < keys.size(); ++i) {
                it->devices.erase(keys[i]);
            }

            spdlog::info("Merged {} devices into {} on '{}'", keys.size(), keys.front(),
                         it->ssid);
            return merged;
        });
}

bool ReconciliationEngine::selectNetwork(const std::string& networkId) {
    if (!catalog_.findById(networkId)) {
        return false;
    }
    std::lock_guard lock(selectionMutex_);
    selectedNetworkId_ = networkId;
    return true;
}

std::optional<std::string> ReconciliationEngine::selectedNetworkId() const {
    std::lock_guard lock(selectionMutex_);
    return selectedNetworkId_;
}

} // namespace netscan::infra
