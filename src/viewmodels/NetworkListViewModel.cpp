#include "viewmodels/NetworkListViewModel.hpp"

#include <spdlog/spdlog.h>

namespace netscan::viewmodels {

NetworkListViewModel::NetworkListViewModel(std::shared_ptr<infra::ReconciliationEngine> reconciler,
                                           std::shared_ptr<infra::BrandResolver> brands,
                                           std::shared_ptr<infra::IconStore> icons,
                                           QObject* parent)
    : QObject(parent), reconciler_(std::move(reconciler)), brands_(std::move(brands)),
      icons_(std::move(icons)) {}

std::vector<core::Network> NetworkListViewModel::networks() const {
    return reconciler_->networks();
}

bool NetworkListViewModel::selectNetwork(const std::string& networkId) {
    if (reconciler_->selectedNetworkId() == networkId) {
        return true;
    }
    if (!reconciler_->selectNetwork(networkId)) {
        spdlog::warn("Cannot select unknown network {}", networkId);
        return false;
    }
    emit selectionChanged();
    return true;
}

std::optional<std::string> NetworkListViewModel::selectedNetworkId() const {
    return reconciler_->selectedNetworkId();
}

std::optional<core::Network> NetworkListViewModel::selectedNetwork() const {
    auto id = reconciler_->selectedNetworkId();
    if (!id) {
        return std::nullopt;
    }
    return reconciler_->findNetwork(*id);
}

bool NetworkListViewModel::updateEmoji(const std::string& networkId, const std::string& emoji) {
    if (!reconciler_->updateEmoji(networkId, emoji)) {
        return false;
    }
    emit networksChanged();
    return true;
}

bool NetworkListViewModel::updateDevice(const std::string& networkId,
                                        const core::Device& device) {
    if (!reconciler_->updateDevice(networkId, device)) {
        return false;
    }

    if (device.hasIdentity() && brands_->setManualBrand(*device.mac, device.brand)) {
        spdlog::info("Registered brand '{}' for {}", device.brand, *device.mac);
    }

    emit networksChanged();
    return true;
}

bool NetworkListViewModel::deleteNetwork(const std::string& networkId) {
    bool wasSelected = reconciler_->selectedNetworkId() == networkId;
    if (!reconciler_->deleteNetwork(networkId)) {
        return false;
    }

    emit networksChanged();
    if (wasSelected) {
        emit selectionChanged();
    }
    return true;
}

std::optional<core::Device>
NetworkListViewModel::mergeDevices(const std::string& networkId,
                                   const std::vector<std::string>& deviceIds) {
    auto merged = reconciler_->mergeDevices(networkId, deviceIds);
    if (merged) {
        emit networksChanged();
    }
    return merged;
}

bool NetworkListViewModel::setDeviceIcon(const std::string& networkId,
                                         const std::string& deviceId,
                                         const std::filesystem::path& sourceFile) {
    auto device = findDevice(networkId, deviceId);
    if (!device || !device->hasIdentity()) {
        spdlog::warn("Cannot assign icon: device {} has no hardware address", deviceId);
        return false;
    }

    auto stored = icons_->setIcon(*device->mac, sourceFile);
    if (!stored) {
        return false;
    }

    device->customIconPath = stored;
    return updateDevice(networkId, *device);
}

bool NetworkListViewModel::removeDeviceIcon(const std::string& networkId,
                                            const std::string& deviceId) {
    auto device = findDevice(networkId, deviceId);
    if (!device || !device->hasIdentity()) {
        return false;
    }

    if (!icons_->removeIcon(*device->mac)) {
        spdlog::debug("No stored icon for {}", *device->mac);
    }
    device->customIconPath.reset();
    return updateDevice(networkId, *device);
}

void NetworkListViewModel::refresh() {
    emit networksChanged();
}

std::optional<core::Device> NetworkListViewModel::findDevice(const std::string& networkId,
                                                             const std::string& deviceId) const {
    auto network = reconciler_->findNetwork(networkId);
    if (!network) {
        return std::nullopt;
    }
    const auto* device = network->findDeviceById(deviceId);
    if (device == nullptr) {
        return std::nullopt;
    }
    return *device;
}

} // namespace netscan::viewmodels
