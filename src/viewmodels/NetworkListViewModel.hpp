/**
 * @file NetworkListViewModel.hpp
 * @brief ViewModel for the cataloged networks and their devices.
 *
 * This file defines the NetworkListViewModel class which exposes the
 * catalog and the user's edits to it in the MVVM architecture.
 */

#pragma once

#include "core/types/Network.hpp"
#include "infrastructure/catalog/ReconciliationEngine.hpp"
#include "infrastructure/storage/BrandResolver.hpp"
#include "infrastructure/storage/IconStore.hpp"

#include <QObject>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace netscan::viewmodels {

/**
 * @brief ViewModel for browsing and editing the network catalog.
 *
 * Edits go through the ReconciliationEngine, which persists each one
 * immediately. Brand edits also feed the override table, and icon edits
 * the icon store, so later sweeps pick them up for new devices.
 */
class NetworkListViewModel : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Constructs a NetworkListViewModel.
     * @param reconciler Catalog writer.
     * @param brands Brand override table.
     * @param icons Icon store.
     * @param parent Optional parent QObject for Qt ownership.
     */
    NetworkListViewModel(std::shared_ptr<infra::ReconciliationEngine> reconciler,
                         std::shared_ptr<infra::BrandResolver> brands,
                         std::shared_ptr<infra::IconStore> icons, QObject* parent = nullptr);

    /**
     * @brief Gets all networks in catalog order.
     */
    std::vector<core::Network> networks() const;

    bool selectNetwork(const std::string& networkId);
    std::optional<std::string> selectedNetworkId() const;

    /**
     * @brief Gets the selected network, if any.
     */
    std::optional<core::Network> selectedNetwork() const;

    bool updateEmoji(const std::string& networkId, const std::string& emoji);

    /**
     * @brief Saves the user-editable fields of a device.
     *
     * A non-empty brand that differs from the built-in vendor for the
     * device's MAC is also registered as an override for its prefix.
     *
     * @return False if the network or device does not exist.
     */
    bool updateDevice(const std::string& networkId, const core::Device& device);

    /**
     * @brief Deletes a network; clears the selection if it was selected.
     */
    bool deleteNetwork(const std::string& networkId);

    /**
     * @brief Combines devices of one network into the first of @p deviceIds.
     */
    std::optional<core::Device> mergeDevices(const std::string& networkId,
                                             const std::vector<std::string>& deviceIds);

    /**
     * @brief Assigns a custom icon to a device.
     * @param sourceFile Image to copy into the icon directory.
     * @return False if the device has no MAC, does not exist, or the copy failed.
     */
    bool setDeviceIcon(const std::string& networkId, const std::string& deviceId,
                       const std::filesystem::path& sourceFile);

    bool removeDeviceIcon(const std::string& networkId, const std::string& deviceId);

    /**
     * @brief Notifies listeners that the catalog changed outside this object.
     */
    void refresh();

signals:
    void networksChanged();
    void selectionChanged();

private:
    std::optional<core::Device> findDevice(const std::string& networkId,
                                           const std::string& deviceId) const;

    std::shared_ptr<infra::ReconciliationEngine> reconciler_;
    std::shared_ptr<infra::BrandResolver> brands_;
    std::shared_ptr<infra::IconStore> icons_;
};

} // namespace netscan::viewmodels
