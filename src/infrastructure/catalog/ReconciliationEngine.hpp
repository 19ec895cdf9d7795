/**
 * @file ReconciliationEngine.hpp
 * @brief Merges sweep results into the persistent catalog.
 *
 * This file defines the only writer of the catalog: it resolves which
 * network a sweep belongs to, applies the field-level merge policy and
 * carries out the user's edits.
 */

#pragma once

#include "core/services/INetworkEnvironment.hpp"
#include "core/types/Network.hpp"
#include "infrastructure/catalog/Catalog.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace netscan::infra {

/**
 * @brief Applies sweep results and user edits to the catalog.
 *
 * Field policy when a scanned device is already cataloged:
 * - ip and hostname are overwritten with the scanned values;
 * - customIconPath is overwritten, falling back to the stored value when the
 *   scan has none;
 * - owner and model are always kept;
 * - brand is kept once non-empty, otherwise taken from the scan;
 * - status becomes online.
 * Cataloged devices missing from the scan become offline.
 */
class ReconciliationEngine {
public:
    /**
     * @brief Constructs the engine.
     * @param catalog Catalog to write to; must outlive the engine.
     * @param environment Source of the current network name.
     */
    ReconciliationEngine(Catalog& catalog, core::INetworkEnvironment& environment);

    /**
     * @brief Determines the catalog bucket for the current sweep.
     * @return The SSID, or core::kUnknownNetworkName when none is available.
     */
    std::string resolveNetworkIdentity();

    /**
     * @brief Merges scanned devices into the network with the given name.
     *
     * Creates the network if no record with that name exists. Devices
     * without a hardware address are dropped.
     *
     * @param networkName Name returned by resolveNetworkIdentity().
     * @param scannedDevices Devices found by one sweep.
     * @return The network record after the merge.
     */
    core::Network merge(const std::string& networkName,
                        const std::vector<core::Device>& scannedDevices);

    bool updateEmoji(const std::string& networkId, const std::string& emoji);

    /**
     * @brief Replaces the user-editable fields of a cataloged device.
     *
     * The device is located by hardware address, falling back to the record
     * identifier. owner, brand, model, hostname and customIconPath are taken
     * from @p device; identity, address and status are left alone.
     *
     * @return False if the network or device does not exist.
     */
    bool updateDevice(const std::string& networkId, const core::Device& device);

    /**
     * @brief Deletes a network and its devices.
     *
     * Clears the selection if it pointed at the deleted record.
     *
     * @return False if no such network exists.
     */
    bool deleteNetwork(const std::string& networkId);

    /**
     * @brief Combines devices the user identified as one physical host.
     *
     * The first id in @p deviceIds survives. owner, brand, model, hostname
     * and customIconPath take the first non-empty value in selection order;
     * ip and lastSeen come from the most recently seen device; the result is
     * online if any input was. The other entries are removed.
     *
     * @return The merged device, or std::nullopt if fewer than two of the
     *         ids exist in the network.
     */
    std::optional<core::Device> mergeDevices(const std::string& networkId,
                                             const std::vector<std::string>& deviceIds);

    /**
     * @brief Selects a network for display.
     * @return False if no such network exists; the selection is unchanged.
     */
    bool selectNetwork(const std::string& networkId);

    std::optional<std::string> selectedNetworkId() const;

    std::vector<core::Network> networks() const { return catalog_.networks(); }

    std::optional<core::Network> findNetwork(const std::string& networkId) const {
        return catalog_.findById(networkId);
    }

    std::optional<core::Network> findNetworkByName(const std::string& name) const {
        return catalog_.findByName(name);
    }

private:
    Catalog& catalog_;
    core::INetworkEnvironment& environment_;

    mutable std::mutex selectionMutex_;
    std::optional<std::string> selectedNetworkId_;
};

} // namespace netscan::infra
