#pragma once

#include "core/types/Device.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace netscan::infra {

/**
 * @brief Renders device lists for export and list filtering.
 */
class DeviceExporter {
public:
    /**
     * @brief Renders devices as CSV.
     *
     * Columns are ip, mac, hostname, owner, brand, model and optionally
     * status. Every field is double-quoted; embedded quotes are doubled.
     *
     * @param devices Rows in output order.
     * @param includeStatus Append the status column.
     * @return CSV text including the header line.
     */
    static std::string toCsv(const std::vector<core::Device>& devices, bool includeStatus);

    /**
     * @brief Writes devices as CSV to a file.
     * @return False if the file could not be written.
     */
    static bool writeCsv(const std::filesystem::path& path,
                         const std::vector<core::Device>& devices, bool includeStatus);

    /**
     * @brief Filters a device list the way the device table does.
     * @param devices Devices to filter; order is preserved.
     * @param query Case-insensitive substring matched against display name,
     *        IP and MAC. An empty query matches everything.
     * @param onlyWithMac Drop devices without a hardware address.
     */
    static std::vector<core::Device> filterDevices(const std::vector<core::Device>& devices,
                                                   const std::string& query, bool onlyWithMac);
};

} // namespace netscan::infra
