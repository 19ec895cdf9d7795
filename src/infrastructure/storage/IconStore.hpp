#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace netscan::infra {

/**
 * @brief Persistent mapping of hardware address to custom icon file.
 *
 * The mapping is a whole-file JSON object keyed by uppercase MAC. Assigned
 * images are copied into the icon directory as "<MAC>.png" so the mapping
 * never points at a file the user might move.
 */
class IconStore {
public:
    /**
     * @brief Constructs an icon store.
     * @param mappingPath Path to icons.json.
     * @param iconDir Directory that receives copied icon files.
     */
    IconStore(std::filesystem::path mappingPath, std::filesystem::path iconDir);

    /**
     * @brief Returns the icon assigned to a device.
     * @param mac Hardware address in any case.
     * @return Path of the stored icon, or std::nullopt if none is assigned.
     */
    std::optional<std::string> iconPathFor(const std::string& mac) const;

    /**
     * @brief Assigns an icon to a device.
     * @param mac Hardware address in any case.
     * @param sourceFile Image to copy into the icon directory.
     * @return The stored path, or std::nullopt if the copy or save failed.
     */
    std::optional<std::string> setIcon(const std::string& mac,
                                       const std::filesystem::path& sourceFile);

    /**
     * @brief Removes the icon assigned to a device, deleting the stored file.
     * @return True if a mapping was removed.
     */
    bool removeIcon(const std::string& mac);

private:
    std::map<std::string, std::string> loadMapping() const;
    bool saveMapping(const std::map<std::string, std::string>& mapping) const;

    std::filesystem::path mappingPath_;
    std::filesystem::path iconDir_;
    mutable std::mutex mutex_;
};

} // namespace netscan::infra
