#include "infrastructure/storage/IconStore.hpp"

#include "core/types/Device.hpp"
#include "infrastructure/storage/JsonFile.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace netscan::infra {

IconStore::IconStore(std::filesystem::path mappingPath, std::filesystem::path iconDir)
    : mappingPath_(std::move(mappingPath)), iconDir_(std::move(iconDir)) {}

std::map<std::string, std::string> IconStore::loadMapping() const {
    std::map<std::string, std::string> mapping;

    auto document = readJsonFile(mappingPath_);
    if (!document || !document->is_object()) {
        return mapping;
    }

    for (const auto& [mac, path] : document->items()) {
        if (path.is_string()) {
            mapping[core::normalizeMac(mac)] = path.get<std::string>();
        }
    }
    return mapping;
}

bool IconStore::saveMapping(const std::map<std::string, std::string>& mapping) const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [mac, path] : mapping) {
        j[mac] = path;
    }
    return writeJsonFileAtomic(mappingPath_, j);
}

std::optional<std::string> IconStore::iconPathFor(const std::string& mac) const {
    std::lock_guard lock(mutex_);
    auto mapping = loadMapping();
    auto it = mapping.find(core::normalizeMac(mac));
    if (it == mapping.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> IconStore::setIcon(const std::string& mac,
                                              const std::filesystem::path& sourceFile) {
    auto key = core::normalizeMac(mac);
    auto fileName = key;
    std::replace(fileName.begin(), fileName.end(), ':', '-');
    auto destination = iconDir_ / (fileName + ".png");

    std::lock_guard lock(mutex_);
    try {
        std::filesystem::create_directories(iconDir_);
        std::filesystem::copy_file(sourceFile, destination,
                                   std::filesystem::copy_options::overwrite_existing);
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to store icon for {}: {}", key, e.what());
        return std::nullopt;
    }

    auto mapping = loadMapping();
    mapping[key] = destination.string();
    if (!saveMapping(mapping)) {
        return std::nullopt;
    }

    spdlog::info("Assigned icon {} to {}", destination.string(), key);
    return destination.string();
}

bool IconStore::removeIcon(const std::string& mac) {
    auto key = core::normalizeMac(mac);

    std::lock_guard lock(mutex_);
    auto mapping = loadMapping();
    auto it = mapping.find(key);
    if (it == mapping.end()) {
        return false;
    }

    std::error_code ec;
    std::filesystem::remove(it->second, ec);
    if (ec) {
        spdlog::warn("Failed to delete icon file {}: {}", it->second, ec.message());
    }

    mapping.erase(it);
    if (!saveMapping(mapping)) {
        return false;
    }

    spdlog::info("Removed icon for {}", key);
    return true;
}

} // namespace netscan::infra
