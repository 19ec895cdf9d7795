#include "infrastructure/storage/BrandResolver.hpp"

#include "core/types/Vendor.hpp"
#include "infrastructure/storage/JsonFile.hpp"

#include <spdlog/spdlog.h>

namespace netscan::infra {

BrandResolver::BrandResolver(std::filesystem::path overridesPath)
    : overridesPath_(std::move(overridesPath)) {
    load();
}

void BrandResolver::load() {
    auto document = readJsonFile(overridesPath_);
    if (!document) {
        return;
    }
    if (!document->is_object()) {
        spdlog::warn("Ignoring brand overrides in {}: not a JSON object", overridesPath_.string());
        return;
    }

    for (const auto& [key, value] : document->items()) {
        auto prefix = core::VendorDetector::ouiPrefix(key);
        if (prefix.empty() || !value.is_string()) {
            spdlog::debug("Skipping malformed brand override \"{}\"", key);
            continue;
        }
        overrides_[prefix] = value.get<std::string>();
    }

    spdlog::info("Loaded {} brand overrides from {}", overrides_.size(), overridesPath_.string());
}

bool BrandResolver::save() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [prefix, brand] : overrides_) {
        j[prefix] = brand;
    }
    return writeJsonFileAtomic(overridesPath_, j);
}

std::string BrandResolver::brandOf(const std::string& mac) const {
    auto prefix = core::VendorDetector::ouiPrefix(mac);
    if (prefix.empty()) {
        return {};
    }

    {
        std::lock_guard lock(mutex_);
        auto it = overrides_.find(prefix);
        if (it != overrides_.end()) {
            return it->second;
        }
    }

    return core::VendorDetector::detectVendor(prefix);
}

std::string BrandResolver::builtinBrandOf(const std::string& mac) const {
    return core::VendorDetector::detectVendor(mac);
}

bool BrandResolver::registerOverride(const std::string& prefix, const std::string& brandName) {
    auto oui = core::VendorDetector::ouiPrefix(prefix);
    if (oui.empty()) {
        spdlog::warn("Rejected brand override for malformed prefix \"{}\"", prefix);
        return false;
    }

    std::lock_guard lock(mutex_);
    overrides_[oui] = brandName;
    if (!save()) {
        return false;
    }

    spdlog::info("Brand override {} -> {}", oui, brandName);
    return true;
}

bool BrandResolver::setManualBrand(const std::string& mac, const std::string& brandName) {
    if (brandName.empty() || brandName == builtinBrandOf(mac)) {
        return false;
    }
    return registerOverride(mac, brandName);
}

std::map<std::string, std::string> BrandResolver::overrides() const {
    std::lock_guard lock(mutex_);
    return overrides_;
}

} // namespace netscan::infra
