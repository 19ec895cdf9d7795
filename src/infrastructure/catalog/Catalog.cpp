#include "infrastructure/catalog/Catalog.hpp"

#include "infrastructure/storage/JsonFile.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>

namespace netscan::infra {

namespace {

std::string timePointToString(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

std::chrono::system_clock::time_point stringToTimePoint(const std::string& str) {
    std::tm tm{};
    if (strptime(str.c_str(), "%Y-%m-%dT%H:%M:%S", &tm) == nullptr) {
        return {};
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

nlohmann::json optionalToJson(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> optionalFromJson(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

nlohmann::json deviceToJson(const core::Device& device) {
    nlohmann::json j;
    j["id"] = device.id;
    j["ip"] = device.ip;
    j["mac"] = optionalToJson(device.mac);
    j["hostname"] = optionalToJson(device.hostname);
    j["customIconPath"] = optionalToJson(device.customIconPath);
    j["owner"] = device.owner;
    j["brand"] = device.brand;
    j["model"] = device.model;
    j["lastSeen"] = timePointToString(device.lastSeen);
    return j;
}

core::Device deviceFromJson(const nlohmann::json& j, const std::string& key) {
    core::Device device;
    device.id = j.value("id", "");
    if (device.id.empty()) {
        device.id = core::generateId();
    }
    device.ip = j.value("ip", "");
    device.mac = core::normalizeMac(optionalFromJson(j, "mac").value_or(key));
    device.hostname = optionalFromJson(j, "hostname");
    device.customIconPath = optionalFromJson(j, "customIconPath");
    device.owner = j.value("owner", "");
    device.brand = j.value("brand", "");
    device.model = j.value("model", "");
    device.lastSeen = stringToTimePoint(j.value("lastSeen", ""));
    device.status = core::DeviceStatus::Offline;
    return device;
}

} // namespace

Catalog::Catalog(std::filesystem::path path) : path_(std::move(path)) {
    load();
}

void Catalog::load() {
    auto document = readJsonFile(path_);
    if (!document) {
        spdlog::info("Starting with an empty catalog ({})", path_.string());
        return;
    }

    try {
        networks_ = fromJson(*document);
    } catch (const std::exception& e) {
        spdlog::warn("Catalog {} is corrupt, starting empty: {}", path_.string(), e.what());
        networks_.clear();
        return;
    }

    if (auto removed = consolidate(networks_); removed > 0) {
        spdlog::warn("Consolidated {} duplicate network records", removed);
        persist();
    }

    spdlog::info("Loaded {} networks from {}", networks_.size(), path_.string());
}

bool Catalog::persist() {
    if (!writeJsonFileAtomic(path_, toJson(networks_))) {
        spdlog::error("Catalog changes are kept in memory only until the next successful write");
        return false;
    }
    return true;
}

bool Catalog::save() {
    std::lock_guard lock(mutex_);
    return persist();
}

std::vector<core::Network> Catalog::networks() const {
    std::lock_guard lock(mutex_);
    return networks_;
}

size_t Catalog::size() const {
    std::lock_guard lock(mutex_);
    return networks_.size();
}

std::optional<core::Network> Catalog::findById(const std::string& networkId) const {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(networks_.begin(), networks_.end(),
                           [&networkId](const core::Network& n) { return n.id == networkId; });
    if (it == networks_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<core::Network> Catalog::findByName(const std::string& name) const {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(networks_.begin(), networks_.end(),
                           [&name](const core::Network& n) { return n.ssid == name; });
    if (it == networks_.end()) {
        return std::nullopt;
    }
    return *it;
}

nlohmann::json Catalog::toJson(const std::vector<core::Network>& networks) {
    nlohmann::json array = nlohmann::json::array();

    for (const auto& network : networks) {
        nlohmann::json j;
        j["id"] = network.id;
        j["ssid"] = network.ssid;
        j["emoji"] = network.emoji;
        j["devices"] = nlohmann::json::object();
        for (const auto& [mac, device] : network.devices) {
            j["devices"][mac] = deviceToJson(device);
        }
        j["lastSeen"] = timePointToString(network.lastSeen);
        array.push_back(std::move(j));
    }

    return array;
}

std::vector<core::Network> Catalog::fromJson(const nlohmann::json& j) {
    if (!j.is_array()) {
        spdlog::warn("Catalog root is not an array, ignoring its content");
        return {};
    }

    std::vector<core::Network> networks;
    for (const auto& item : j) {
        try {
            core::Network network;
            network.id = item.value("id", "");
            if (network.id.empty()) {
                network.id = core::generateId();
            }
            network.ssid = item.value("ssid", core::kUnknownNetworkName);
            network.emoji = item.value("emoji", core::kDefaultNetworkEmoji);
            network.lastSeen = stringToTimePoint(item.value("lastSeen", ""));

            if (item.contains("devices") && item["devices"].is_object()) {
                for (const auto& [key, value] : item["devices"].items()) {
                    auto device = deviceFromJson(value, key);
                    network.devices[*device.mac] = std::move(device);
                }
            }

            networks.push_back(std::move(network));
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Skipping malformed network record: {}", e.what());
        }
    }

    return networks;
}

size_t Catalog::consolidate(std::vector<core::Network>& networks) {
    size_t removed = 0;

    for (size_t i = 0; i < networks.size(); ++i) {
        auto& keep = networks[i];
        for (size_t k = i + 1; k < networks.size();) {
            if (networks[k].ssid != keep.ssid) {
                ++k;
                continue;
            }

            for (auto& [mac, device] : networks[k].devices) {
                auto it = keep.devices.find(mac);
                if (it == keep.devices.end()) {
                    keep.devices.emplace(mac, std::move(device));
                } else if (device.lastSeen > it->second.lastSeen) {
                    core::fillMissingFields(device, it->second);
                    it->second = std::move(device);
                } else {
                    core::fillMissingFields(it->second, device);
                }
            }
            keep.lastSeen = std::max(keep.lastSeen, networks[k].lastSeen);

            networks.erase(networks.begin() + static_cast<std::ptrdiff_t>(k));
            ++removed;
        }
    }

    return removed;
}

} // namespace netscan::infra
