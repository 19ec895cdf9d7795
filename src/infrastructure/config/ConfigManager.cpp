#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace netscan::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    std::error_code ec;
    if (!std::filesystem::exists(configDir_, ec)) {
        std::filesystem::create_directories(configDir_, ec);
        if (ec) {
            spdlog::error("Failed to create config directory {}: {}", configDir_.string(),
                          ec.message());
        }
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Sweep
    j["scan"]["concurrency"] = config_.scanConcurrency;
    j["scan"]["ping_timeout_ms"] = config_.pingTimeoutMs;
    j["scan"]["dns_timeout_ms"] = config_.dnsTimeoutMs;
    j["scan"]["preferred_interface"] = config_.preferredInterface;
    j["scan"]["neighbor_fallback"] = config_.neighborFallback;

    // Export
    j["export"]["include_status"] = config_.exportIncludeStatus;

    // Logging
    j["logging"]["level"] = config_.logLevel;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    // Sweep
    if (j.contains("scan")) {
        const auto& s = j["scan"];
        config_.scanConcurrency = s.value("concurrency", 64);
        config_.pingTimeoutMs = s.value("ping_timeout_ms", 700);
        config_.dnsTimeoutMs = s.value("dns_timeout_ms", 1000);
        config_.preferredInterface = s.value("preferred_interface", "wlan0");
        config_.neighborFallback = s.value("neighbor_fallback", true);
    }

    if (config_.scanConcurrency < 1) {
        spdlog::warn("scan.concurrency must be positive, using 1");
        config_.scanConcurrency = 1;
    }

    // Export
    if (j.contains("export")) {
        config_.exportIncludeStatus = j["export"].value("include_status", false);
    }

    // Logging
    if (j.contains("logging")) {
        config_.logLevel = j["logging"].value("level", "info");
    }
}

std::filesystem::path ConfigManager::catalogPath() const {
    return configDir_ / "networks.json";
}

std::filesystem::path ConfigManager::brandOverridesPath() const {
    return configDir_ / "brand_overrides.json";
}

std::filesystem::path ConfigManager::iconMappingPath() const {
    return configDir_ / "icons.json";
}

std::filesystem::path ConfigManager::iconDir() const {
    return configDir_ / "icons";
}

std::filesystem::path ConfigManager::logPath() const {
    return configDir_ / "netscan.log";
}

} // namespace netscan::infra
