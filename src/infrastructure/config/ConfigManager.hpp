#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace netscan::infra {

/**
 * @brief Application configuration settings.
 *
 * Contains the sweep parameters, export preferences and logging level.
 * Every key has a default, so a missing or partial config file is valid.
 */
struct AppConfig {
    // Sweep
    int scanConcurrency{64};                  ///< Maximum probes in flight.
    int pingTimeoutMs{700};                   ///< Liveness probe timeout in milliseconds.
    int dnsTimeoutMs{1000};                   ///< Reverse DNS timeout in milliseconds.
    std::string preferredInterface{"wlan0"};  ///< Interface chosen first when usable.
    bool neighborFallback{true};              ///< Add neighbor table entries after the sweep.

    // Export
    bool exportIncludeStatus{false};          ///< Append the status column to CSV exports.

    // Logging
    std::string logLevel{"info"};             ///< spdlog level name for the console sink.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Handles loading and saving of application configuration from a JSON file
 * and derives the paths of the data files kept next to it.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory; created if missing.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     *
     * Writes the defaults when no config file exists yet.
     *
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Returns the path to the configuration file.
     * @return Path to config.json.
     */
    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Returns the path to the network catalog.
     * @return Path to networks.json.
     */
    std::filesystem::path catalogPath() const;

    /**
     * @brief Returns the path to the user brand override table.
     */
    std::filesystem::path brandOverridesPath() const;

    /**
     * @brief Returns the path to the device icon mapping.
     */
    std::filesystem::path iconMappingPath() const;

    /**
     * @brief Returns the directory that holds copied icon files.
     */
    std::filesystem::path iconDir() const;

    /**
     * @brief Returns the path of the rotating log file.
     */
    std::filesystem::path logPath() const;

    std::string configDir() const { return configDir_.string(); }

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace netscan::infra
