#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace netscan::infra {

/**
 * @brief Layered vendor lookup over the built-in OUI table.
 *
 * The override table is a JSON object mapping an uppercase "XX:XX:XX"
 * prefix to a brand name, merged over the built-in table: an override for a
 * prefix wins over the built-in vendor. It is loaded once at construction and
 * rewritten as a whole on every change.
 *
 * @note Lookups are thread-safe; the sweep's worker pool calls brandOf()
 *       concurrently.
 */
class BrandResolver {
public:
    /**
     * @brief Constructs a resolver backed by the given override file.
     * @param overridesPath Path to brand_overrides.json; a missing or corrupt
     *        file yields an empty override table.
     */
    explicit BrandResolver(std::filesystem::path overridesPath);

    /**
     * @brief Resolves the brand of a hardware address.
     * @param mac Address in any case, with ':' or '-' separators.
     * @return Override for the prefix, else built-in vendor, else empty string.
     */
    std::string brandOf(const std::string& mac) const;

    /**
     * @brief Resolves the brand from the built-in table only.
     */
    std::string builtinBrandOf(const std::string& mac) const;

    /**
     * @brief Adds or replaces one prefix mapping and persists the table.
     * @param prefix OUI prefix or full hardware address; normalized to "XX:XX:XX".
     * @param brandName Brand to associate with the prefix.
     * @return False if the prefix is malformed or the file could not be written.
     */
    bool registerOverride(const std::string& prefix, const std::string& brandName);

    /**
     * @brief Records a brand entered by the user for a device.
     *
     * Registers an override only when @p brandName is non-empty and differs
     * from the built-in vendor for the address.
     *
     * @return True if an override was written.
     */
    bool setManualBrand(const std::string& mac, const std::string& brandName);

    /**
     * @brief Returns a copy of the override table.
     */
    std::map<std::string, std::string> overrides() const;

private:
    void load();
    bool save() const;

    std::filesystem::path overridesPath_;
    std::map<std::string, std::string> overrides_;
    mutable std::mutex mutex_;
};

} // namespace netscan::infra
