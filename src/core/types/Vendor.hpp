/**
 * @file Vendor.hpp
 * @brief Built-in OUI vendor table.
 *
 * This file defines the lookup of a vendor name from the organizationally
 * unique identifier (first three octets) of a hardware address.
 */

#pragma once

#include <string>
#include <unordered_map>

namespace netscan::core {

/**
 * @brief Utility class for detecting device vendors by OUI prefix.
 *
 * Provides static methods to identify common vendors from a hardware
 * address. User overrides live in infra::BrandResolver.
 */
class VendorDetector {
public:
    /**
     * @brief Extracts the OUI prefix of a hardware address.
     * @param mac Address or bare prefix in any case, with ':' or '-' separators.
     * @return "XX:XX:XX" in uppercase, or empty string if fewer than three
     *         hexadecimal octets are present.
     */
    static std::string ouiPrefix(const std::string& mac);

    /**
     * @brief Detects the vendor from the built-in table.
     * @param mac The hardware address to look up.
     * @return Vendor name if known, empty string otherwise.
     */
    static std::string detectVendor(const std::string& mac);

    /**
     * @brief Gets the map of known prefix-to-vendor mappings.
     * @return Reference to the map of "XX:XX:XX" prefixes to vendor names.
     */
    static const std::unordered_map<std::string, std::string>& getKnownVendors();
};

} // namespace netscan::core
