#pragma once

#include "core/services/IProbeService.hpp"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace netscan::infra {

/**
 * @brief Reader for the kernel IPv4 neighbor (ARP) table.
 *
 * Parses the text layout of /proc/net/arp. Entries whose flags lack
 * ATF_COM, or whose hardware address is all zeros, are incomplete and are
 * skipped.
 */
class NeighborTable {
public:
    /**
     * @brief Constructs a reader for the given table file.
     * @param path Path to the table (defaults to /proc/net/arp).
     */
    explicit NeighborTable(std::filesystem::path path = "/proc/net/arp");

    /**
     * @brief Reads every complete entry of the table.
     * @return Entries in file order; empty if the file cannot be read.
     */
    std::vector<core::NeighborEntry> snapshot() const;

    /**
     * @brief Looks up the hardware address of one IP.
     * @param ip IPv4 address to look up.
     * @return Normalized MAC of the first complete entry for @p ip.
     */
    std::optional<std::string> lookup(const std::string& ip) const;

    /**
     * @brief Parses table text in /proc/net/arp format.
     * @param input Stream positioned at the header line.
     * @return Complete entries in input order.
     */
    static std::vector<core::NeighborEntry> parse(std::istream& input);

private:
    std::filesystem::path path_;
};

} // namespace netscan::infra
