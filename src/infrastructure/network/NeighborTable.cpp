#include "infrastructure/network/NeighborTable.hpp"

#include "core/types/Device.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace netscan::infra {

namespace {

constexpr unsigned long ATF_COMPLETE = 0x02;
constexpr const char* ZERO_MAC = "00:00:00:00:00:00";

} // namespace

NeighborTable::NeighborTable(std::filesystem::path path) : path_(std::move(path)) {}

std::vector<core::NeighborEntry> NeighborTable::parse(std::istream& input) {
    std::vector<core::NeighborEntry> entries;

    std::string line;
    std::getline(input, line); // header

    while (std::getline(input, line)) {
        std::istringstream fields(line);
        std::string ip, hwType, flags, mac, mask, device;
        if (!(fields >> ip >> hwType >> flags >> mac >> mask >> device)) {
            continue;
        }

        unsigned long flagBits = 0;
        try {
            flagBits = std::stoul(flags, nullptr, 16);
        } catch (const std::exception&) {
            continue;
        }

        if ((flagBits & ATF_COMPLETE) == 0) {
            continue;
        }

        auto normalized = core::normalizeMac(mac);
        if (normalized == ZERO_MAC) {
            continue;
        }

        entries.push_back({ip, normalized, device});
    }

    return entries;
}

std::vector<core::NeighborEntry> NeighborTable::snapshot() const {
    std::ifstream file(path_);
    if (!file) {
        spdlog::debug("Neighbor table {} is not readable", path_.string());
        return {};
    }
    return parse(file);
}

std::optional<std::string> NeighborTable::lookup(const std::string& ip) const {
    for (const auto& entry : snapshot()) {
        if (entry.ip == ip) {
            return entry.mac;
        }
    }
    return std::nullopt;
}

} // namespace netscan::infra
