#include "infrastructure/export/DeviceExporter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace netscan::infra {

namespace {

std::string quote(const std::string& field) {
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') {
            out += "\"\"";
        } else {
            out += c;
        }
    }
    out += '"';
    return out;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::string DeviceExporter::toCsv(const std::vector<core::Device>& devices, bool includeStatus) {
    std::ostringstream oss;
    oss << "ip,mac,hostname,owner,brand,model";
    if (includeStatus) {
        oss << ",status";
    }
    oss << "\n";

    for (const auto& d : devices) {
        oss << quote(d.ip) << "," << quote(d.mac.value_or("")) << ","
            << quote(d.hostname.value_or("")) << "," << quote(d.owner) << "," << quote(d.brand)
            << "," << quote(d.model);
        if (includeStatus) {
            oss << "," << quote(d.statusToString());
        }
        oss << "\n";
    }

    return oss.str();
}

bool DeviceExporter::writeCsv(const std::filesystem::path& path,
                              const std::vector<core::Device>& devices, bool includeStatus) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        spdlog::error("Failed to open {} for export", path.string());
        return false;
    }

    file << toCsv(devices, includeStatus);
    file.flush();
    if (!file) {
        spdlog::error("Failed to write export to {}", path.string());
        return false;
    }

    spdlog::info("Exported {} devices to {}", devices.size(), path.string());
    return true;
}

std::vector<core::Device> DeviceExporter::filterDevices(const std::vector<core::Device>& devices,
                                                        const std::string& query,
                                                        bool onlyWithMac) {
    auto needle = toLower(query);
    std::vector<core::Device> result;

    for (const auto& device : devices) {
        if (onlyWithMac && !device.hasIdentity()) {
            continue;
        }
        if (!needle.empty()) {
            auto haystack = toLower(device.displayName()) + "\n" + toLower(device.ip) + "\n" +
                            toLower(device.mac.value_or(""));
            if (haystack.find(needle) == std::string::npos) {
                continue;
            }
        }
        result.push_back(device);
    }

    return result;
}

} // namespace netscan::infra
