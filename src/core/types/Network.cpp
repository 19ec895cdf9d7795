#include "core/types/Network.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <mutex>
#include <random>

namespace netscan::core {

size_t Network::onlineCount() const {
    return static_cast<size_t>(std::count_if(devices.begin(), devices.end(), [](const auto& entry) {
        return entry.second.status == DeviceStatus::Online;
    }));
}

const Device* Network::findDeviceById(const std::string& deviceId) const {
    for (const auto& [mac, device] : devices) {
        if (device.id == deviceId) {
            return &device;
        }
    }
    return nullptr;
}

std::string generateId() {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};

    std::array<uint8_t, 16> bytes{};
    {
        std::lock_guard lock(mutex);
        for (size_t i = 0; i < bytes.size(); i += 8) {
            uint64_t value = engine();
            for (size_t j = 0; j < 8; ++j) {
                bytes[i + j] = static_cast<uint8_t>(value >> (j * 8));
            }
        }
    }

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                  bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14],
                  bytes[15]);
    return buffer;
}

} // namespace netscan::core
