#include "core/types/Device.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <sstream>
#include <vector>

namespace netscan::core {

namespace {

bool containsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
    return std::any_of(needles.begin(), needles.end(), [&haystack](const char* needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

} // namespace

std::string Device::displayName() const {
    if (hostname && !hostname->empty() && *hostname != ip) {
        return *hostname;
    }
    return ip;
}

std::string Device::iconEmoji() const {
    if (hostname) {
        std::string hn = *hostname;
        std::transform(hn.begin(), hn.end(), hn.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (containsAny(hn, {"iphone", "ipad", "android", "phone"}))
            return "📱";
        if (containsAny(hn, {"mac", "imac", "mbp", "laptop"}))
            return "💻";
        if (containsAny(hn, {"tv"}))
            return "📺";
        if (containsAny(hn, {"printer", "hp"}))
            return "🖨️";
        if (containsAny(hn, {"cam"}))
            return "📷";
        if (containsAny(hn, {"router", "gw", "gateway"}))
            return "🛜";
    }
    return "🖥️";
}

std::string Device::statusToString() const {
    switch (status) {
    case DeviceStatus::Online:
        return "online";
    case DeviceStatus::Offline:
        return "offline";
    }
    return "offline";
}

void fillMissingFields(Device& target, const Device& source) {
    if (target.owner.empty())
        target.owner = source.owner;
    if (target.brand.empty())
        target.brand = source.brand;
    if (target.model.empty())
        target.model = source.model;
    if (!target.hostname || target.hostname->empty())
        target.hostname = source.hostname;
    if (!target.customIconPath)
        target.customIconPath = source.customIconPath;
}

std::string normalizeMac(const std::string& mac) {
    std::string cleaned = mac;
    std::replace(cleaned.begin(), cleaned.end(), '-', ':');
    std::transform(cleaned.begin(), cleaned.end(), cleaned.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::vector<std::string> octets;
    std::istringstream stream(cleaned);
    std::string octet;
    while (std::getline(stream, octet, ':')) {
        octets.push_back(octet);
    }

    if (octets.size() != 6) {
        return cleaned;
    }

    std::string result;
    for (size_t i = 0; i < octets.size(); ++i) {
        if (i > 0) {
            result += ':';
        }
        if (octets[i].size() == 1) {
            result += '0';
        }
        result += octets[i];
    }
    return result;
}

} // namespace netscan::core
