#include "core/types/Vendor.hpp"

#include <cctype>
#include <sstream>
#include <vector>

namespace netscan::core {

std::string VendorDetector::ouiPrefix(const std::string& mac) {
    std::vector<std::string> octets;
    std::string cleaned = mac;
    for (auto& c : cleaned) {
        c = (c == '-') ? ':' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    std::istringstream stream(cleaned);
    std::string octet;
    while (octets.size() < 3 && std::getline(stream, octet, ':')) {
        if (octet.empty() || octet.size() > 2 ||
            !std::isxdigit(static_cast<unsigned char>(octet[0])) ||
            !std::isxdigit(static_cast<unsigned char>(octet.back()))) {
            return {};
        }
        octets.push_back(octet.size() == 1 ? "0" + octet : octet);
    }

    if (octets.size() != 3) {
        return {};
    }
    return octets[0] + ":" + octets[1] + ":" + octets[2];
}

const std::unordered_map<std::string, std::string>& VendorDetector::getKnownVendors() {
    static const std::unordered_map<std::string, std::string> vendors = {
        // Apple
        {"00:03:93", "Apple"},    {"00:0A:95", "Apple"},     {"00:1B:63", "Apple"},
        {"00:1C:B3", "Apple"},    {"00:1E:C2", "Apple"},     {"00:25:00", "Apple"},
        {"28:CF:E9", "Apple"},    {"3C:07:54", "Apple"},     {"40:A6:D9", "Apple"},
        {"A4:83:E7", "Apple"},    {"AC:BC:32", "Apple"},     {"D0:81:7A", "Apple"},
        {"F0:18:98", "Apple"},
        // Samsung
        {"00:12:FB", "Samsung"},  {"00:15:99", "Samsung"},   {"00:16:32", "Samsung"},
        // Raspberry Pi
        {"B8:27:EB", "Raspberry Pi"}, {"DC:A6:32", "Raspberry Pi"}, {"E4:5F:01", "Raspberry Pi"},
        {"D8:3A:DD", "Raspberry Pi"}, {"28:CD:C1", "Raspberry Pi"},
        // Espressif
        {"24:0A:C4", "Espressif"}, {"24:6F:28", "Espressif"}, {"30:AE:A4", "Espressif"},
        {"84:F3:EB", "Espressif"}, {"A4:CF:12", "Espressif"}, {"EC:FA:BC", "Espressif"},
        // Google
        {"3C:5A:B4", "Google"},   {"54:60:09", "Google"},    {"F4:F5:D8", "Google"},
        // Amazon
        {"44:65:0D", "Amazon"},   {"F0:27:2D", "Amazon"},    {"FC:65:DE", "Amazon"},
        // Networking gear
        {"00:00:0C", "Cisco"},    {"14:CC:20", "TP-Link"},   {"50:C7:BF", "TP-Link"},
        {"60:E3:27", "TP-Link"},  {"F4:F2:6D", "TP-Link"},   {"04:18:D6", "Ubiquiti"},
        {"24:A4:3C", "Ubiquiti"}, {"78:8A:20", "Ubiquiti"},  {"F0:9F:C2", "Ubiquiti"},
        {"FC:EC:DA", "Ubiquiti"}, {"00:09:5B", "Netgear"},   {"00:14:6C", "Netgear"},
        {"20:4E:7F", "Netgear"},  {"00:04:0E", "AVM"},       {"3C:A6:2F", "AVM"},
        {"C0:25:06", "AVM"},      {"00:E0:FC", "Huawei"},    {"00:18:82", "Huawei"},
        // Computers
        {"00:13:E8", "Intel"},    {"00:1B:21", "Intel"},     {"00:14:22", "Dell"},
        {"18:03:73", "Dell"},     {"3C:D9:2B", "HP"},        {"00:50:F2", "Microsoft"},
        {"7C:1E:52", "Microsoft"}, {"00:11:32", "Synology"},
        // Virtual machines
        {"00:05:69", "VMware"},   {"00:0C:29", "VMware"},    {"00:50:56", "VMware"},
        // Consumer electronics
        {"00:0E:58", "Sonos"},    {"5C:AA:FD", "Sonos"},     {"94:9F:3E", "Sonos"},
        {"28:6C:07", "Xiaomi"},   {"34:CE:00", "Xiaomi"},    {"00:09:BF", "Nintendo"},
        {"00:1F:32", "Nintendo"}, {"FC:0F:E6", "Sony"},      {"00:17:88", "Philips Hue"},
        {"B0:A7:37", "Roku"},     {"DC:3A:5E", "Roku"}};
    return vendors;
}

std::string VendorDetector::detectVendor(const std::string& mac) {
    auto prefix = ouiPrefix(mac);
    if (prefix.empty()) {
        return {};
    }

    const auto& vendors = getKnownVendors();
    auto it = vendors.find(prefix);
    return it != vendors.end() ? it->second : "";
}

} // namespace netscan::core
