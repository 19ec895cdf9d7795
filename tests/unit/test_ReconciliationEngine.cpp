#include <catch2/catch_test_macros.hpp>

#include "core/services/INetworkEnvironment.hpp"
#include "infrastructure/catalog/Catalog.hpp"
#include "infrastructure/catalog/ReconciliationEngine.hpp"

#include <algorithm>
#include <filesystem>

using namespace netscan::core;
using namespace netscan::infra;

namespace {

class FakeEnvironment : public INetworkEnvironment {
public:
    std::optional<InterfaceInfo> selectInterface() override {
        return InterfaceInfo{"wlan0", "192.168.1.5", "255.255.255.0"};
    }

    std::optional<std::string> currentNetworkName() override { return ssid; }

    std::optional<std::string> ssid;
};

class TestCatalog {
public:
    TestCatalog() : path_(std::filesystem::temp_directory_path() / "netscan_reconcile_test.json") {
        std::filesystem::remove(path_);
        catalog_ = std::make_unique<Catalog>(path_);
    }

    ~TestCatalog() {
        catalog_.reset();
        std::filesystem::remove(path_);
    }

    Catalog& get() { return *catalog_; }
    std::filesystem::path path() const { return path_; }

private:
    std::filesystem::path path_;
    std::unique_ptr<Catalog> catalog_;
};

Device scanned(const std::string& ip, const std::optional<std::string>& mac,
               const std::string& brand = "") {
    Device device;
    device.ip = ip;
    device.mac = mac;
    device.brand = brand;
    device.lastSeen = std::chrono::system_clock::now();
    device.status = DeviceStatus::Online;
    return device;
}

size_t countNamed(const std::vector<Network>& networks, const std::string& name) {
    return static_cast<size_t>(std::count_if(networks.begin(), networks.end(),
                                             [&name](const Network& n) { return n.ssid == name; }));
}

} // namespace

TEST_CASE("Network identity resolution", "[ReconciliationEngine]") {
    TestCatalog catalog;
    FakeEnvironment environment;
    ReconciliationEngine engine(catalog.get(), environment);

    SECTION("SSID when associated") {
        environment.ssid = "HomeWiFi";
        REQUIRE(engine.resolveNetworkIdentity() == "HomeWiFi");
    }

    SECTION("Unknown when no SSID is available") {
        REQUIRE(engine.resolveNetworkIdentity() == kUnknownNetworkName);
        environment.ssid = "";
        REQUIRE(engine.resolveNetworkIdentity() == kUnknownNetworkName);
    }

    SECTION("Consecutive unknown sweeps share one record") {
        for (int i = 0; i < 5; ++i) {
            engine.merge(engine.resolveNetworkIdentity(),
                         {scanned("192.168.1.1", "AA:00:00:00:00:01")});
        }

        auto networks = engine.networks();
        REQUIRE(networks.size() == 1);
        REQUIRE(countNamed(networks, kUnknownNetworkName) == 1);
    }
}

TEST_CASE("Merging a sweep into a new network", "[ReconciliationEngine]") {
    TestCatalog catalog;
    FakeEnvironment environment;
    ReconciliationEngine engine(catalog.get(), environment);

    auto network = engine.merge("HomeWiFi", {
                                                scanned("192.168.1.1", "aa-00-00-00-00-01"),
                                                scanned("192.168.1.20", std::nullopt),
                                                scanned("192.168.1.30", "AA:00:00:00:00:03"),
                                            });

    REQUIRE(network.ssid == "HomeWiFi");
    REQUIRE_FALSE(network.id.empty());
    REQUIRE(network.emoji == kDefaultNetworkEmoji);
    REQUIRE(network.devices.size() == 2);
    REQUIRE(network.devices.count("AA:00:00:00:00:01") == 1);
    REQUIRE(network.onlineCount() == 2);

    for (const auto& [mac, device] : network.devices) {
        REQUIRE_FALSE(device.id.empty());
        REQUIRE(device.mac == mac);
    }

    // Persisted immediately.
    Catalog reloaded(catalog.path());
    REQUIRE(reloaded.findByName("HomeWiFi").has_value());
}

TEST_CASE("Field policy for known devices", "[ReconciliationEngine]") {
    TestCatalog catalog;
    FakeEnvironment environment;
    ReconciliationEngine engine(catalog.get(), environment);

    auto first = scanned("192.168.1.10", "AA:00:00:00:00:01", "Apple");
    first.hostname = "old-name";
    first.customIconPath = "/icons/phone.png";
    auto network = engine.merge("Home", {first});

    auto stored = network.devices.at("AA:00:00:00:00:01");
    stored.owner = "Alice";
    stored.model = "iPhone 15";
    stored.brand = "My Brand";
    REQUIRE(engine.updateDevice(network.id, stored));

    auto again = scanned("192.168.1.11", "AA:00:00:00:00:01", "Apple");
    again.hostname = "new-name";
    network = engine.merge("Home", {again});

    const auto& device = network.devices.at("AA:00:00:00:00:01");

    SECTION("Identity is stable") {
        REQUIRE(device.id == stored.id);
    }

    SECTION("Address and hostname follow the scan") {
        REQUIRE(device.ip == "192.168.1.11");
        REQUIRE(device.hostname == "new-name");
    }

    SECTION("Icon falls back to the stored value") {
        REQUIRE(device.customIconPath == "/icons/phone.png");
    }

    SECTION("User fields are preserved") {
        REQUIRE(device.owner == "Alice");
        REQUIRE(device.model == "iPhone 15");
    }

    SECTION("Stored brand beats the detected one") {
        REQUIRE(device.brand == "My Brand");
    }

    SECTION("Device is online") {
        REQUIRE(device.status == DeviceStatus::Online);
    }
}

TEST_CASE("Empty stored brand takes the detected brand", "[ReconciliationEngine]") {
    TestCatalog catalog;
    FakeEnvironment environment;
    ReconciliationEngine engine(catalog.get(), environment);

    engine.merge("Home", {scanned("10.0.0.2", "AA:00:00:00:00:01")});
    auto network = engine.merge("Home", {scanned("10.0.0.2", "AA:00:00:00:00:01", "Espressif")});

    REQUIRE(network.devices.at("AA:00:00:00:00:01").brand == "Espressif");
}

TEST_CASE("Fresh icon replaces the stored icon", "[ReconciliationEngine]") {
    TestCatalog catalog;
    FakeEnvironment environment;
    ReconciliationEngine engine(catalog.get(), environment);

    auto first = scanned("10.0.0.2", "AA:00:00:00:00:01");
    first.customIconPath = "/icons/old.png";
    engine.merge("Home", {first});

    auto second = scanned("10.0.0.2", "AA:00:00:00:00:01");
    second.customIconPath = "/icons/new.png";
    auto network = engine.merge("Home", {second});

    REQUIRE(network.devices.at("AA:00:00:00:00:01").customIconPath == "/icons/new.png");
}

TEST_CASE("Status derivation", "[ReconciliationEngine]") {
    TestCatalog catalog;
    FakeEnvironment environment;
    ReconciliationEngine engine(catalog.get(), environment);

    engine.merge("Home", {scanned("10.0.0.1", "AA:00:00:00:00:01"),
                          scanned("10.0.0.2", "AA:00:00:00:00:02")});
    auto network = engine.merge("Home", {scanned("10.0.0.2", "AA:00:00:00:00:02")});

    REQUIRE(network.devices.size() == 2);
    REQUIRE(network.devices.at("AA:00:00:00:00:01").status == DeviceStatus::Offline);
    REQUIRE(network.devices.at("AA:00:00:00:00:02").status == DeviceStatus::Online);

    network = engine.merge("Home", {});
    REQUIRE(network.onlineCount() == 0);
    REQUIRE(network.devices.size() == 2);
}

TEST_CASE("Merging is idempotent apart from timestamps", "[ReconciliationEngine]") {
    TestCatalog catalog;
    FakeEnvironment environment;
    ReconciliationEngine engine(catalog.get(), environment);

    std::vector<Device> sweep = {scanned("10.0.0.1", "AA:00:00:00:00:01", "Apple"),
                                 scanned("10.0.0.2", "AA:00:00:00:00:02")};

    auto once = engine.merge("Home", sweep);
    auto twice = engine.merge("Home", sweep);

    once.lastSeen = twice.lastSeen;
    REQUIRE(once == twice);
    REQUIRE(engine.networks().size() == 1);
}

TEST_CASE("Direct catalog edits", "[ReconciliationEngine]") {
    TestCatalog catalog;
    FakeEnvironment environment;
    ReconciliationEngine engine(catalog.get(), environment);

    auto home = engine.merge("Home", {scanned("10.0.0.1", "AA:00:00:00:00:01")});
    auto office = engine.merge("Office", {});

    SECTION("Emoji update") {
        REQUIRE(engine.updateEmoji(home.id, "🏠"));
        REQUIRE(engine.findNetwork(home.id)->emoji == "🏠");
        REQUIRE_FALSE(engine.updateEmoji("missing", "🏠"));
    }

    SECTION("Device update of an unknown device fails") {
        Device ghost;
        ghost.id = "ghost";
        REQUIRE_FALSE(engine.updateDevice(home.id, ghost));
        REQUIRE_FALSE(engine.updateDevice("missing", ghost));
    }

    SECTION("Device update by id when the MAC is absent") {
        auto device = home.devices.at("AA:00:00:00:00:01");
        device.mac.reset();
        device.owner = "Bob";
        REQUIRE(engine.updateDevice(home.id, device));
        REQUIRE(engine.findNetwork(home.id)->devices.at("AA:00:00:00:00:01").owner == "Bob");
    }

    SECTION("Deleting the selected network clears the selection") {
        REQUIRE(engine.selectNetwork(home.id));
        REQUIRE(engine.selectedNetworkId() == home.id);

        REQUIRE(engine.deleteNetwork(home.id));
        REQUIRE(engine.networks().size() == 1);
        REQUIRE_FALSE(engine.selectedNetworkId().has_value());
        REQUIRE_FALSE(engine.deleteNetwork(home.id));
    }

    SECTION("Deleting another network keeps the selection") {
        REQUIRE(engine.selectNetwork(home.id));
        REQUIRE(engine.deleteNetwork(office.id));
        REQUIRE(engine.selectedNetworkId() == home.id);
    }

    SECTION("Selecting an unknown network fails") {
        REQUIRE_FALSE(engine.selectNetwork("missing"));
        REQUIRE_FALSE(engine.selectedNetworkId().has_value());
    }
}

TEST_CASE("Merging device identities", "[ReconciliationEngine]") {
    TestCatalog catalog;
    FakeEnvironment environment;
    ReconciliationEngine engine(catalog.get(), environment);

    auto a = scanned("10.0.0.10", "AA:00:00:00:00:01");
    auto b = scanned("10.0.0.11", "AA:00:00:00:00:02", "Apple");
    auto network = engine.merge("Home", {a, b});

    auto first = network.devices.at("AA:00:00:00:00:01");
    auto second = network.devices.at("AA:00:00:00:00:02");
    first.owner = "Alice";
    second.owner = "Bob";
    second.model = "MacBook";
    second.hostname = "macbook";
    REQUIRE(engine.updateDevice(network.id, first));
    REQUIRE(engine.updateDevice(network.id, second));

    // Only the second device is seen again, so it is the most recent one.
    network = engine.merge("Home", {scanned("10.0.0.99", "AA:00:00:00:00:02")});

    auto merged = engine.mergeDevices(network.id, {first.id, second.id});
    REQUIRE(merged.has_value());

    SECTION("The first selected device survives") {
        REQUIRE(merged->id == first.id);
        REQUIRE(merged->mac == "AA:00:00:00:00:01");

        auto updated = engine.findNetwork(network.id);
        REQUIRE(updated->devices.size() == 1);
        REQUIRE(updated->devices.count("AA:00:00:00:00:01") == 1);
    }

    SECTION("First non-empty value wins in selection order") {
        REQUIRE(merged->owner == "Alice");
        REQUIRE(merged->brand == "Apple");
        REQUIRE(merged->model == "MacBook");
        REQUIRE(merged->hostname == "macbook");
    }

    SECTION("Address comes from the most recently seen device") {
        REQUIRE(merged->ip == "10.0.0.99");
    }

    SECTION("Online if any input was online") {
        REQUIRE(merged->status == DeviceStatus::Online);
    }
}

TEST_CASE("Merging device identities needs two devices", "[ReconciliationEngine]") {
    TestCatalog catalog;
    FakeEnvironment environment;
    ReconciliationEngine engine(catalog.get(), environment);

    auto network = engine.merge("Home", {scanned("10.0.0.10", "AA:00:00:00:00:01")});
    auto id = network.devices.begin()->second.id;

    REQUIRE_FALSE(engine.mergeDevices(network.id, {id}).has_value());
    REQUIRE_FALSE(engine.mergeDevices(network.id, {id, id}).has_value());
    REQUIRE_FALSE(engine.mergeDevices(network.id, {id, "missing"}).has_value());
    REQUIRE_FALSE(engine.mergeDevices("missing", {id, id}).has_value());
    REQUIRE(engine.findNetwork(network.id)->devices.size() == 1);
}
