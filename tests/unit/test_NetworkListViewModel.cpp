#include <catch2/catch_test_macros.hpp>

#include "core/services/INetworkEnvironment.hpp"
#include "viewmodels/NetworkListViewModel.hpp"

#include <QCoreApplication>
#include <filesystem>
#include <fstream>

using namespace netscan::core;
using namespace netscan::infra;
using namespace netscan::viewmodels;

namespace {

class FakeEnvironment : public INetworkEnvironment {
public:
    std::optional<InterfaceInfo> selectInterface() override { return std::nullopt; }
    std::optional<std::string> currentNetworkName() override { return std::nullopt; }
};

class TestFixture {
public:
    TestFixture() : dir_(std::filesystem::temp_directory_path() / "netscan_networklist_test") {
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);

        catalog_ = std::make_unique<Catalog>(dir_ / "networks.json");
        reconciler = std::make_shared<ReconciliationEngine>(*catalog_, environment_);
        brands = std::make_shared<BrandResolver>(dir_ / "brand_overrides.json");
        icons = std::make_shared<IconStore>(dir_ / "icons.json", dir_ / "icons");
        viewModel = std::make_unique<NetworkListViewModel>(reconciler, brands, icons);
    }

    ~TestFixture() {
        viewModel.reset();
        reconciler.reset();
        catalog_.reset();
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path makeImage() const {
        auto path = dir_ / "source.png";
        std::ofstream file(path, std::ios::binary);
        file << "\x89PNG";
        return path;
    }

    std::shared_ptr<ReconciliationEngine> reconciler;
    std::shared_ptr<BrandResolver> brands;
    std::shared_ptr<IconStore> icons;
    std::unique_ptr<NetworkListViewModel> viewModel;

private:
    std::filesystem::path dir_;
    FakeEnvironment environment_;
    std::unique_ptr<Catalog> catalog_;
};

Device scanned(const std::string& ip, const std::string& mac) {
    Device device;
    device.ip = ip;
    device.mac = mac;
    device.lastSeen = std::chrono::system_clock::now();
    device.status = DeviceStatus::Online;
    return device;
}

} // namespace

TEST_CASE("NetworkListViewModel selection", "[NetworkListViewModel]") {
    TestFixture fixture;
    auto home = fixture.reconciler->merge("Home", {scanned("10.0.0.1", "02:00:00:00:00:01")});

    int selectionChanges = 0;
    int networkChanges = 0;
    QObject::connect(fixture.viewModel.get(), &NetworkListViewModel::selectionChanged,
                     [&selectionChanges]() { ++selectionChanges; });
    QObject::connect(fixture.viewModel.get(), &NetworkListViewModel::networksChanged,
                     [&networkChanges]() { ++networkChanges; });

    SECTION("Selecting a network") {
        REQUIRE(fixture.viewModel->selectNetwork(home.id));
        REQUIRE(fixture.viewModel->selectedNetworkId() == home.id);
        REQUIRE(fixture.viewModel->selectedNetwork()->ssid == "Home");
        REQUIRE(selectionChanges == 1);

        // Reselecting is not a change.
        REQUIRE(fixture.viewModel->selectNetwork(home.id));
        REQUIRE(selectionChanges == 1);
    }

    SECTION("Selecting an unknown network") {
        REQUIRE_FALSE(fixture.viewModel->selectNetwork("missing"));
        REQUIRE(selectionChanges == 0);
    }

    SECTION("Deleting the selected network") {
        REQUIRE(fixture.viewModel->selectNetwork(home.id));
        REQUIRE(fixture.viewModel->deleteNetwork(home.id));

        REQUIRE(fixture.viewModel->networks().empty());
        REQUIRE_FALSE(fixture.viewModel->selectedNetwork().has_value());
        REQUIRE(selectionChanges == 2);
        REQUIRE(networkChanges == 1);
    }
}

TEST_CASE("NetworkListViewModel edits", "[NetworkListViewModel]") {
    TestFixture fixture;
    auto home = fixture.reconciler->merge("Home", {scanned("10.0.0.1", "B8:27:EB:00:00:01"),
                                                   scanned("10.0.0.2", "02:11:22:00:00:02")});
    auto pi = home.devices.at("B8:27:EB:00:00:01");
    auto other = home.devices.at("02:11:22:00:00:02");

    int networkChanges = 0;
    QObject::connect(fixture.viewModel.get(), &NetworkListViewModel::networksChanged,
                     [&networkChanges]() { ++networkChanges; });

    SECTION("Emoji") {
        REQUIRE(fixture.viewModel->updateEmoji(home.id, "🏡"));
        REQUIRE(fixture.viewModel->networks()[0].emoji == "🏡");
        REQUIRE(networkChanges == 1);
    }

    SECTION("Brand equal to the built-in vendor is not an override") {
        pi.brand = "Raspberry Pi";
        REQUIRE(fixture.viewModel->updateDevice(home.id, pi));
        REQUIRE(fixture.brands->overrides().empty());
    }

    SECTION("Different brand becomes an override for the prefix") {
        other.brand = "Shelly";
        other.owner = "Kitchen";
        REQUIRE(fixture.viewModel->updateDevice(home.id, other));

        REQUIRE(fixture.brands->brandOf("02:11:22:99:99:99") == "Shelly");
        auto stored = fixture.reconciler->findNetwork(home.id)->devices.at("02:11:22:00:00:02");
        REQUIRE(stored.owner == "Kitchen");
        REQUIRE(networkChanges == 1);
    }

    SECTION("Icons") {
        REQUIRE(fixture.viewModel->setDeviceIcon(home.id, pi.id, fixture.makeImage()));
        auto stored = fixture.reconciler->findNetwork(home.id)->devices.at("B8:27:EB:00:00:01");
        REQUIRE(stored.customIconPath.has_value());
        REQUIRE(fixture.icons->iconPathFor("B8:27:EB:00:00:01") == stored.customIconPath);

        REQUIRE(fixture.viewModel->removeDeviceIcon(home.id, pi.id));
        stored = fixture.reconciler->findNetwork(home.id)->devices.at("B8:27:EB:00:00:01");
        REQUIRE_FALSE(stored.customIconPath.has_value());
        REQUIRE_FALSE(fixture.icons->iconPathFor("B8:27:EB:00:00:01").has_value());
    }

    SECTION("Icon for an unknown device") {
        REQUIRE_FALSE(fixture.viewModel->setDeviceIcon(home.id, "missing", fixture.makeImage()));
    }

    SECTION("Merging devices") {
        auto merged = fixture.viewModel->mergeDevices(home.id, {pi.id, other.id});
        REQUIRE(merged.has_value());
        REQUIRE(fixture.viewModel->networks()[0].devices.size() == 1);
        REQUIRE(networkChanges == 1);
    }
}
