#include <catch2/catch_test_macros.hpp>

#include "core/services/INetworkEnvironment.hpp"
#include "core/services/IProbeService.hpp"
#include "infrastructure/catalog/Catalog.hpp"
#include "infrastructure/catalog/ReconciliationEngine.hpp"
#include "infrastructure/network/DiscoveryScanner.hpp"
#include "infrastructure/storage/BrandResolver.hpp"
#include "viewmodels/ScannerViewModel.hpp"

#include <QCoreApplication>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <thread>

using namespace netscan::core;
using namespace netscan::infra;
using namespace netscan::viewmodels;

namespace {

QCoreApplication& testApplication() {
    static int argc = 1;
    static char name[] = "netscan_integration_tests";
    static char* argv[] = {name, nullptr};
    static QCoreApplication app(argc, argv);
    return app;
}

class FakeEnvironment : public INetworkEnvironment {
public:
    std::optional<InterfaceInfo> selectInterface() override {
        return InterfaceInfo{"eth0", "10.0.0.5", "255.255.255.240"};
    }
    std::optional<std::string> currentNetworkName() override { return "Office"; }
};

class FakeProbeService : public IProbeService {
public:
    bool isAlive(const std::string& ip, std::chrono::milliseconds) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(delayMs.load()));
        return ip == "10.0.0.1" || ip == "10.0.0.3" || ip == "10.0.0.4";
    }

    std::optional<std::string> resolveNeighbor(const std::string& ip) override {
        if (ip == "10.0.0.1") {
            return "02:00:00:00:00:01";
        }
        if (ip == "10.0.0.3") {
            return "02:00:00:00:00:03";
        }
        return std::nullopt;
    }

    std::optional<std::string> resolveHostname(const std::string& ip,
                                               std::chrono::milliseconds) override {
        if (ip == "10.0.0.3") {
            return "printer.office";
        }
        return std::nullopt;
    }

    std::vector<NeighborEntry> snapshotNeighborTable() override { return {}; }

    std::atomic<int> delayMs{2};
};

class ViewModelFixture {
public:
    ViewModelFixture()
        : dir_(std::filesystem::temp_directory_path() / "netscan_scanner_vm_integration_test") {
        testApplication();
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);

        catalog_ = std::make_unique<Catalog>(dir_ / "networks.json");
        brands_ = std::make_unique<BrandResolver>(dir_ / "brand_overrides.json");
        reconciler_ = std::make_unique<ReconciliationEngine>(*catalog_, environment_);
        scanner_ = std::make_shared<DiscoveryScanner>(environment_, probes_, *brands_, nullptr,
                                                      *reconciler_);

        SweepConfig config;
        config.concurrency = 4;
        viewModel = std::make_unique<ScannerViewModel>(scanner_, config);
    }

    ~ViewModelFixture() {
        viewModel.reset();
        scanner_.reset();
        reconciler_.reset();
        catalog_.reset();
        std::filesystem::remove_all(dir_);
    }

    bool waitForFinish(std::chrono::seconds timeout = std::chrono::seconds(30)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!finished && std::chrono::steady_clock::now() < deadline) {
            QCoreApplication::processEvents();
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return finished;
    }

    std::filesystem::path path(const std::string& name) const { return dir_ / name; }

    DiscoveryScanner& scanner() { return *scanner_; }
    FakeProbeService& probes() { return probes_; }

    std::unique_ptr<ScannerViewModel> viewModel;
    bool finished{false};

private:
    std::filesystem::path dir_;
    FakeEnvironment environment_;
    FakeProbeService probes_;
    std::unique_ptr<Catalog> catalog_;
    std::unique_ptr<BrandResolver> brands_;
    std::unique_ptr<ReconciliationEngine> reconciler_;
    std::shared_ptr<DiscoveryScanner> scanner_;
};

std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

TEST_CASE("ScannerViewModel runs a sweep to completion", "[Integration][ScannerViewModel]") {
    ViewModelFixture fixture;

    int started = 0;
    int finishedCount = -1;
    std::vector<double> fractions;
    QObject::connect(fixture.viewModel.get(), &ScannerViewModel::scanStarted,
                     [&started]() { ++started; });
    QObject::connect(fixture.viewModel.get(), &ScannerViewModel::progressChanged,
                     [&fractions](double fraction) { fractions.push_back(fraction); });
    QObject::connect(fixture.viewModel.get(), &ScannerViewModel::scanFinished,
                     [&fixture, &finishedCount](int count) {
                         finishedCount = count;
                         fixture.finished = true;
                     });

    REQUIRE(fixture.viewModel->startScan());
    REQUIRE(fixture.viewModel->isScanning());
    REQUIRE_FALSE(fixture.viewModel->startScan());
    REQUIRE(started == 1);

    REQUIRE(fixture.waitForFinish());

    SECTION("State after completion") {
        REQUIRE_FALSE(fixture.viewModel->isScanning());
        REQUIRE(finishedCount == 3);
        REQUIRE(fixture.viewModel->devices().size() == 3);
        REQUIRE(fixture.viewModel->networkName() == "Office");
        REQUIRE(fixture.viewModel->progress() == 1.0);
        REQUIRE(fixture.viewModel->status() ==
                QStringLiteral("Found 3 devices on Office (10.0.0.0/28)"));
    }

    SECTION("Progress never goes backwards") {
        REQUIRE_FALSE(fractions.empty());
        REQUIRE(fractions.back() == 1.0);
        for (size_t i = 1; i < fractions.size(); ++i) {
            REQUIRE(fractions[i] >= fractions[i - 1]);
        }
    }

    SECTION("Filtering") {
        REQUIRE(fixture.viewModel->filteredDevices("printer", false).size() == 1);
        REQUIRE(fixture.viewModel->filteredDevices("", true).size() == 2);
        REQUIRE(fixture.viewModel->filteredDevices("10.0.0.", false).size() == 3);
    }

    SECTION("Export") {
        auto csv = fixture.path("devices.csv");
        REQUIRE(fixture.viewModel->exportCsv(csv, true, "", true));

        auto content = readFile(csv);
        REQUIRE(content.starts_with("ip,mac,hostname,owner,brand,model,status\n"));
        REQUIRE(content.find("\"10.0.0.3\",\"02:00:00:00:00:03\",\"printer.office\"") !=
                std::string::npos);
        REQUIRE(content.find("\"10.0.0.4\"") == std::string::npos);
    }
}

TEST_CASE("ScannerViewModel stopScan cancels the sweep", "[Integration][ScannerViewModel]") {
    ViewModelFixture fixture;
    QObject::connect(fixture.viewModel.get(), &ScannerViewModel::scanFinished,
                     [&fixture](int) { fixture.finished = true; });

    REQUIRE(fixture.viewModel->startScan());
    fixture.viewModel->stopScan();
    REQUIRE(fixture.viewModel->status() == QStringLiteral("Cancelling..."));

    REQUIRE(fixture.waitForFinish());
    REQUIRE_FALSE(fixture.viewModel->isScanning());
    REQUIRE(fixture.viewModel->status().startsWith(QStringLiteral("Scan cancelled (")));
    REQUIRE(fixture.viewModel->networkName().empty());
}

TEST_CASE("ScannerViewModel destroyed during a sweep", "[Integration][ScannerViewModel]") {
    ViewModelFixture fixture;
    fixture.probes().delayMs = 20;

    REQUIRE(fixture.viewModel->startScan());
    fixture.viewModel.reset();

    // The sweep drains and reports completion to a view model that is gone.
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (fixture.scanner().isScanning() && std::chrono::steady_clock::now() < deadline) {
        QCoreApplication::processEvents();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    QCoreApplication::processEvents();

    REQUIRE_FALSE(fixture.scanner().isScanning());
    REQUIRE(fixture.scanner().state() == SweepState::Cancelled);
}
