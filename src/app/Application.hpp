#pragma once

#include "infrastructure/catalog/Catalog.hpp"
#include "infrastructure/catalog/ReconciliationEngine.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/DiscoveryScanner.hpp"
#include "infrastructure/network/ProbeService.hpp"
#include "infrastructure/network/SystemEnvironment.hpp"
#include "infrastructure/storage/BrandResolver.hpp"
#include "infrastructure/storage/IconStore.hpp"
#include "viewmodels/NetworkListViewModel.hpp"
#include "viewmodels/ScannerViewModel.hpp"

#include <QCoreApplication>
#include <QString>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace netscan::app {

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    int run();

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    infra::ReconciliationEngine& reconciler() { return *reconciler_; }
    viewmodels::ScannerViewModel& scannerViewModel() { return *scannerViewModel_; }
    viewmodels::NetworkListViewModel& networkListViewModel() { return *networkListViewModel_; }

private:
    struct Options {
        bool list{false};
        QString exportPath;
        bool withStatus{false};
        QString configDir;
        bool verbose{false};
    };

    void parseArguments();
    void initializeLogging();
    void initializeComponents();

    int runScan();
    int listNetworks();
    void printDevices(const std::vector<core::Device>& devices) const;

    std::unique_ptr<QCoreApplication> qtApp_;
    Options options_;
    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> consoleSink_;

    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::Catalog> catalog_;
    std::unique_ptr<infra::SystemEnvironment> environment_;
    std::unique_ptr<infra::ProbeService> probes_;
    std::shared_ptr<infra::BrandResolver> brands_;
    std::shared_ptr<infra::IconStore> icons_;
    std::shared_ptr<infra::ReconciliationEngine> reconciler_;
    std::shared_ptr<infra::DiscoveryScanner> scanner_;

    std::unique_ptr<viewmodels::ScannerViewModel> scannerViewModel_;
    std::unique_ptr<viewmodels::NetworkListViewModel> networkListViewModel_;
};

} // namespace netscan::app
