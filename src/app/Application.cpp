#include "app/Application.hpp"

#include "infrastructure/export/DeviceExporter.hpp"

#include <QCommandLineParser>
#include <QStandardPaths>
#include <QTextStream>
#include <QTimer>
#include <algorithm>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

namespace netscan::app {

Application::Application(int& argc, char** argv) {
    qtApp_ = std::make_unique<QCoreApplication>(argc, argv);
    qtApp_->setApplicationName("netscan");
    qtApp_->setApplicationVersion("1.0.0");
    qtApp_->setOrganizationName("netscan");

    parseArguments();
    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::info("Application shutting down...");

    if (scanner_) {
        scanner_->cancel();
    }
}

void Application::parseArguments() {
    QCommandLineParser parser;
    parser.setApplicationDescription("Discovers hosts on the local subnet and keeps a catalog of "
                                     "devices per network.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption scanOption("scan", "Sweep the local subnet (default).");
    QCommandLineOption listOption("list", "List cataloged networks and devices without scanning.");
    QCommandLineOption exportOption("export", "Write the scan result as CSV to <file>.", "file");
    QCommandLineOption statusOption("with-status", "Include the status column in the CSV export.");
    QCommandLineOption configDirOption("config-dir", "Use <dir> for configuration and data.",
                                       "dir");
    QCommandLineOption verboseOption("verbose", "Log debug output to the console.");

    parser.addOption(scanOption);
    parser.addOption(listOption);
    parser.addOption(exportOption);
    parser.addOption(statusOption);
    parser.addOption(configDirOption);
    parser.addOption(verboseOption);
    parser.process(*qtApp_);

    options_.list = parser.isSet(listOption) && !parser.isSet(scanOption);
    options_.exportPath = parser.value(exportOption);
    options_.withStatus = parser.isSet(statusOption);
    options_.configDir = parser.value(configDirOption);
    options_.verbose = parser.isSet(verboseOption);

    if (options_.configDir.isEmpty()) {
        options_.configDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    }
}

void Application::initializeLogging() {
    auto configDir = std::filesystem::path(options_.configDir.toStdString());
    std::error_code dirError;
    std::filesystem::create_directories(configDir, dirError);

    auto logPath = configDir / "netscan.log";

    consoleSink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink_->set_level(options_.verbose ? spdlog::level::debug : spdlog::level::info);

    std::vector<spdlog::sink_ptr> sinks{consoleSink_};
    std::string fileSinkError;
    try {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), 5 * 1024 * 1024, 3);
        fileSink->set_level(spdlog::level::debug);
        sinks.push_back(fileSink);
    } catch (const spdlog::spdlog_ex& e) {
        fileSinkError = e.what();
    }

    auto logger = std::make_shared<spdlog::logger>("netscan", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    if (dirError) {
        spdlog::warn("Failed to create {}: {}", configDir.string(), dirError.message());
    }
    if (!fileSinkError.empty()) {
        spdlog::warn("Logging to console only: {}", fileSinkError);
    }

    spdlog::info("netscan {} starting...", qtApp_->applicationVersion().toStdString());
    spdlog::debug("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    // Configuration
    config_ = std::make_unique<infra::ConfigManager>(options_.configDir.toStdString());
    if (!config_->load()) {
        spdlog::warn("Using default configuration");
    }
    const auto& cfg = config_->config();

    if (!options_.verbose) {
        auto level = spdlog::level::from_str(cfg.logLevel);
        if (level == spdlog::level::off && cfg.logLevel != "off") {
            spdlog::warn("Unknown log level '{}', using info", cfg.logLevel);
            level = spdlog::level::info;
        }
        consoleSink_->set_level(level);
    }

    // Catalog and stores
    catalog_ = std::make_unique<infra::Catalog>(config_->catalogPath());
    brands_ = std::make_shared<infra::BrandResolver>(config_->brandOverridesPath());
    icons_ = std::make_shared<infra::IconStore>(config_->iconMappingPath(), config_->iconDir());

    // Network services
    environment_ = std::make_unique<infra::SystemEnvironment>(cfg.preferredInterface);
    probes_ = std::make_unique<infra::ProbeService>();

    reconciler_ = std::make_shared<infra::ReconciliationEngine>(*catalog_, *environment_);
    scanner_ = std::make_shared<infra::DiscoveryScanner>(*environment_, *probes_, *brands_,
                                                         icons_.get(), *reconciler_);

    // ViewModels
    core::SweepConfig sweepConfig;
    sweepConfig.concurrency = cfg.scanConcurrency;
    sweepConfig.pingTimeout = std::chrono::milliseconds(cfg.pingTimeoutMs);
    sweepConfig.dnsTimeout = std::chrono::milliseconds(cfg.dnsTimeoutMs);
    sweepConfig.neighborFallback = cfg.neighborFallback;

    scannerViewModel_ = std::make_unique<viewmodels::ScannerViewModel>(scanner_, sweepConfig);
    networkListViewModel_ =
        std::make_unique<viewmodels::NetworkListViewModel>(reconciler_, brands_, icons_);

    QObject::connect(scannerViewModel_.get(), &viewmodels::ScannerViewModel::scanFinished,
                     networkListViewModel_.get(), &viewmodels::NetworkListViewModel::refresh);

    spdlog::info("Application components initialized");
}

int Application::run() {
    if (options_.list) {
        return listNetworks();
    }
    return runScan();
}

int Application::runScan() {
    int exitCode = 0;

    QObject::connect(scannerViewModel_.get(), &viewmodels::ScannerViewModel::statusChanged,
                     [](const QString& status) { spdlog::debug("{}", status.toStdString()); });

    QObject::connect(scannerViewModel_.get(), &viewmodels::ScannerViewModel::scanFinished,
                     [this, &exitCode](int) {
                         const auto& devices = scannerViewModel_->devices();
                         printDevices(devices);

                         QTextStream out(stdout);
                         out << scannerViewModel_->status() << Qt::endl;

                         if (!options_.exportPath.isEmpty()) {
                             bool includeStatus =
                                 options_.withStatus || config_->config().exportIncludeStatus;
                             if (!scannerViewModel_->exportCsv(options_.exportPath.toStdString(),
                                                               includeStatus)) {
                                 exitCode = 1;
                             }
                         }
                         qtApp_->quit();
                     });

    QTimer::singleShot(0, qtApp_.get(), [this]() {
        if (!scannerViewModel_->startScan()) {
            qtApp_->quit();
        }
    });

    qtApp_->exec();
    return exitCode;
}

int Application::listNetworks() {
    QTextStream out(stdout);
    auto networks = networkListViewModel_->networks();

    if (networks.empty()) {
        out << "No networks cataloged yet" << Qt::endl;
        return 0;
    }

    for (const auto& network : networks) {
        out << QString::fromStdString(network.emoji) << " "
            << QString::fromStdString(network.ssid) << " (" << network.devices.size()
            << " devices)" << Qt::endl;

        std::vector<core::Device> devices;
        for (const auto& [mac, device] : network.devices) {
            devices.push_back(device);
        }
        std::stable_sort(devices.begin(), devices.end(),
                         [](const core::Device& a, const core::Device& b) {
                             return core::ipLess(a.ip, b.ip);
                         });
        printDevices(devices);
    }

    if (!options_.exportPath.isEmpty()) {
        std::vector<core::Device> all;
        for (const auto& network : networks) {
            for (const auto& [mac, device] : network.devices) {
                all.push_back(device);
            }
        }
        bool includeStatus = options_.withStatus || config_->config().exportIncludeStatus;
        if (!infra::DeviceExporter::writeCsv(options_.exportPath.toStdString(), all,
                                             includeStatus)) {
            return 1;
        }
    }

    return 0;
}

void Application::printDevices(const std::vector<core::Device>& devices) const {
    QTextStream out(stdout);
    for (const auto& device : devices) {
        out << "  " << QString::fromStdString(device.iconEmoji()) << " "
            << QString::fromStdString(device.ip).leftJustified(16) << " "
            << QString::fromStdString(device.mac.value_or("-")).leftJustified(18) << " "
            << QString::fromStdString(device.displayName()).leftJustified(28) << " "
            << QString::fromStdString(device.brand.empty() ? "-" : device.brand) << " "
            << QString::fromStdString(device.statusToString()) << Qt::endl;
    }
}

} // namespace netscan::app
