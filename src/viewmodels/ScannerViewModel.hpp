/**
 * @file ScannerViewModel.hpp
 * @brief ViewModel driving discovery sweeps.
 *
 * This file defines the ScannerViewModel class which starts and stops
 * sweeps and exposes their progress and results in the MVVM architecture.
 */

#pragma once

#include "core/services/IDiscoveryScanner.hpp"
#include "core/types/Device.hpp"

#include <QObject>
#include <QString>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace netscan::viewmodels {

/**
 * @brief ViewModel for running discovery sweeps.
 *
 * Scanner callbacks arrive on the sweep's coordinator thread and are
 * marshalled onto this object's thread before any state changes, so all
 * getters and signals belong to the owning thread.
 */
class ScannerViewModel : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Constructs a ScannerViewModel.
     * @param scanner Sweep engine.
     * @param config Parameters used for every sweep started here.
     * @param parent Optional parent QObject for Qt ownership.
     */
    ScannerViewModel(std::shared_ptr<core::IDiscoveryScanner> scanner, core::SweepConfig config,
                     QObject* parent = nullptr);

    /**
     * @brief Destructor. Cancels a running sweep; its remaining callbacks are dropped.
     */
    ~ScannerViewModel() override;

    /**
     * @brief Starts a sweep.
     * @return False if a sweep is already running; nothing changes.
     */
    bool startScan();

    /**
     * @brief Requests cancellation of the running sweep.
     */
    void stopScan();

    bool isScanning() const { return scanning_; }

    /**
     * @brief Fraction of hosts probed in the current or last sweep, 0 to 1.
     */
    double progress() const { return progress_; }

    /**
     * @brief Human-readable status line.
     */
    QString status() const { return status_; }

    /**
     * @brief Devices found by the last completed sweep, sorted by IP.
     */
    const std::vector<core::Device>& devices() const { return devices_; }

    /**
     * @brief Name of the network the last sweep was merged into.
     */
    const std::string& networkName() const { return networkName_; }

    std::vector<core::Device> filteredDevices(const std::string& query, bool onlyWithMac) const;

    /**
     * @brief Exports the filtered device list as CSV.
     * @return False if the file could not be written.
     */
    bool exportCsv(const std::filesystem::path& path, bool includeStatus,
                   const std::string& query = {}, bool onlyWithMac = false) const;

signals:
    void scanStarted();

    /**
     * @brief Emitted after every probe completes.
     * @param fraction Completed fraction, 0 to 1.
     */
    void progressChanged(double fraction);

    void statusChanged(const QString& status);

    /**
     * @brief Emitted when a sweep ends, including cancelled and failed sweeps.
     * @param deviceCount Number of devices in the result.
     */
    void scanFinished(int deviceCount);

private:
    void onProgress(const core::SweepProgress& progress);
    void onComplete(const core::SweepOutcome& outcome);
    void setStatus(const QString& status);

    // Shared with in-flight scanner callbacks, which may outlive this object.
    struct CallbackTarget {
        std::mutex mutex;
        ScannerViewModel* viewModel{nullptr};
    };

    std::shared_ptr<core::IDiscoveryScanner> scanner_;
    std::shared_ptr<CallbackTarget> callbackTarget_;
    core::SweepConfig config_;

    bool scanning_{false};
    double progress_{0.0};
    QString status_;
    std::vector<core::Device> devices_;
    std::string networkName_;
};

} // namespace netscan::viewmodels
