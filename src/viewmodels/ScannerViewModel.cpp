#include "viewmodels/ScannerViewModel.hpp"

#include "infrastructure/export/DeviceExporter.hpp"

#include <spdlog/spdlog.h>

namespace netscan::viewmodels {

ScannerViewModel::ScannerViewModel(std::shared_ptr<core::IDiscoveryScanner> scanner,
                                   core::SweepConfig config, QObject* parent)
    : QObject(parent), scanner_(std::move(scanner)),
      callbackTarget_(std::make_shared<CallbackTarget>()), config_(config) {
    callbackTarget_->viewModel = this;
}

ScannerViewModel::~ScannerViewModel() {
    {
        std::lock_guard lock(callbackTarget_->mutex);
        callbackTarget_->viewModel = nullptr;
    }
    if (scanning_) {
        scanner_->cancel();
    }
}

bool ScannerViewModel::startScan() {
    if (scanning_ || scanner_->isScanning()) {
        spdlog::debug("Scan request ignored, sweep already running");
        return false;
    }

    // The lock keeps the target alive while posting; events still queued
    // when it is destroyed are discarded by Qt.
    auto progressCallback = [target = callbackTarget_](const core::SweepProgress& progress) {
        std::lock_guard lock(target->mutex);
        if (auto* self = target->viewModel) {
            QMetaObject::invokeMethod(
                self, [self, progress]() { self->onProgress(progress); }, Qt::QueuedConnection);
        }
    };
    auto completionCallback = [target = callbackTarget_](const core::SweepOutcome& outcome) {
        std::lock_guard lock(target->mutex);
        if (auto* self = target->viewModel) {
            QMetaObject::invokeMethod(
                self, [self, outcome]() { self->onComplete(outcome); }, Qt::QueuedConnection);
        }
    };

    if (!scanner_->scanAsync(config_, progressCallback, completionCallback)) {
        return false;
    }

    scanning_ = true;
    progress_ = 0.0;
    emit scanStarted();
    emit progressChanged(progress_);
    setStatus(QStringLiteral("Scanning..."));
    return true;
}

void ScannerViewModel::stopScan() {
    if (scanning_) {
        scanner_->cancel();
        setStatus(QStringLiteral("Cancelling..."));
    }
}

void ScannerViewModel::onProgress(const core::SweepProgress& progress) {
    if (progress.state == core::SweepState::Sweeping) {
        double fraction = progress.fraction();
        if (fraction != progress_) {
            progress_ = fraction;
            emit progressChanged(progress_);
        }
        setStatus(QString("Scanning %1 (%2/%3, %4 found)")
                      .arg(QString::fromStdString(progress.subnet))
                      .arg(progress.processedHosts)
                      .arg(progress.totalHosts)
                      .arg(progress.foundHosts));
    } else if (progress.state == core::SweepState::Reconciling) {
        setStatus(QStringLiteral("Updating catalog..."));
    }
}

void ScannerViewModel::onComplete(const core::SweepOutcome& outcome) {
    scanning_ = false;
    devices_ = outcome.devices;
    networkName_ = outcome.networkName;

    if (outcome.state == core::SweepState::Done && outcome.error == core::SweepError::None &&
        progress_ != 1.0) {
        progress_ = 1.0;
        emit progressChanged(progress_);
    }

    setStatus(QString::fromStdString(outcome.message));
    emit scanFinished(static_cast<int>(devices_.size()));
}

void ScannerViewModel::setStatus(const QString& status) {
    if (status_ != status) {
        status_ = status;
        emit statusChanged(status_);
    }
}

std::vector<core::Device> ScannerViewModel::filteredDevices(const std::string& query,
                                                            bool onlyWithMac) const {
    return infra::DeviceExporter::filterDevices(devices_, query, onlyWithMac);
}

bool ScannerViewModel::exportCsv(const std::filesystem::path& path, bool includeStatus,
                                 const std::string& query, bool onlyWithMac) const {
    return infra::DeviceExporter::writeCsv(path, filteredDevices(query, onlyWithMac),
                                           includeStatus);
}

} // namespace netscan::viewmodels
