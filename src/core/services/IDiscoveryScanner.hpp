/**
 * @file IDiscoveryScanner.hpp
 * @brief Interface for the subnet discovery sweep.
 *
 * This file defines the abstract interface that runs a discovery sweep in
 * the background and reports its progress and outcome through callbacks.
 */

#pragma once

#include "core/types/Sweep.hpp"

#include <functional>

namespace netscan::core {

/**
 * @brief Interface for the discovery sweep engine.
 */
class IDiscoveryScanner {
public:
    /**
     * @brief Callback function type for progress and state updates.
     * @param progress Current sweep progress.
     */
    using ProgressCallback = std::function<void(const SweepProgress&)>;

    /**
     * @brief Callback function type for sweep completion.
     * @param outcome Final result of the sweep.
     */
    using CompletionCallback = std::function<void(const SweepOutcome&)>;

    virtual ~IDiscoveryScanner() = default;

    /**
     * @brief Starts a sweep in the background.
     * @param config Sweep parameters.
     * @param onProgress Callback for state changes and each completed probe.
     * @param onComplete Callback when the sweep finishes or is cancelled.
     * @return False if a sweep is already in progress (the request is ignored).
     */
    virtual bool scanAsync(const SweepConfig& config, ProgressCallback onProgress,
                           CompletionCallback onComplete) = 0;

    /**
     * @brief Stops admitting hosts; in-flight probes are left to finish.
     */
    virtual void cancel() = 0;

    /**
     * @brief Checks if a sweep is currently in progress.
     */
    virtual bool isScanning() const = 0;

    /**
     * @brief Returns the current lifecycle state.
     */
    virtual SweepState state() const = 0;
};

} // namespace netscan::core
