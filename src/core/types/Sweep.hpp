/**
 * @file Sweep.hpp
 * @brief Discovery sweep configuration, progress and outcome types.
 *
 * This file defines the lifecycle states of a discovery sweep and the
 * structures exchanged between the sweep engine and its callers.
 */

#pragma once

#include "core/types/Device.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace netscan::core {

/**
 * @brief Lifecycle of a sweep.
 */
enum class SweepState : int {
    Idle = 0,               ///< No sweep has run yet
    ResolvingInterface = 1, ///< Selecting the interface and subnet
    Sweeping = 2,           ///< Probing hosts
    Reconciling = 3,        ///< Merging results into the catalog
    Done = 4,               ///< Finished, successfully or with an error
    Cancelled = 5           ///< Stopped before reconciliation
};

/**
 * @brief Terminal error of a sweep.
 */
enum class SweepError : int {
    None = 0,             ///< The sweep ran to completion
    NoActiveInterface = 1 ///< No usable IPv4 interface was found
};

/**
 * @brief Converts a sweep state to a string for logs and status lines.
 */
std::string sweepStateToString(SweepState state);

/**
 * @brief Parameters of one sweep.
 */
struct SweepConfig {
    int concurrency{64};                                  ///< Maximum probes in flight
    std::chrono::milliseconds pingTimeout{700}; ///< Liveness wait budget
    std::chrono::milliseconds dnsTimeout{1000};  ///< Reverse DNS wait budget
    bool neighborFallback{true};                          ///< Run the neighbor table pass
};

/**
 * @brief Progress information during a sweep.
 */
struct SweepProgress {
    SweepState state{SweepState::Idle}; ///< Current lifecycle state
    std::string subnet;                 ///< Label of the swept subnet, once known
    int totalHosts{0};                  ///< Number of addresses to probe
    int processedHosts{0};              ///< Number of probes completed
    int foundHosts{0};                  ///< Number of live hosts so far

    /**
     * @brief Fraction of probes completed.
     * @return processed / total in [0, 1]; 0 while the total is unknown.
     */
    [[nodiscard]] double fraction() const {
        return totalHosts > 0 ? static_cast<double>(processedHosts) / totalHosts : 0.0;
    }
};

/**
 * @brief Final result of a sweep.
 */
struct SweepOutcome {
    SweepState state{SweepState::Done}; ///< Done or Cancelled
    SweepError error{SweepError::None}; ///< Terminal error, if any
    std::vector<Device> devices;        ///< Discovered devices sorted by IP
    std::string networkName;            ///< Network the results were merged into
    std::string subnet;                 ///< Label of the swept subnet
    std::string message;                ///< Human-readable status line
};

} // namespace netscan::core
