#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace netscan::infra {

/**
 * @brief Manages an Asio I/O context with a thread pool for probe work.
 *
 * Provides a wrapper around asio::io_context that manages a pool of worker
 * threads. Probes block on their own socket or resolver timeouts, so the
 * pool is sized to the sweep's concurrency width. Uses executor_work_guard to
 * keep the context running until explicitly stopped. A handler that throws
 * is logged and its worker resumes; it does not take the process down.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of worker threads (defaults to hardware concurrency).
     * @param name Label used in log messages.
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency(),
                         std::string name = "probe");

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Starts the I/O context and worker threads.
     *
     * Has no effect if already running.
     */
    void start();

    /**
     * @brief Stops the I/O context and joins all worker threads.
     *
     * Handlers already running are allowed to finish; queued handlers that
     * have not started are dropped.
     */
    void stop();

    /**
     * @brief Posts a handler to be executed asynchronously.
     * @tparam Handler Callable type (function, lambda, etc.).
     * @param handler The handler to execute on the worker pool.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

private:
    void runWorker(size_t index);

    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
    std::string name_;
};

} // namespace netscan::infra
