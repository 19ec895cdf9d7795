#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace netscan::infra {

AsioContext::AsioContext(size_t threadCount, std::string name)
    : threadCount_(threadCount > 0 ? threadCount : 1), name_(std::move(name)) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() { runWorker(i); });
    }

    spdlog::debug("{} pool started with {} workers", name_, threadCount_);
}

void AsioContext::runWorker(size_t index) {
    // A throwing handler unwinds out of run(); the worker re-enters it so the
    // pool keeps its width.
    while (true) {
        try {
            ioContext_.run();
            return;
        } catch (const std::exception& e) {
            spdlog::error("{} worker {}: handler failed: {}", name_, index, e.what());
        }
    }
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    ioContext_.restart();
    spdlog::debug("{} pool stopped", name_);
}

} // namespace netscan::infra
