#include <citestream/pipeline/worker_pool.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <system_error>

namespace citestream::pipeline {

WorkerPool::WorkerPool(std::size_t threads) {
    if (threads == 0)
        threads = std::max(1u, std::thread::hardware_concurrency());
    guard_ = std::make_unique<WorkGuard>(boost::asio::make_work_guard(io_));
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this]() { runThread(); });
    }
    threadCount_ = threads;
    spdlog::debug("[WorkerPool] started with {} threads", threadCount_);
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::drain() {
    // Without the guard run() returns once the queue is empty
    if (guard_) {
        guard_->reset();
        guard_.reset();
    }
    for (auto& t : threads_) {
        if (t.joinable()) {
            try {
                t.join();
            } catch (const std::system_error& e) {
                spdlog::warn("[WorkerPool] join failed: {}", e.what());
            }
        }
    }
    threads_.clear();
}

void WorkerPool::stop() {
    if (guard_) {
        guard_->reset();
        guard_.reset();
    }
    if (!io_.stopped()) {
        io_.stop();
    }
    drain();
}

void WorkerPool::runThread() {
    while (!io_.stopped()) {
        try {
            io_.run();
            break;
        } catch (const std::exception& e) {
            // A handler threw; keep the thread serving the remaining work
            spdlog::error("[WorkerPool] handler exception: {}", e.what());
        }
    }
}

} // namespace citestream::pipeline
