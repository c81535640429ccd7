#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

namespace citestream::pipeline {

// io_context-backed worker pool shared by all session strands.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads = 0); ///< 0 = hardware concurrency
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    boost::asio::any_io_executor executor() const { return io_.get_executor(); }

    /// Let queued work finish, then join the threads
    void drain();

    /// Abandon queued work and join the threads
    void stop();

    std::size_t threads() const noexcept { return threadCount_; }

private:
    void runThread();

    mutable boost::asio::io_context io_;
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;
    std::unique_ptr<WorkGuard> guard_;
    std::vector<std::jthread> threads_;
    std::size_t threadCount_ = 0;
};

} // namespace citestream::pipeline
