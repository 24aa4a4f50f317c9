#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lanwatch::infra {

/**
 * @brief Owns an Asio I/O context and the worker threads that run it.
 *
 * Timers of the monitor scheduler and asynchronous scan requests run on this
 * context. An executor_work_guard keeps run() alive until stop().
 *
 * @note Non-copyable. start() and stop() may be called repeatedly.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of worker threads (defaults to hardware concurrency).
     * @param name Label used in log messages.
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency(),
                         std::string name = "io");

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Starts the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Stops the context and joins all worker threads.
     *
     * Pending handlers are discarded; the context is restarted so that a
     * later start() works again.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }
    [[nodiscard]] size_t threadCount() const { return threadCount_; }

    asio::io_context& getContext() { return ioContext_; }

    /**
     * @brief Posts a handler to be executed on a worker thread.
     * @tparam Handler Callable type (function, lambda, etc.).
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
    std::string name_;
};

} // namespace lanwatch::infra
