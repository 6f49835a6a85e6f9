#pragma once

#include <asio.hpp>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace beamstate::infra {

/**
 * @brief Owns an asio::io_context and the named pool of threads that runs it.
 *
 * The application keeps two of these: the shared I/O pool carrying the node
 * loops and deadline timers, and the probe pool on which blocking probe
 * commands execute. A work guard keeps run() alive until stop().
 *
 * An exception escaping a handler is logged and counted; the worker then
 * resumes running the context, so one faulty handler never shrinks the pool.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @param name Pool name used in log output.
     * @param threadCount Number of worker threads, at least one.
     */
    explicit AsioContext(std::string name,
                         size_t threadCount = std::thread::hardware_concurrency());

    /**
     * @brief Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Spawns the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Releases the work guard, stops the context and joins the workers.
     *
     * Handlers still queued are dropped. The context is restarted afterwards
     * so start() may be called again.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] size_t threadCount() const { return threadCount_; }
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] uint64_t handlerFailures() const { return handlerFailures_; }

    asio::io_context& getContext() { return ioContext_; }

    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

private:
    void runWorker(size_t index);

    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    std::string name_;
    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> handlerFailures_{0};
    size_t threadCount_;
};

} // namespace beamstate::infra
