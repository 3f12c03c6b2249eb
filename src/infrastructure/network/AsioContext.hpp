#pragma once

#include <asio.hpp>
#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace netledger::infra {

/**
 * @brief An Asio I/O context driven by a fixed pool of worker threads.
 *
 * Used as the bounded worker pool for scan phases: each phase owns one
 * context sized from configuration, submits one unit per host and waits on
 * the returned futures as its barrier. A pool of one thread is valid.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of worker threads; 0 is treated as 1.
     * @param name Label used in log messages.
     */
    explicit AsioContext(size_t threadCount, std::string name = "worker");

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
     * Handlers still queued are discarded. Callers wait on their futures first.
     */
    void stop();

    asio::io_context& getContext() { return ioContext_; }

    [[nodiscard]] size_t threadCount() const { return threadCount_; }

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    /**
     * @brief Posts a handler to be executed asynchronously.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

    /**
     * @brief Posts a callable and returns a future for its result.
     *
     * Exceptions thrown by the callable are delivered through the future.
     */
    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
        using Result = std::invoke_result_t<std::decay_t<Fn>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        auto future = task->get_future();
        asio::post(ioContext_, [task]() { (*task)(); });
        return future;
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

} // namespace netledger::infra
