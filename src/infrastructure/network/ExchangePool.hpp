#pragma once

#include <asio.hpp>
#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace snmpwire::infra {

/**
 * @brief Worker threads that run blocking SNMP exchanges off the caller's
 *        thread.
 *
 * Exchanges are queued on an asio::io_context held open by a work guard.
 * shutdown() lets every queued exchange finish before the workers exit, so a
 * future obtained from submit() always becomes ready.
 *
 * @note This class is non-copyable.
 */
class ExchangePool {
public:
    /**
     * @param workers Number of worker threads (at least one is used).
     */
    explicit ExchangePool(size_t workers = 2);

    /**
     * @brief Calls shutdown().
     */
    ~ExchangePool();

    ExchangePool(const ExchangePool&) = delete;
    ExchangePool& operator=(const ExchangePool&) = delete;

    /**
     * @brief Spawns the workers. Has no effect while already running.
     */
    void start();

    /**
     * @brief Finishes the queued exchanges, then joins the workers.
     *
     * The pool may be started again afterwards.
     */
    void shutdown();

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] size_t workerCount() const { return workerCount_; }

    /**
     * @brief Exchanges submitted but not yet finished.
     */
    [[nodiscard]] size_t pending() const { return pending_; }

    /**
     * @brief Queues @p fn for a worker thread.
     *
     * Work queued before start() runs once the pool is started.
     *
     * @return Future holding the result or the exception thrown by @p fn.
     */
    template <typename Fn>
    std::future<std::invoke_result_t<Fn>> submit(Fn&& fn) {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        auto future = task->get_future();

        ++pending_;
        asio::post(ioContext_, [this, task]() {
            (*task)();
            --pending_;
        });
        return future;
    }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> pending_{0};
    size_t workerCount_;
};

} // namespace snmpwire::infra
