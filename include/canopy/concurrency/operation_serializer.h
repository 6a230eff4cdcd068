#pragma once

#include <canopy/core/types.h>

#include <boost/asio/any_io_executor.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>

namespace canopy::concurrency {

/**
 * @brief Runs at most one operation per project at a time, in submission order.
 *
 * Each contested project gets a lane: a FIFO of tickets whose front entry owns
 * the project. The lane is dropped once its queue drains, so the table only
 * holds projects with work in flight.
 *
 * run() executes the operation on the calling thread once its ticket reaches
 * the front. submit() enqueues a job that is handed to the executor only when
 * it reaches the front, so a queued job never occupies a worker. A caller
 * blocked in run() behind a job that has not started yet executes that job
 * itself; a blocked worker therefore never waits on work that needs another
 * worker. Operations for different projects run in parallel.
 *
 * Operations return Result<T>. A failing operation (error result or thrown
 * exception) only affects its own caller; the next queued operation still runs.
 *
 * Calling run() or submit() for a project from inside an operation that
 * already holds that project's lane executes the nested operation inline.
 * Nested calls that form a cycle across projects (A waits on B while B waits
 * on A) are not detected.
 */
class OperationSerializer {
public:
    struct Stats {
        uint64_t submitted = 0;
        uint64_t completed = 0;
        uint64_t failed = 0;
        uint64_t inlineRuns = 0;
        uint64_t helpedRuns = 0; ///< queued jobs executed by a waiting caller
    };

    explicit OperationSerializer(boost::asio::any_io_executor executor);
    ~OperationSerializer();

    OperationSerializer(const OperationSerializer&) = delete;
    OperationSerializer& operator=(const OperationSerializer&) = delete;

    template <typename F>
    std::future<std::invoke_result_t<std::decay_t<F>&>> submit(const std::string& projectId, F&& op) {
        using R = std::invoke_result_t<std::decay_t<F>&>;
        static_assert(is_result_v<R>, "serialized operations must return Result<T>");

        auto promise = std::make_shared<std::promise<R>>();
        auto future = promise->get_future();

        if (auto valid = validate(projectId); !valid) {
            promise->set_value(R{valid.error()});
            return future;
        }

        submitted_.fetch_add(1, std::memory_order_relaxed);

        auto fn = std::make_shared<std::decay_t<F>>(std::forward<F>(op));
        if (isHeldByCurrentThread(projectId)) {
            inlineRuns_.fetch_add(1, std::memory_order_relaxed);
            deliver(*promise, *fn);
            return future;
        }

        enqueueJob(projectId, [this, promise, fn]() { deliver(*promise, *fn); });
        return future;
    }

    // Blocks until the operation has run on this thread; rethrows what it threw.
    template <typename F>
    std::invoke_result_t<std::decay_t<F>&> run(const std::string& projectId, F&& op) {
        using R = std::invoke_result_t<std::decay_t<F>&>;
        static_assert(is_result_v<R>, "serialized operations must return Result<T>");

        if (auto valid = validate(projectId); !valid) {
            return R{valid.error()};
        }

        submitted_.fetch_add(1, std::memory_order_relaxed);

        if (isHeldByCurrentThread(projectId)) {
            inlineRuns_.fetch_add(1, std::memory_order_relaxed);
            return invokeCounted(op);
        }

        Turn turn(*this, projectId);
        return invokeCounted(op);
    }

    // Number of projects with queued or running operations.
    [[nodiscard]] std::size_t activeProjects() const;
    [[nodiscard]] std::size_t pending(const std::string& projectId) const;
    [[nodiscard]] static bool isHeldByCurrentThread(const std::string& projectId);
    [[nodiscard]] Stats getStats() const noexcept;

private:
    struct Ticket {
        std::function<void()> job; ///< empty for a caller waiting in run()
        bool started = false;
    };

    struct Lane {
        std::deque<std::shared_ptr<Ticket>> queue;
    };

    // Marks a project as held by the current thread for the lifetime of the scope.
    class HeldScope {
    public:
        explicit HeldScope(const std::string& projectId);
        ~HeldScope();
        HeldScope(const HeldScope&) = delete;
        HeldScope& operator=(const HeldScope&) = delete;

    private:
        std::string projectId_;
    };

    // Owns the front of a project's lane on the calling thread.
    class Turn {
    public:
        Turn(OperationSerializer& owner, const std::string& projectId);
        ~Turn();
        Turn(const Turn&) = delete;
        Turn& operator=(const Turn&) = delete;

    private:
        OperationSerializer& owner_;
        const std::string& projectId_;
        std::optional<HeldScope> held_;
    };

    template <typename Fn> auto invokeCounted(Fn& fn) {
        try {
            auto result = fn();
            if (result) {
                completed_.fetch_add(1, std::memory_order_relaxed);
            } else {
                failed_.fetch_add(1, std::memory_order_relaxed);
            }
            return result;
        } catch (...) {
            failed_.fetch_add(1, std::memory_order_relaxed);
            throw;
        }
    }

    template <typename R, typename Fn> void deliver(std::promise<R>& promise, Fn& fn) {
        try {
            promise.set_value(invokeCounted(fn));
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }

    static Result<void> validate(std::string_view projectId);
    static std::unordered_set<std::string>& heldProjects();

    void enqueueJob(const std::string& projectId, std::function<void()> job);
    void waitForTurn(const std::string& projectId);
    void runJob(const std::string& projectId, const std::shared_ptr<Ticket>& ticket);
    void finishLocked(std::unique_lock<std::mutex>& lock, const std::string& projectId);
    void dispatchFrontLocked(const std::string& projectId, Lane& lane);

    boost::asio::any_io_executor executor_;
    mutable std::mutex mutex_;
    std::condition_variable turnChanged_;
    std::unordered_map<std::string, Lane> lanes_;

    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> inlineRuns_{0};
    std::atomic<uint64_t> helpedRuns_{0};
};

} // namespace canopy::concurrency
