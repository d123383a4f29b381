/**
 * Original Source: https://github.com/jbaldwin/libcoro
 * Original License: Apache License, Version 2.0; included below
 */

/**
 * Copyright 2021 Josh Baldwin
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include "cotel/coro/task.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <cstdint>
#include <deque>
#include <mutex>
#include <queue>
#include <stop_token>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

namespace cotel::coro {
/**
 * Creates a thread pool that executes arbitrary coroutine tasks in a FIFO scheduler policy.
 * The thread pool by default will create an execution thread per available core on the system.
 *
 * Coroutines can also be suspended for a duration with schedule_after(); a single timer thread per pool moves
 * them onto the FIFO queue when their deadline expires.
 *
 * When shutting down, either by the thread pool destructing or by manually calling shutdown()
 * the thread pool will stop accepting new tasks but will complete all tasks that were queued
 * prior to the shutdown request. Timed suspensions that have not expired are abandoned.
 */
class ThreadPool final
{
  public:
    using clock_type = std::chrono::steady_clock;

    class Operation
    {
      public:
        explicit Operation(ThreadPool& tp) noexcept;

        /**
         * Operations always pause so the executing thread can be switched.
         */
        static constexpr auto await_ready() noexcept -> bool
        {
            return false;
        }

        /**
         * Suspending always returns to the caller (using void return of await_suspend()) and
         * stores the coroutine internally for the executing thread to resume from.
         */
        auto await_suspend(std::coroutine_handle<> awaiting_coroutine) noexcept -> void;

        /**
         * no-op as this is the function called first by the thread pool's executing thread.
         */
        auto await_resume() noexcept -> void {}

      private:
        /// The thread pool that this operation will execute on.
        ThreadPool& m_thread_pool;
        /// The coroutine awaiting execution.
        std::coroutine_handle<> m_awaiting_coroutine{nullptr};
    };

    class TimedOperation
    {
      public:
        TimedOperation(ThreadPool& tp, clock_type::time_point deadline) noexcept;

        static constexpr auto await_ready() noexcept -> bool
        {
            return false;
        }

        auto await_suspend(std::coroutine_handle<> awaiting_coroutine) noexcept -> void;

        auto await_resume() noexcept -> void {}

      private:
        ThreadPool& m_thread_pool;
        clock_type::time_point m_deadline;
    };

    struct Options
    {
        /// The number of executor threads for this thread pool.  Uses the hardware concurrency
        /// value by default.
        uint32_t thread_count = std::thread::hardware_concurrency();
        /// Description
        std::string description;
    };

    ThreadPool();

    /**
     * @param opts Thread pool configuration options.
     */
    explicit ThreadPool(Options opts);

    ThreadPool(const ThreadPool&)                    = delete;
    ThreadPool(ThreadPool&&)                         = delete;
    auto operator=(const ThreadPool&) -> ThreadPool& = delete;
    auto operator=(ThreadPool&&) -> ThreadPool&      = delete;

    ~ThreadPool();

    /**
     * @return The number of executor threads for processing tasks.
     */
    auto thread_count() const noexcept -> uint32_t
    {
        return m_threads.size();
    }

    /**
     * Schedules the currently executing coroutine to be run on this thread pool.  This must be
     * called from within the coroutines function body to schedule the coroutine on the thread pool.
     * @throw std::runtime_error If the thread pool is `shutdown()` scheduling new tasks is not permitted.
     * @return The operation to switch from the calling scheduling thread to the executor thread
     *         pool thread.
     */
    [[nodiscard]] auto schedule() -> Operation;

    /**
     * Suspends the currently executing coroutine for at least `delay`, then resumes it on this thread pool.
     * @throw std::runtime_error If the thread pool is `shutdown()` scheduling new tasks is not permitted.
     */
    [[nodiscard]] auto schedule_after(clock_type::duration delay) -> TimedOperation;

    /**
     * Schedules any coroutine handle that is ready to be resumed.
     * @param handle The coroutine handle to schedule.
     */
    auto resume(std::coroutine_handle<> handle) noexcept -> void;

    /**
     * Immediately yields the current task and places it at the end of the queue of tasks waiting
     * to be processed.  This will immediately be picked up again once it naturally goes through the
     * FIFO task queue.  This function is useful to yielding long processing tasks to let other tasks
     * get processing time.
     */
    [[nodiscard]] auto yield() -> Operation
    {
        return schedule();
    }

    /**
     * Shutsdown the thread pool.  This will finish any tasks queued prior to calling this
     * function but will prevent the thread pool from scheduling any new tasks.  This call is
     * blocking and will wait until all queued tasks are completed before returning.
     */
    auto shutdown() noexcept -> void;

    /**
     * @return The number of tasks waiting in the task queue + the executing tasks.
     */
    auto size() const noexcept -> std::size_t
    {
        return m_size.load(std::memory_order::acquire);
    }

    /**
     * @return True if the task queue is empty and zero tasks are currently executing.
     */
    auto empty() const noexcept -> bool
    {
        return size() == 0;
    }

    /**
     * @return std::string description of the thread pool
     */
    const std::string& description() const;

    /**
     * @return the thread pool running the calling thread, nullptr if the calling thread is not a pool thread
     */
    static auto from_current_thread() -> ThreadPool*;

    /**
     * @return the index of the calling thread within its pool
     */
    static auto get_thread_id() -> std::size_t;

  private:
    struct Timer
    {
        clock_type::time_point deadline;
        std::uint64_t sequence;
        std::coroutine_handle<> handle;

        bool operator>(const Timer& other) const
        {
            return std::tie(deadline, sequence) > std::tie(other.deadline, other.sequence);
        }
    };

    /// The configuration options.
    Options m_opts;
    /// The background executor threads.
    std::vector<std::jthread> m_threads;

    /// Mutex for executor threads to sleep on the condition variable.
    std::mutex m_wait_mutex;
    /// Condition variable for each executor thread to wait on when no tasks are available.
    std::condition_variable_any m_wait_cv;
    /// FIFO queue of tasks waiting to be executed.
    std::deque<std::coroutine_handle<>> m_queue;

    /// Pending timed suspensions ordered by deadline.
    std::mutex m_timer_mutex;
    std::condition_variable_any m_timer_cv;
    std::priority_queue<Timer, std::vector<Timer>, std::greater<>> m_timers;
    std::uint64_t m_timer_sequence{0};
    std::jthread m_timer_thread;

    /**
     * Each background thread runs from this function.
     * @param stop_token Token which signals when shutdown() has been called.
     * @param idx The executor's idx for internal data structure accesses.
     */
    auto executor(std::stop_token stop_token, std::size_t idx) -> void;

    auto timer(std::stop_token stop_token) -> void;

    auto schedule_impl(std::coroutine_handle<> handle) noexcept -> void;

    auto schedule_at_impl(clock_type::time_point deadline, std::coroutine_handle<> handle) noexcept -> void;

    /// The number of tasks in the queue + currently executing.
    std::atomic<std::size_t> m_size{0};

    /// Has the thread pool been requested to shut down?
    std::atomic<bool> m_shutdown_requested{false};

    static thread_local ThreadPool* m_self;
    static thread_local std::size_t m_thread_id;
};

}  // namespace cotel::coro
