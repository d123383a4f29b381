/**
 * SPDX-FileCopyrightText: Copyright (c) 2022, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include "cotel/common/macros.hpp"
#include "cotel/coro/detached_task.hpp"
#include "cotel/coro/task.hpp"
#include "cotel/coro/thread_pool.hpp"
#include "cotel/trace/propagation.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>

namespace cotel::background {

/**
 * @brief Runs jobs on a dedicated thread pool, independently of the code that enqueued them, inside the trace of the
 * detached handle they were enqueued with.
 *
 * A job may run long after the request that enqueued it has returned and its root span has been exported; every span
 * the job opens still joins the original trace. Exceptions thrown by jobs are logged and counted, never propagated.
 */
class TaskBridge final
{
  public:
    struct Options
    {
        std::uint32_t thread_count = 1;
        std::string description    = "background";
    };

    struct Stats
    {
        std::uint64_t enqueued{0};
        std::uint64_t completed{0};
        std::uint64_t failed{0};
    };

    TaskBridge();
    explicit TaskBridge(Options options);

    // drains in-flight jobs, then stops the pool
    ~TaskBridge();

    COTEL_DELETE_COPYABILITY(TaskBridge);
    COTEL_DELETE_MOVEABILITY(TaskBridge);

    /**
     * @brief Schedules `job` and returns immediately.
     *
     * `job` is either a plain callable or a callable returning coro::Task<void>. A coroutine job is created inside the
     * detached context and keeps it across all of its suspension points.
     */
    template <typename JobT>
    void enqueue(trace::DetachedHandle handle, JobT&& job)
    {
        if constexpr (std::is_same_v<std::invoke_result_t<JobT&>, coro::Task<void>>)
        {
            enqueue_coroutine(std::move(handle), std::function<coro::Task<void>()>(std::forward<JobT>(job)));
        }
        else
        {
            enqueue_callable(std::move(handle), std::function<void()>(std::forward<JobT>(job)));
        }
    }

    /**
     * @brief Blocks until every job enqueued so far has completed.
     */
    void drain();

    std::size_t in_flight() const;

    Stats stats() const;

  private:
    void enqueue_callable(trace::DetachedHandle handle, std::function<void()> job);
    void enqueue_coroutine(trace::DetachedHandle handle, std::function<coro::Task<void>()> job);

    static coro::DetachedTask run_callable(TaskBridge& self,
                                           trace::DetachedHandle handle,
                                           std::function<void()> job);
    static coro::DetachedTask run_coroutine(TaskBridge& self,
                                            trace::DetachedHandle handle,
                                            std::function<coro::Task<void>()> job);

    void job_started();
    void job_finished(bool failed);

    coro::ThreadPool m_pool;

    mutable std::mutex m_mutex;
    std::condition_variable m_idle_cv;
    std::size_t m_in_flight{0};

    std::atomic<std::uint64_t> m_enqueued{0};
    std::atomic<std::uint64_t> m_completed{0};
    std::atomic<std::uint64_t> m_failed{0};
};

}  // namespace cotel::background
