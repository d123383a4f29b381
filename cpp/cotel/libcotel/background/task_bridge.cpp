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

#include "cotel/background/task_bridge.hpp"

#include <glog/logging.h>

#include <exception>

namespace cotel::background {

TaskBridge::TaskBridge() : TaskBridge(Options{}) {}

TaskBridge::TaskBridge(Options options) :
  m_pool(coro::ThreadPool::Options{.thread_count = options.thread_count, .description = std::move(options.description)})
{}

TaskBridge::~TaskBridge()
{
    drain();
    m_pool.shutdown();

    VLOG(1) << m_pool.description() << ": completed " << m_completed.load() << " jobs, " << m_failed.load()
            << " failed";
}

void TaskBridge::enqueue_callable(trace::DetachedHandle handle, std::function<void()> job)
{
    job_started();
    run_callable(*this, std::move(handle), std::move(job));
}

void TaskBridge::enqueue_coroutine(trace::DetachedHandle handle, std::function<coro::Task<void>()> job)
{
    job_started();
    run_coroutine(*this, std::move(handle), std::move(job));
}

coro::DetachedTask TaskBridge::run_callable(TaskBridge& self,
                                            trace::DetachedHandle handle,
                                            std::function<void()> job)
{
    bool failed = false;
    try
    {
        co_await self.m_pool.schedule();
        trace::with_context(handle.context, job);
    } catch (const std::exception& e)
    {
        failed = true;
        LOG(ERROR) << "background job failed: " << e.what();
    } catch (...)
    {
        failed = true;
        LOG(ERROR) << "background job failed with an unknown exception";
    }

    self.job_finished(failed);
}

coro::DetachedTask TaskBridge::run_coroutine(TaskBridge& self,
                                             trace::DetachedHandle handle,
                                             std::function<coro::Task<void>()> job)
{
    bool failed = false;
    try
    {
        co_await self.m_pool.schedule();
        auto task = trace::with_context(handle.context, job);
        co_await task;
    } catch (const std::exception& e)
    {
        failed = true;
        LOG(ERROR) << "background coroutine failed: " << e.what();
    } catch (...)
    {
        failed = true;
        LOG(ERROR) << "background coroutine failed with an unknown exception";
    }

    self.job_finished(failed);
}

void TaskBridge::drain()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idle_cv.wait(lock, [this] {
        return m_in_flight == 0;
    });
}

std::size_t TaskBridge::in_flight() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_in_flight;
}

TaskBridge::Stats TaskBridge::stats() const
{
    return Stats{.enqueued  = m_enqueued.load(std::memory_order::relaxed),
                 .completed = m_completed.load(std::memory_order::relaxed),
                 .failed    = m_failed.load(std::memory_order::relaxed)};
}

void TaskBridge::job_started()
{
    m_enqueued.fetch_add(1, std::memory_order::relaxed);

    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_in_flight;
}

void TaskBridge::job_finished(bool failed)
{
    m_completed.fetch_add(1, std::memory_order::relaxed);
    if (failed)
    {
        m_failed.fetch_add(1, std::memory_order::relaxed);
    }

    // notify under the lock, drain() may return and the bridge be destroyed as soon as the lock is released
    std::lock_guard<std::mutex> lock(m_mutex);
    --m_in_flight;
    m_idle_cv.notify_all();
}

}  // namespace cotel::background
