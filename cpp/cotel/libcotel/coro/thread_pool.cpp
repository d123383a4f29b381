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

#include "cotel/coro/thread_pool.hpp"

#include "cotel/core/thread.hpp"

#include <glog/logging.h>

#include <cstddef>
#include <sstream>
#include <stdexcept>

namespace cotel::coro {

thread_local ThreadPool* ThreadPool::m_self{nullptr};
thread_local std::size_t ThreadPool::m_thread_id{0};

ThreadPool::Operation::Operation(ThreadPool& tp) noexcept : m_thread_pool(tp) {}

auto ThreadPool::Operation::await_suspend(std::coroutine_handle<> awaiting_coroutine) noexcept -> void
{
    DVLOG(10) << "suspend scheduling operation on " << cotel::this_thread::get_id();

    // capture the coroutine handle and schedule it to be resumed
    m_awaiting_coroutine = awaiting_coroutine;
    m_thread_pool.schedule_impl(m_awaiting_coroutine);

    // void return on await_suspend suspends the _this_ coroutine, which is now scheduled on the
    // thread pool and returns control to the caller.
}

ThreadPool::TimedOperation::TimedOperation(ThreadPool& tp, clock_type::time_point deadline) noexcept :
  m_thread_pool(tp),
  m_deadline(deadline)
{}

auto ThreadPool::TimedOperation::await_suspend(std::coroutine_handle<> awaiting_coroutine) noexcept -> void
{
    m_thread_pool.schedule_at_impl(m_deadline, awaiting_coroutine);
}

ThreadPool::ThreadPool() : ThreadPool(Options{}) {}

ThreadPool::ThreadPool(Options opts) : m_opts(std::move(opts))
{
    if (m_opts.description.empty())
    {
        std::stringstream ss;
        ss << "thread_pool_" << this;
        m_opts.description = ss.str();
    }

    m_threads.reserve(m_opts.thread_count);

    for (uint32_t i = 0; i < m_opts.thread_count; ++i)
    {
        m_threads.emplace_back([this, i](std::stop_token st) {
            executor(std::move(st), i);
        });
    }

    m_timer_thread = std::jthread([this](std::stop_token st) {
        timer(std::move(st));
    });
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

auto ThreadPool::schedule() -> Operation
{
    if (!m_shutdown_requested.load(std::memory_order::relaxed))
    {
        m_size.fetch_add(1, std::memory_order::release);
        return Operation{*this};
    }

    throw std::runtime_error("coro::ThreadPool is shutting down, unable to schedule new tasks.");
}

auto ThreadPool::schedule_after(clock_type::duration delay) -> TimedOperation
{
    if (!m_shutdown_requested.load(std::memory_order::relaxed))
    {
        return TimedOperation{*this, clock_type::now() + delay};
    }

    throw std::runtime_error("coro::ThreadPool is shutting down, unable to schedule new tasks.");
}

auto ThreadPool::resume(std::coroutine_handle<> handle) noexcept -> void
{
    if (handle == nullptr)
    {
        return;
    }

    m_size.fetch_add(1, std::memory_order::release);
    schedule_impl(handle);
}

auto ThreadPool::shutdown() noexcept -> void
{
    // Only allow shutdown to occur once.
    if (!m_shutdown_requested.exchange(true, std::memory_order::acq_rel))
    {
        m_timer_thread.request_stop();
        if (m_timer_thread.joinable())
        {
            m_timer_thread.join();
        }

        {
            std::scoped_lock lk{m_timer_mutex};
            if (!m_timers.empty())
            {
                LOG(WARNING) << description() << ": abandoning " << m_timers.size()
                             << " timed suspensions on shutdown";
            }
        }

        for (auto& thread : m_threads)
        {
            thread.request_stop();
        }

        for (auto& thread : m_threads)
        {
            if (thread.joinable())
            {
                thread.join();
            }
        }
    }
}

auto ThreadPool::executor(std::stop_token stop_token, std::size_t idx) -> void
{
    m_self      = this;
    m_thread_id = idx;

    while (!stop_token.stop_requested())
    {
        // Wait until the queue has operations to execute or shutdown has been requested.
        while (true)
        {
            std::unique_lock<std::mutex> lk{m_wait_mutex};
            m_wait_cv.wait(lk, stop_token, [this] {
                return !m_queue.empty();
            });
            if (m_queue.empty())
            {
                lk.unlock();  // would happen on scope destruction, but being explicit/faster(?)
                break;
            }

            auto handle = m_queue.front();
            m_queue.pop_front();

            lk.unlock();  // Not needed for processing the coroutine.

            handle.resume();
            m_size.fetch_sub(1, std::memory_order::release);
        }
    }
}

auto ThreadPool::timer(std::stop_token stop_token) -> void
{
    std::unique_lock<std::mutex> lk{m_timer_mutex};

    while (!stop_token.stop_requested())
    {
        if (m_timers.empty())
        {
            m_timer_cv.wait(lk, stop_token, [this] {
                return !m_timers.empty();
            });
            continue;
        }

        const auto deadline = m_timers.top().deadline;
        if (clock_type::now() < deadline)
        {
            // wake early if an earlier deadline is pushed
            m_timer_cv.wait_until(lk, stop_token, deadline, [this, deadline] {
                return m_timers.top().deadline < deadline;
            });
            continue;
        }

        auto handle = m_timers.top().handle;
        m_timers.pop();

        lk.unlock();
        resume(handle);
        lk.lock();
    }
}

auto ThreadPool::schedule_impl(std::coroutine_handle<> handle) noexcept -> void
{
    if (handle == nullptr)
    {
        return;
    }

    {
        std::scoped_lock lk{m_wait_mutex};
        m_queue.emplace_back(handle);
    }

    m_wait_cv.notify_one();
}

auto ThreadPool::schedule_at_impl(clock_type::time_point deadline, std::coroutine_handle<> handle) noexcept -> void
{
    {
        std::scoped_lock lk{m_timer_mutex};
        m_timers.push(Timer{deadline, m_timer_sequence++, handle});
    }

    m_timer_cv.notify_one();
}

auto ThreadPool::from_current_thread() -> ThreadPool*
{
    return m_self;
}

auto ThreadPool::get_thread_id() -> std::size_t
{
    return m_thread_id;
}

const std::string& ThreadPool::description() const
{
    return m_opts.description;
}

}  // namespace cotel::coro
