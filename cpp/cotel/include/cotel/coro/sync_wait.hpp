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

#include "cotel/coro/task.hpp"

#include <condition_variable>
#include <coroutine>
#include <exception>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace cotel::coro {

namespace detail {

class SyncWaitEvent
{
  public:
    SyncWaitEvent() = default;

    auto set() noexcept -> void;
    auto wait() noexcept -> void;

  private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_set{false};
};

template <typename ReturnT>
class SyncWaitTask;

class SyncWaitPromiseBase
{
  public:
    static auto initial_suspend() noexcept -> std::suspend_always
    {
        return {};
    }

    auto unhandled_exception() noexcept -> void
    {
        m_exception = std::current_exception();
    }

  protected:
    SyncWaitEvent* m_event{nullptr};
    std::exception_ptr m_exception;
};

template <typename ReturnT>
class SyncWaitPromise final : public SyncWaitPromiseBase
{
  public:
    using coroutine_type = std::coroutine_handle<SyncWaitPromise<ReturnT>>;

    struct FinalAwaitable
    {
        static auto await_ready() noexcept -> bool
        {
            return false;
        }

        static auto await_suspend(coroutine_type coroutine) noexcept -> void
        {
            coroutine.promise().m_event->set();
        }

        static auto await_resume() noexcept -> void {}
    };

    auto get_return_object() noexcept -> SyncWaitTask<ReturnT>;

    static auto final_suspend() noexcept -> FinalAwaitable
    {
        return {};
    }

    auto start(SyncWaitEvent& event) -> void
    {
        m_event = &event;
        coroutine_type::from_promise(*this).resume();
    }

    template <typename ValueT>
    auto return_value(ValueT&& value) -> void
    {
        m_return_value.emplace(std::forward<ValueT>(value));
    }

    auto result() -> ReturnT
    {
        if (m_exception)
        {
            std::rethrow_exception(m_exception);
        }
        return std::move(*m_return_value);
    }

  private:
    std::optional<ReturnT> m_return_value;
};

template <>
class SyncWaitPromise<void> final : public SyncWaitPromiseBase
{
  public:
    using coroutine_type = std::coroutine_handle<SyncWaitPromise<void>>;

    struct FinalAwaitable
    {
        static auto await_ready() noexcept -> bool
        {
            return false;
        }

        static auto await_suspend(coroutine_type coroutine) noexcept -> void
        {
            coroutine.promise().m_event->set();
        }

        static auto await_resume() noexcept -> void {}
    };

    auto get_return_object() noexcept -> SyncWaitTask<void>;

    static auto final_suspend() noexcept -> FinalAwaitable
    {
        return {};
    }

    auto start(SyncWaitEvent& event) -> void
    {
        m_event = &event;
        coroutine_type::from_promise(*this).resume();
    }

    static auto return_void() noexcept -> void {}

    auto result() -> void
    {
        if (m_exception)
        {
            std::rethrow_exception(m_exception);
        }
    }
};

template <typename ReturnT>
class SyncWaitTask
{
  public:
    using promise_type   = SyncWaitPromise<ReturnT>;
    using coroutine_type = std::coroutine_handle<promise_type>;

    explicit SyncWaitTask(coroutine_type coroutine) noexcept : m_coroutine(coroutine) {}

    SyncWaitTask(const SyncWaitTask&) = delete;
    SyncWaitTask(SyncWaitTask&& other) noexcept : m_coroutine(std::exchange(other.m_coroutine, nullptr)) {}
    auto operator=(const SyncWaitTask&) -> SyncWaitTask& = delete;
    auto operator=(SyncWaitTask&&) -> SyncWaitTask&      = delete;

    ~SyncWaitTask()
    {
        if (m_coroutine)
        {
            m_coroutine.destroy();
        }
    }

    auto promise() -> promise_type&
    {
        return m_coroutine.promise();
    }

  private:
    coroutine_type m_coroutine;
};

template <typename ReturnT>
inline auto SyncWaitPromise<ReturnT>::get_return_object() noexcept -> SyncWaitTask<ReturnT>
{
    return SyncWaitTask<ReturnT>{coroutine_type::from_promise(*this)};
}

inline auto SyncWaitPromise<void>::get_return_object() noexcept -> SyncWaitTask<void>
{
    return SyncWaitTask<void>{coroutine_type::from_promise(*this)};
}

template <typename ReturnT>
auto make_sync_wait_task(Task<ReturnT> task) -> SyncWaitTask<ReturnT>
{
    if constexpr (std::is_void_v<ReturnT>)
    {
        co_await task;
        co_return;
    }
    else
    {
        co_return co_await std::move(task);
    }
}

}  // namespace detail

/**
 * @brief Blocks the calling thread until `task` completes, returning its value or rethrowing its exception.
 *
 * The calling thread's trace context is what the task captured when it was created; it is restored on the calling
 * thread when sync_wait returns.
 */
template <typename ReturnT>
auto sync_wait(Task<ReturnT> task) -> ReturnT
{
    detail::SyncWaitEvent event;
    auto wait_task = detail::make_sync_wait_task(std::move(task));
    wait_task.promise().start(event);
    event.wait();

    return wait_task.promise().result();
}

}  // namespace cotel::coro
