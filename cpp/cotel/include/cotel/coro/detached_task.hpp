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

#include "cotel/coro/concepts/awaitable.hpp"
#include "cotel/coro/task.hpp"
#include "cotel/coro/thread_local_state.hpp"

#include <glog/logging.h>

#include <coroutine>
#include <exception>
#include <utility>

namespace cotel::coro {

class DetachedTask;

namespace detail {

struct DetachedPromise
{
    // eagerly started; the context stack is captured where the coroutine is called
    struct InitialAwaitable
    {
        auto await_ready() noexcept -> bool
        {
            m_state.create_coro_thread_local_state();
            return true;
        }

        constexpr static auto await_suspend(std::coroutine_handle<> /*unused*/) noexcept -> void {}

        auto await_resume() noexcept -> void
        {
            m_state.resume_coro_thread_local_state();
        }

        ThreadLocalState& m_state;
    };

    // the frame destroys itself after restoring the thread's previous context
    struct FinalAwaitable
    {
        auto await_ready() noexcept -> bool
        {
            m_state.suspend_coro_thread_local_state();
            return true;
        }

        constexpr static auto await_suspend(std::coroutine_handle<> /*unused*/) noexcept -> void {}

        constexpr static auto await_resume() noexcept -> void {}

        ThreadLocalState& m_state;
    };

    auto get_return_object() noexcept -> DetachedTask;

    auto initial_suspend() noexcept -> InitialAwaitable
    {
        return {m_thread_local_state};
    }

    auto final_suspend() noexcept -> FinalAwaitable
    {
        return {m_thread_local_state};
    }

    template <concepts::awaitable_or_awaiter AwaitableT>
    auto await_transform(AwaitableT&& awaitable)
    {
        using awaiter_type = typename concepts::awaitable_traits<AwaitableT>::awaiter_type;
        return ContextAwaiter<awaiter_type>{concepts::get_awaiter(std::forward<AwaitableT>(awaitable)),
                                            m_thread_local_state};
    }

    constexpr static auto return_void() noexcept -> void {}

    // a detached coroutine has nobody to report to; it must handle its own errors
    auto unhandled_exception() noexcept -> void
    {
        try
        {
            std::rethrow_exception(std::current_exception());
        } catch (const std::exception& e)
        {
            LOG(FATAL) << "unhandled exception in detached coroutine: " << e.what();
        }
        catch (...)
        {
            LOG(FATAL) << "unhandled unknown exception in detached coroutine";
        }
    }

    ThreadLocalState m_thread_local_state;
};

}  // namespace detail

/**
 * @brief Fire-and-forget coroutine. Starts executing immediately when called and destroys its own frame when it
 * completes. Like Task, it carries its own trace context across suspension points.
 */
class DetachedTask
{
  public:
    using promise_type = detail::DetachedPromise;
};

namespace detail {

inline auto DetachedPromise::get_return_object() noexcept -> DetachedTask
{
    return {};
}

}  // namespace detail

}  // namespace cotel::coro
