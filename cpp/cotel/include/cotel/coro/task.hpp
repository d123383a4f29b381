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
#include "cotel/coro/thread_local_state.hpp"

#include <coroutine>
#include <exception>
#include <type_traits>
#include <utility>

namespace cotel::coro {

template <typename ReturnT = void>
class Task;

namespace detail {

/**
 * @brief Wraps every awaiter a Task co_awaits so the task's thread local state is removed from the thread before the
 * task suspends and installed again on whichever thread resumes it.
 */
template <typename AwaiterT>
struct ContextAwaiter
{
    auto await_ready() -> bool
    {
        return m_awaiter.await_ready();
    }

    template <typename PromiseT>
    auto await_suspend(std::coroutine_handle<PromiseT> awaiting_coroutine)
        -> decltype(std::declval<AwaiterT&>().await_suspend(awaiting_coroutine))
    {
        // once the inner awaiter has been handed the coroutine it may be resumed on another thread at any time
        m_state.suspend_coro_thread_local_state();
        return m_awaiter.await_suspend(awaiting_coroutine);
    }

    auto await_resume() -> decltype(auto)
    {
        m_state.resume_coro_thread_local_state();
        return m_awaiter.await_resume();
    }

    AwaiterT m_awaiter;
    ThreadLocalState& m_state;
};

struct PromiseBase
{
    friend struct FinalAwaitable;

    struct InitialAwaitable
    {
        constexpr static bool await_ready() noexcept
        {
            return false;
        }

        void await_suspend(std::coroutine_handle<> handle) noexcept
        {
            m_state.create_coro_thread_local_state();
        }

        void await_resume() const noexcept
        {
            m_state.resume_coro_thread_local_state();
        }

        ThreadLocalState& m_state;
    };

    struct FinalAwaitable
    {
        constexpr static auto await_ready() noexcept -> bool
        {
            return false;
        }

        template <typename PromiseT>
        auto await_suspend(std::coroutine_handle<PromiseT> coroutine) noexcept -> std::coroutine_handle<>
        {
            auto& promise = coroutine.promise();
            promise.m_thread_local_state.suspend_coro_thread_local_state();

            // If there is a continuation call it, otherwise this is the end of the line.
            if (promise.m_continuation != nullptr)
            {
                return promise.m_continuation;
            }

            return std::noop_coroutine();
        }

        // on the final awaitable, we do not resume the captured thread local state
        constexpr static auto await_resume() noexcept -> void {}
    };

    PromiseBase() noexcept = default;
    ~PromiseBase()         = default;

    auto initial_suspend() noexcept -> InitialAwaitable
    {
        return {m_thread_local_state};
    }

    static auto final_suspend() noexcept(true) -> FinalAwaitable
    {
        return {};
    }

    template <concepts::awaitable_or_awaiter AwaitableT>
    auto await_transform(AwaitableT&& awaitable)
    {
        using awaiter_type = typename concepts::awaitable_traits<AwaitableT>::awaiter_type;
        return ContextAwaiter<awaiter_type>{concepts::get_awaiter(std::forward<AwaitableT>(awaitable)),
                                            m_thread_local_state};
    }

    auto unhandled_exception() -> void
    {
        m_exception_ptr = std::current_exception();
    }

    auto continuation(std::coroutine_handle<> continuation) noexcept -> void
    {
        m_continuation = continuation;
    }

    auto thread_local_state() noexcept -> ThreadLocalState&
    {
        return m_thread_local_state;
    }

  protected:
    std::coroutine_handle<> m_continuation{nullptr};
    std::exception_ptr m_exception_ptr{};
    ThreadLocalState m_thread_local_state;
};

template <typename ReturnT>
struct Promise final : public PromiseBase
{
    using task_type      = Task<ReturnT>;
    using coroutine_type = std::coroutine_handle<Promise<ReturnT>>;

    Promise() noexcept = default;
    ~Promise()         = default;

    auto get_return_object() noexcept -> task_type;

    auto return_value(ReturnT value) -> void
    {
        m_return_value = std::move(value);
    }

    auto result() const& -> const ReturnT&
    {
        if (m_exception_ptr)
        {
            std::rethrow_exception(m_exception_ptr);
        }

        return m_return_value;
    }

    auto result() && -> ReturnT&&
    {
        if (m_exception_ptr)
        {
            std::rethrow_exception(m_exception_ptr);
        }

        return std::move(m_return_value);
    }

  private:
    ReturnT m_return_value;
};

template <>
struct Promise<void> : public PromiseBase
{
    using task_type      = Task<void>;
    using coroutine_type = std::coroutine_handle<Promise<void>>;

    Promise() noexcept = default;
    ~Promise()         = default;

    auto get_return_object() noexcept -> task_type;

    auto return_void() noexcept -> void {}

    auto result() -> void
    {
        if (m_exception_ptr)
        {
            std::rethrow_exception(m_exception_ptr);
        }
    }
};

}  // namespace detail

/**
 * @brief Lazily started coroutine task.
 *
 * The task captures the trace context that is current where it is created and carries its own context stack across
 * every suspension point. Destroying a task that has started but not completed cancels it: the frame is destroyed
 * with its own context installed and this_task::is_cancelling() set, so scoped spans in the frame close as cancelled.
 * A task must not be destroyed while it is queued for resumption on an executor.
 */
template <typename ReturnT>
class [[nodiscard]] Task
{
  public:
    using task_type      = Task<ReturnT>;
    using promise_type   = detail::Promise<ReturnT>;
    using coroutine_type = std::coroutine_handle<promise_type>;

    struct AwaitableBase
    {
        AwaitableBase(coroutine_type coroutine) noexcept : m_coroutine(coroutine) {}

        auto await_ready() const noexcept -> bool
        {
            return !m_coroutine || m_coroutine.done();
        }

        auto await_suspend(std::coroutine_handle<> awaiting_coroutine) noexcept -> std::coroutine_handle<>
        {
            m_coroutine.promise().continuation(awaiting_coroutine);
            return m_coroutine;
        }

        std::coroutine_handle<promise_type> m_coroutine{nullptr};
    };

    Task() noexcept : m_coroutine(nullptr) {}

    explicit Task(coroutine_type handle) : m_coroutine(handle) {}
    Task(const Task&) = delete;
    Task(Task&& other) noexcept : m_coroutine(std::exchange(other.m_coroutine, nullptr)) {}

    ~Task()
    {
        destroy();
    }

    auto operator=(const Task&) -> Task& = delete;

    auto operator=(Task&& other) noexcept -> Task&
    {
        if (std::addressof(other) != this)
        {
            destroy();
            m_coroutine = std::exchange(other.m_coroutine, nullptr);
        }

        return *this;
    }

    /**
     * @return True if the Task is in its final suspend or if the Task has been destroyed.
     */
    auto is_ready() const noexcept -> bool
    {
        return m_coroutine == nullptr || m_coroutine.done();
    }

    auto resume() -> bool
    {
        if (!m_coroutine.done())
        {
            m_coroutine.resume();
        }
        return !m_coroutine.done();
    }

    auto destroy() -> bool
    {
        if (m_coroutine != nullptr)
        {
            if (m_coroutine.done())
            {
                m_coroutine.destroy();
            }
            else
            {
                m_coroutine.promise().thread_local_state().cancel_coroutine(m_coroutine);
            }
            m_coroutine = nullptr;
            return true;
        }

        return false;
    }

    auto operator co_await() const& noexcept
    {
        struct Awaitable : public AwaitableBase
        {
            auto await_resume() -> decltype(auto)
            {
                if constexpr (std::is_same_v<void, ReturnT>)
                {
                    // Propagate uncaught exceptions.
                    this->m_coroutine.promise().result();
                    return;
                }
                else
                {
                    return this->m_coroutine.promise().result();
                }
            }
        };

        return Awaitable{m_coroutine};
    }

    auto operator co_await() const&& noexcept
    {
        struct Awaitable : public AwaitableBase
        {
            auto await_resume() -> decltype(auto)
            {
                if constexpr (std::is_same_v<void, ReturnT>)
                {
                    // Propagate uncaught exceptions.
                    this->m_coroutine.promise().result();
                    return;
                }
                else
                {
                    return std::move(this->m_coroutine.promise()).result();
                }
            }
        };

        return Awaitable{m_coroutine};
    }

    auto promise() & -> promise_type&
    {
        return m_coroutine.promise();
    }

    auto promise() const& -> const promise_type&
    {
        return m_coroutine.promise();
    }
    auto promise() && -> promise_type&&
    {
        return std::move(m_coroutine.promise());
    }

    auto handle() -> coroutine_type
    {
        return m_coroutine;
    }

  private:
    coroutine_type m_coroutine{nullptr};
};

namespace detail {
template <typename ReturnT>
inline auto Promise<ReturnT>::get_return_object() noexcept -> Task<ReturnT>
{
    return Task<ReturnT>{coroutine_type::from_promise(*this)};
}

inline auto Promise<void>::get_return_object() noexcept -> Task<>
{
    return Task<>{coroutine_type::from_promise(*this)};
}

}  // namespace detail

}  // namespace cotel::coro
