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

#include <concepts>
#include <coroutine>
#include <type_traits>
#include <utility>

namespace cotel::coro::concepts {
/**
 * This concept declares a type that is required to meet the c++20 coroutine operator co_await()
 * retun type.  It requires the following three member functions:
 *      await_ready() -> bool
 *      await_suspend(std::coroutine_handle<>) -> void|bool|std::coroutine_handle<>
 *      await_resume() -> decltype(auto)
 *          Where the return type on await_resume is the requested return of the awaitable.
 */
// clang-format off
template<typename T>
concept awaiter = requires(T t, std::coroutine_handle<> c)
{
    { t.await_ready() } -> std::convertible_to<bool>;
    requires std::same_as<decltype(t.await_suspend(c)), void> ||
        std::same_as<decltype(t.await_suspend(c)), bool> ||
        std::same_as<decltype(t.await_suspend(c)), std::coroutine_handle<>>;
    { t.await_resume() };
};

/**
 * This concept declares a type that can be operator co_await()'ed and returns an awaiter_type.
 */
template<typename T>
concept awaitable = requires(T t)
{
    // operator co_await()
    { std::forward<T>(t).operator co_await() } -> awaiter;
};

template<typename T>
concept awaitable_or_awaiter = awaitable<T> || awaiter<T>;

/**
 * Returns the awaiter for either an awaitable (via its member operator co_await) or an awaiter (a moved copy).
 */
template<awaitable_or_awaiter AwaitableT>
static auto get_awaiter(AwaitableT&& value)
{
    if constexpr (awaitable<AwaitableT>)
    {
        return std::forward<AwaitableT>(value).operator co_await();
    }
    else
    {
        return std::decay_t<AwaitableT>(std::forward<AwaitableT>(value));
    }
}

template<awaitable_or_awaiter AwaitableT>
struct awaitable_traits
{
    using awaiter_type        = decltype(get_awaiter(std::declval<AwaitableT>()));
    using awaiter_return_type = decltype(std::declval<awaiter_type>().await_resume());
};
// clang-format on

}  // namespace cotel::coro::concepts
