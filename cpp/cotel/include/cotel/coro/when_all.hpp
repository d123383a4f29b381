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

#include "cotel/coro/detached_task.hpp"
#include "cotel/coro/latch.hpp"
#include "cotel/coro/task.hpp"

#include <concepts>
#include <cstddef>
#include <exception>
#include <vector>

namespace cotel::coro {

namespace detail {

inline auto when_all_run(Task<void>& task, Latch& latch, std::exception_ptr& error) -> DetachedTask
{
    try
    {
        co_await task;
    } catch (...)
    {
        // handed back to the awaiter of when_all
        error = std::current_exception();
    }

    latch.count_down();
}

}  // namespace detail

/**
 * @brief Starts every task and completes when all of them have completed. Each task keeps the trace context it
 * captured when it was created. The first exception, in task order, is rethrown once all tasks are done.
 */
inline auto when_all(std::vector<Task<void>> tasks) -> Task<void>
{
    Latch latch{static_cast<std::ptrdiff_t>(tasks.size())};
    std::vector<std::exception_ptr> errors(tasks.size());

    for (std::size_t i = 0; i < tasks.size(); ++i)
    {
        detail::when_all_run(tasks[i], latch, errors[i]);
    }

    co_await latch;

    for (auto& error : errors)
    {
        if (error)
        {
            std::rethrow_exception(error);
        }
    }
}

template <std::same_as<Task<void>>... TasksT>
auto when_all(TasksT... tasks) -> Task<void>
{
    std::vector<Task<void>> all;
    all.reserve(sizeof...(TasksT));
    (all.push_back(std::move(tasks)), ...);
    return when_all(std::move(all));
}

}  // namespace cotel::coro
