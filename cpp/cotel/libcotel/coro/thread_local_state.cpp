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

#include "cotel/coro/thread_local_state.hpp"

#include "libcotel/trace/runtime_context.hpp"

#include <glog/logging.h>

#include <exception>
#include <utility>

namespace cotel::coro {

namespace {

thread_local std::size_t t_cancel_depth{0};
thread_local int t_exception_base{0};

}  // namespace

ThreadLocalState::ThreadLocalState()  = default;
ThreadLocalState::~ThreadLocalState() = default;

void ThreadLocalState::create_coro_thread_local_state()
{
    m_context_stack = trace::RuntimeContext::make_context();
}

void ThreadLocalState::suspend_coro_thread_local_state()
{
    if (!m_installed)
    {
        return;
    }

    DCHECK_EQ(trace::RuntimeContext::installed(), m_context_stack.get());
    trace::RuntimeContext::install(m_previous_stack);
    t_exception_base = m_previous_exception_base;
    m_previous_stack = nullptr;
    m_installed      = false;
}

void ThreadLocalState::resume_coro_thread_local_state()
{
    DCHECK(m_context_stack) << "coroutine resumed before its thread local state was created";

    // an awaiter that was ready never suspended, the state is still installed
    if (m_installed)
    {
        return;
    }

    m_previous_stack          = trace::RuntimeContext::install(m_context_stack.get());
    m_previous_exception_base = std::exchange(t_exception_base, std::uncaught_exceptions());
    m_installed               = true;
}

void ThreadLocalState::cancel_coroutine(std::coroutine_handle<> coroutine)
{
    // `this` lives in the promise and is destroyed with the frame, only locals may be touched after destroy()
    auto* previous     = trace::RuntimeContext::install(m_context_stack.get());
    auto previous_base = std::exchange(t_exception_base, std::uncaught_exceptions());

    ++t_cancel_depth;
    coroutine.destroy();
    --t_cancel_depth;

    t_exception_base = previous_base;
    trace::RuntimeContext::install(previous);
}

namespace this_task {

bool is_cancelling() noexcept
{
    return t_cancel_depth > 0;
}

int uncaught_exceptions() noexcept
{
    return std::uncaught_exceptions() - t_exception_base;
}

}  // namespace this_task

}  // namespace cotel::coro
