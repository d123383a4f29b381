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

#include "cotel/trace/context_stack.hpp"

#include <coroutine>
#include <memory>

namespace cotel::coro {

/**
 * @brief Coroutines can yield execution, and other coroutines running on the same thread might modify thread local
 * storage in the meantime, which would have non-deterministic consequences for the resuming coroutine. Since
 * coroutines can also migrate to other threads, each coroutine frame owns its thread local state and installs it on
 * whichever thread resumes it.
 *
 * This class captures the OpenTelemetry context stack of a coroutine frame and the number of exceptions that were in
 * flight on the resuming thread, which is the baseline for this_task::uncaught_exceptions().
 */
class ThreadLocalState
{
  public:
    ThreadLocalState();
    ~ThreadLocalState();

    // use when creating a new coroutine task or initializing a promise_type
    void create_coro_thread_local_state();

    // use when suspending a coroutine
    void suspend_coro_thread_local_state();

    // use when resuming a coroutine
    void resume_coro_thread_local_state();

    // destroys a coroutine that was suspended before completion; frame locals are destroyed with this state installed
    // and with this_task::is_cancelling() returning true
    void cancel_coroutine(std::coroutine_handle<> coroutine);

  private:
    std::unique_ptr<trace::ContextStack> m_context_stack{nullptr};
    trace::ContextStack* m_previous_stack{nullptr};
    int m_previous_exception_base{0};
    bool m_installed{false};
};

namespace this_task {

/**
 * @return true while the calling code runs as part of destroying a coroutine frame that never completed
 */
bool is_cancelling() noexcept;

/**
 * @return the number of exceptions in flight that were thrown since the running coroutine was last resumed; equal to
 * std::uncaught_exceptions() outside of a coroutine
 */
int uncaught_exceptions() noexcept;

}  // namespace this_task

}  // namespace cotel::coro
