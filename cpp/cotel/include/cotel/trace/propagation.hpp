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
#include "cotel/trace/span_context.hpp"

#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/nostd/unique_ptr.h>

#include <optional>
#include <utility>

namespace cotel::trace {

/**
 * @brief Span context of the calling task, or nullopt when no span is current.
 *
 * Inside a coro::Task this is the context of that task only; it is unaffected by other tasks interleaved on the
 * same thread.
 */
std::optional<SpanContext> current();

/**
 * @brief Makes a span context current until the scope is destroyed.
 *
 * An empty context hides any enclosing span, so code run inside the scope starts new traces. Scopes attach to the
 * context stack of the task that creates them and must be destroyed by the same task.
 */
class Scope final
{
  public:
    explicit Scope(const std::optional<SpanContext>& context);
    ~Scope();

    COTEL_DELETE_COPYABILITY(Scope);
    COTEL_DELETE_MOVEABILITY(Scope);

  private:
    opentelemetry::nostd::unique_ptr<opentelemetry::context::Token> m_token;
};

/**
 * @brief Invokes `fn` with `context` current and restores the previous context on every exit path.
 *
 * When `fn` returns a coro::Task, the task captures `context` when it is created and keeps it for its whole life,
 * independently of where and when it is awaited.
 */
template <typename FunctionT>
decltype(auto) with_context(const std::optional<SpanContext>& context, FunctionT&& fn)
{
    Scope scope(context);
    return std::forward<FunctionT>(fn)();
}

/**
 * @brief Captured span context handed to work scheduled independently of the caller.
 */
struct DetachedHandle
{
    /// nullopt when nothing was current; such work runs as the root of a new trace
    std::optional<SpanContext> context;
};

/**
 * @brief Captures the current span context so decoupled, later-scheduled work can join the caller's trace.
 */
DetachedHandle detach();

}  // namespace cotel::trace
