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
#include "cotel/trace/context_stack.hpp"

#include <glog/logging.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/nostd/unique_ptr.h>

#include <memory>
#include <utility>

namespace cotel::trace {

/**
 * @brief RuntimeContextStorage that resolves "the current context" against the context stack of the coroutine
 * running on this thread, falling back to a per-thread stack for code that is not running inside a coroutine.
 *
 * The storage is installed as the process-wide OpenTelemetry runtime context storage, so OpenTelemetry API users
 * running inside cotel coroutines observe the same task-local contexts.
 */
class CoroutineRuntimeContextStorage final : public opentelemetry::context::RuntimeContextStorage
{
  public:
    Context GetCurrent() noexcept final
    {
        return active_stack().get_current();
    }

    opentelemetry::nostd::unique_ptr<Token> Attach(const Context& context) noexcept final
    {
        return CreateToken(active_stack().attach(context));
    }

    bool Detach(Token& token) noexcept final
    {
        return active_stack().detach(token);
    }

    // make `stack` the active stack of this thread; returns the previously installed stack (nullptr = thread default)
    static ContextStack* install(ContextStack* stack) noexcept
    {
        return std::exchange(installed_stack(), stack);
    }

    static ContextStack* installed() noexcept
    {
        return installed_stack();
    }

    static bool using_default_context() noexcept
    {
        return installed_stack() == nullptr;
    }

  private:
    static inline ContextStack& active_stack() noexcept
    {
        auto* stack = installed_stack();
        if (stack != nullptr)
        {
            return *stack;
        }
        return default_stack();
    }

    static inline ContextStack& default_stack() noexcept
    {
        static thread_local ContextStack stack;
        return stack;
    }

    static inline ContextStack*& installed_stack() noexcept
    {
        static thread_local ContextStack* stack{nullptr};
        return stack;
    }
};

/**
 * @brief OpenTelemetry only exposes the RuntimeContextStorage through a process-wide setter. This proxy installs the
 * coroutine-aware storage exactly once and gives the coroutine runtime direct access to it for capturing and
 * installing per-task stacks.
 */
class RuntimeContext
{
  public:
    using context_type = opentelemetry::nostd::shared_ptr<opentelemetry::context::RuntimeContextStorage>;
    using storage_type = CoroutineRuntimeContextStorage;
    using stack_type   = std::unique_ptr<ContextStack>;

    // a new coroutine starts from the context that is current where it was created
    static stack_type make_context()
    {
        // the coroutine never pops beyond its first entry, so only the current context is copied
        return std::make_unique<ContextStack>(get_storage().GetCurrent());
    }

    static ContextStack* install(ContextStack* stack) noexcept
    {
        return storage_type::install(stack);
    }

    static ContextStack* installed() noexcept
    {
        return storage_type::installed();
    }

    static storage_type& get_storage()
    {
        static RuntimeContext runtime;
        static storage_type& context = *static_cast<storage_type*>(internal_init().get());
        return context;
    }

    static bool init()
    {
        get_storage();
        return true;
    }

    static bool using_default_context()
    {
        return storage_type::using_default_context();
    }

  private:
    RuntimeContext()
    {
        opentelemetry::context::RuntimeContext::SetRuntimeContextStorage(internal_init());
        VLOG(1) << "installed coroutine runtime context storage";
    }

    inline static context_type& internal_init()
    {
        static context_type context(new CoroutineRuntimeContextStorage);
        return context;
    }
};

}  // namespace cotel::trace
