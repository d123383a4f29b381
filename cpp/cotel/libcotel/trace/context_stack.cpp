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

#include "cotel/trace/context_stack.hpp"

#include <opentelemetry/context/context.h>

#include <algorithm>

namespace cotel::trace {

ContextStack::ContextStack()
{
    m_stack.emplace_front();
}

ContextStack::ContextStack(Context context)
{
    m_stack.push_front(std::move(context));
}

Context ContextStack::get_current() noexcept
{
    return m_stack.front();
}

const Context& ContextStack::attach(const Context& context) noexcept
{
    m_stack.push_front(context);
    return m_stack.front();
}

bool ContextStack::detach(Token& token) noexcept
{
    // In most cases, the context to be detached is on the top of the stack.
    if (token == m_stack.front())
    {
        // the base entry is never popped
        if (m_stack.size() == 1)
        {
            return false;
        }
        m_stack.pop_front();
        return true;
    }

    // the token may belong to another task's stack, e.g. a frame destroyed from outside of its own execution
    auto found = std::find_if(m_stack.cbegin(), m_stack.cend() - 1, [&token](const Context& context) {
        return token == context;
    });

    if (found == m_stack.cend() - 1)
    {
        return false;
    }

    // pop from front until we get to the token of interest
    while (!(token == m_stack.front()))
    {
        m_stack.pop_front();
    }

    m_stack.pop_front();
    return true;
}

}  // namespace cotel::trace
