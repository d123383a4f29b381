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

#include "cotel/trace/span.hpp"

#include "cotel/coro/thread_local_state.hpp"
#include "libcotel/trace/tracer_state.hpp"

#include <cxxabi.h>
#include <glog/logging.h>

#include <cstdlib>
#include <typeinfo>
#include <utility>

namespace cotel::trace {

namespace {

std::string type_name(const std::type_info& info)
{
    int status      = 0;
    char* demangled = abi::__cxa_demangle(info.name(), nullptr, nullptr, &status);
    if (status != 0 || demangled == nullptr)
    {
        return info.name();
    }

    std::string name(demangled);
    std::free(demangled);  // NOLINT
    return name;
}

}  // namespace

std::string_view to_string(SpanStatus status)
{
    switch (status)
    {
    case SpanStatus::unset:
        return "unset";
    case SpanStatus::ok:
        return "ok";
    case SpanStatus::error:
        return "error";
    }
    return "unknown";
}

Span::Span(std::shared_ptr<detail::TracerState> state,
           SpanContext context,
           std::string name,
           std::string scope_name,
           std::string scope_version,
           Attributes attributes) :
  m_state(std::move(state))
{
    m_data.context         = std::move(context);
    m_data.name            = std::move(name);
    m_data.scope_name      = std::move(scope_name);
    m_data.scope_version   = std::move(scope_version);
    m_data.attributes      = std::move(attributes);
    m_data.resource        = m_state->resource();
    m_data.start_timestamp = std::chrono::system_clock::now();
    m_data.start_time      = std::chrono::steady_clock::now();
}

Span::~Span()
{
    if (!m_ended)
    {
        finish(SpanStatus::unset, {});
    }
}

Span::Span(Span&& other) noexcept :
  m_state(std::move(other.m_state)),
  m_data(std::move(other.m_data)),
  m_ended(std::exchange(other.m_ended, true))
{}

Span& Span::operator=(Span&& other) noexcept
{
    if (this != &other)
    {
        if (!m_ended)
        {
            finish(SpanStatus::unset, {});
        }

        m_state = std::move(other.m_state);
        m_data  = std::move(other.m_data);
        m_ended = std::exchange(other.m_ended, true);
    }
    return *this;
}

std::chrono::steady_clock::duration Span::elapsed() const
{
    if (m_ended)
    {
        return m_data.duration();
    }
    return std::chrono::steady_clock::now() - m_data.start_time;
}

Expected<> Span::set_attribute(std::string key, AttributeValue value)
{
    auto open = ensure_open("set_attribute");
    if (!open)
    {
        return open;
    }

    m_data.attributes[std::move(key)] = std::move(value);
    return {};
}

Expected<> Span::record_error(const std::exception& error)
{
    auto open = ensure_open("record_error");
    if (!open)
    {
        return open;
    }

    m_data.attributes["exception.type"]    = type_name(typeid(error));
    m_data.attributes["exception.message"] = std::string(error.what());
    m_data.status                          = SpanStatus::error;
    m_data.status_description              = error.what();
    return {};
}

Expected<> Span::record_error(std::string_view message)
{
    auto open = ensure_open("record_error");
    if (!open)
    {
        return open;
    }

    m_data.attributes["exception.message"] = std::string(message);
    m_data.status                          = SpanStatus::error;
    m_data.status_description              = message;
    return {};
}

Expected<> Span::end()
{
    return end(SpanStatus::unset);
}

Expected<> Span::end(SpanStatus status, std::string description)
{
    auto open = ensure_open("end");
    if (!open)
    {
        return open;
    }

    finish(status, std::move(description));
    return {};
}

Expected<> Span::ensure_open(std::string_view operation) const
{
    if (!m_ended)
    {
        return {};
    }

    Error error{ErrorCode::usage_error, std::string(operation) + " called on ended span '" + m_data.name + "'"};
    if (m_state)
    {
        m_state->diagnostics().report(error);
    }
    return tl::make_unexpected(std::move(error));
}

void Span::finish(SpanStatus status, std::string description)
{
    m_data.end_time = std::chrono::steady_clock::now();
    m_ended         = true;

    if (status != SpanStatus::unset)
    {
        m_data.status             = status;
        m_data.status_description = std::move(description);
    }
    else if (m_data.status != SpanStatus::error)
    {
        m_data.status = SpanStatus::ok;
    }

    DVLOG(10) << "span '" << m_data.name << "' ended: " << m_data.context << " status=" << to_string(m_data.status);

    m_state->on_end(m_data);
}

ScopedSpan::ScopedSpan(Span span) :
  m_span(std::move(span)),
  m_uncaught_exceptions(coro::this_task::uncaught_exceptions())
{
    m_scope.emplace(m_span.context());
}

ScopedSpan::~ScopedSpan()
{
    if (!m_span.is_ended())
    {
        if (coro::this_task::uncaught_exceptions() > m_uncaught_exceptions)
        {
            m_span.finish(SpanStatus::error, "exception");
        }
        else if (coro::this_task::is_cancelling())
        {
            m_span.m_data.attributes["cancelled"] = true;
            m_span.finish(SpanStatus::error, "cancelled");
        }
        else
        {
            m_span.finish(SpanStatus::unset, {});
        }
    }
}

Expected<> ScopedSpan::end()
{
    return end(SpanStatus::unset);
}

Expected<> ScopedSpan::end(SpanStatus status, std::string description)
{
    auto ended = m_span.end(status, std::move(description));
    if (m_span.is_ended())
    {
        m_scope.reset();
    }
    return ended;
}

}  // namespace cotel::trace
