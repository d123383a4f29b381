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

#include "cotel/attributes.hpp"
#include "cotel/common/macros.hpp"
#include "cotel/expected.hpp"
#include "cotel/resource.hpp"
#include "cotel/trace/propagation.hpp"
#include "cotel/trace/span_context.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace cotel::trace {

namespace detail {
class TracerState;
}  // namespace detail

enum class SpanStatus
{
    unset,
    ok,
    error,
};

std::string_view to_string(SpanStatus status);

/**
 * @brief Immutable record of a finished span, handed to the exporter.
 */
struct SpanData
{
    SpanContext context;
    std::string name;
    std::string scope_name;
    std::string scope_version;

    /// authoritative timing, end_time >= start_time
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    /// wall clock time of the start, only used to place the span on a timeline when exporting
    std::chrono::system_clock::time_point start_timestamp;

    Attributes attributes;
    SpanStatus status{SpanStatus::unset};
    std::string status_description;

    std::shared_ptr<const Resource> resource;

    std::chrono::steady_clock::duration duration() const
    {
        return end_time - start_time;
    }
};

/**
 * @brief A timed unit of work that has been started and not yet handed to the exporter.
 *
 * A Span is owned by the code that opened it. It is not made current by itself, see ScopedSpan. Destroying a span
 * that was not ended ends it.
 */
class Span final
{
  public:
    Span(std::shared_ptr<detail::TracerState> state,
         SpanContext context,
         std::string name,
         std::string scope_name,
         std::string scope_version,
         Attributes attributes);
    ~Span();

    COTEL_DELETE_COPYABILITY(Span);

    // the moved-from span is left ended
    Span(Span&& other) noexcept;
    Span& operator=(Span&& other) noexcept;

    const SpanContext& context() const
    {
        return m_data.context;
    }

    const std::string& name() const
    {
        return m_data.name;
    }

    bool is_ended() const
    {
        return m_ended;
    }

    /**
     * @brief Time elapsed since the span started, or its final duration once ended.
     */
    std::chrono::steady_clock::duration elapsed() const;

    Expected<> set_attribute(std::string key, AttributeValue value);

    /**
     * @brief Marks the span as failed with `exception.type` and `exception.message` attributes.
     */
    Expected<> record_error(const std::exception& error);

    Expected<> record_error(std::string_view message);

    /**
     * @brief Ends the span with status ok unless an error was recorded, and submits it for export.
     *
     * Ending a span a second time does nothing and returns a usage_error.
     */
    Expected<> end();

    Expected<> end(SpanStatus status, std::string description = {});

  private:
    Expected<> ensure_open(std::string_view operation) const;

    void finish(SpanStatus status, std::string description);

    std::shared_ptr<detail::TracerState> m_state;
    SpanData m_data;
    bool m_ended{false};

    friend class ScopedSpan;
};

/**
 * @brief Span that is the current span of the calling task for as long as it lives.
 *
 * The span is ended when the ScopedSpan is destroyed, whatever the reason:
 *  - normal scope exit ends it with status ok (or error, if an error was recorded),
 *  - stack unwinding from an exception ends it with status error,
 *  - destruction of an unfinished coro::Task frame ends it with status error and attribute `cancelled=true`.
 */
class ScopedSpan final
{
  public:
    explicit ScopedSpan(Span span);
    ~ScopedSpan();

    COTEL_DELETE_COPYABILITY(ScopedSpan);
    COTEL_DELETE_MOVEABILITY(ScopedSpan);

    Span& span()
    {
        return m_span;
    }

    const Span& span() const
    {
        return m_span;
    }

    Span* operator->()
    {
        return &m_span;
    }

    const SpanContext& context() const
    {
        return m_span.context();
    }

    /**
     * @brief Ends the span before the end of the scope; the enclosing span becomes current again.
     */
    Expected<> end();

    Expected<> end(SpanStatus status, std::string description = {});

  private:
    Span m_span;
    std::optional<Scope> m_scope;
    int m_uncaught_exceptions;
};

}  // namespace cotel::trace
