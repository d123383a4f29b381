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

#include "cotel/trace/propagation.hpp"

#include "libcotel/trace/runtime_context.hpp"

#include <opentelemetry/context/context.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/nostd/span.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/default_span.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/trace_flags.h>

#include <cstdint>
#include <cstring>

namespace cotel::trace {

namespace {

// the parent is not part of the OpenTelemetry span context, it travels next to the span under its own key
constexpr auto kParentSpanIdKey = "cotel.parent_span_id";

std::uint64_t pack(const SpanId& span_id)
{
    std::uint64_t packed{0};
    std::memcpy(&packed, span_id.Id().data(), sizeof(packed));
    return packed;
}

SpanId unpack(std::uint64_t packed)
{
    std::uint8_t bytes[SpanId::kSize];
    std::memcpy(bytes, &packed, sizeof(bytes));
    const std::uint8_t(&view)[SpanId::kSize] = bytes;
    return SpanId{opentelemetry::nostd::span<const std::uint8_t, SpanId::kSize>(view)};
}

Context make_context(const std::optional<SpanContext>& context)
{
    auto base = RuntimeContext::get_storage().GetCurrent();

    if (!context)
    {
        // an invalid span masks the enclosing one
        opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span(
            new opentelemetry::trace::DefaultSpan(opentelemetry::trace::SpanContext::GetInvalid()));
        return opentelemetry::trace::SetSpan(base, span).SetValue(kParentSpanIdKey, std::uint64_t{0});
    }

    opentelemetry::trace::SpanContext otel_context(
        context->trace_id,
        context->span_id,
        opentelemetry::trace::TraceFlags(context->sampled ? opentelemetry::trace::TraceFlags::kIsSampled : 0),
        context->remote);

    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span(
        new opentelemetry::trace::DefaultSpan(otel_context));

    const std::uint64_t parent = context->parent_span_id ? pack(*context->parent_span_id) : 0;

    return opentelemetry::trace::SetSpan(base, span).SetValue(kParentSpanIdKey, parent);
}

}  // namespace

std::optional<SpanContext> current()
{
    auto context = RuntimeContext::get_storage().GetCurrent();
    auto span    = opentelemetry::trace::GetSpan(context);
    auto otel    = span->GetContext();

    if (!otel.IsValid())
    {
        return std::nullopt;
    }

    SpanContext result{.trace_id = otel.trace_id(),
                       .span_id  = otel.span_id(),
                       .sampled  = otel.IsSampled(),
                       .remote   = otel.IsRemote()};

    auto parent = context.GetValue(kParentSpanIdKey);
    if (opentelemetry::nostd::holds_alternative<std::uint64_t>(parent))
    {
        auto packed = opentelemetry::nostd::get<std::uint64_t>(parent);
        if (packed != 0)
        {
            result.parent_span_id = unpack(packed);
        }
    }

    return result;
}

Scope::Scope(const std::optional<SpanContext>& context) :
  m_token(RuntimeContext::get_storage().Attach(make_context(context)))
{}

// the token detaches itself from the active stack when released
Scope::~Scope() = default;

DetachedHandle detach()
{
    return DetachedHandle{current()};
}

}  // namespace cotel::trace
