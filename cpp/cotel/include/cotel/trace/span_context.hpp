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

#include <opentelemetry/trace/span_id.h>
#include <opentelemetry/trace/trace_id.h>

#include <optional>
#include <ostream>
#include <string>

namespace cotel::trace {

using opentelemetry::trace::SpanId;
using opentelemetry::trace::TraceId;

std::string to_hex(const TraceId& trace_id);
std::string to_hex(const SpanId& span_id);

/**
 * @brief Identity of one span and its position in a trace. Value type, copied and never mutated.
 */
struct SpanContext
{
    TraceId trace_id;
    SpanId span_id;
    /// unset for the root span of a trace
    std::optional<SpanId> parent_span_id;
    bool sampled{true};
    /// the span was created by another process; its span id was never issued locally
    bool remote{false};

    /**
     * @brief Context of a span received from another process, e.g. from an inbound request header.
     */
    static SpanContext from_remote(TraceId trace_id, SpanId span_id, bool sampled = true);

    bool is_valid() const
    {
        return trace_id.IsValid() && span_id.IsValid();
    }

    bool is_root() const
    {
        return !parent_span_id.has_value();
    }

    bool operator==(const SpanContext& other) const
    {
        return trace_id == other.trace_id && span_id == other.span_id && parent_span_id == other.parent_span_id &&
               sampled == other.sampled && remote == other.remote;
    }
};

std::ostream& operator<<(std::ostream& os, const SpanContext& context);

}  // namespace cotel::trace
