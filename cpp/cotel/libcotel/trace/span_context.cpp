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

#include "cotel/trace/span_context.hpp"

#include <opentelemetry/nostd/span.h>

#include <array>

namespace cotel::trace {

std::string to_hex(const TraceId& trace_id)
{
    std::array<char, 2 * TraceId::kSize> buffer;
    trace_id.ToLowerBase16(buffer);
    return {buffer.data(), buffer.size()};
}

std::string to_hex(const SpanId& span_id)
{
    std::array<char, 2 * SpanId::kSize> buffer;
    span_id.ToLowerBase16(buffer);
    return {buffer.data(), buffer.size()};
}

SpanContext SpanContext::from_remote(TraceId trace_id, SpanId span_id, bool sampled)
{
    return SpanContext{.trace_id = trace_id, .span_id = span_id, .sampled = sampled, .remote = true};
}

std::ostream& operator<<(std::ostream& os, const SpanContext& context)
{
    os << "trace_id=" << to_hex(context.trace_id) << " span_id=" << to_hex(context.span_id);
    if (context.parent_span_id)
    {
        os << " parent_span_id=" << to_hex(*context.parent_span_id);
    }
    if (context.remote)
    {
        os << " remote";
    }
    return os;
}

}  // namespace cotel::trace
