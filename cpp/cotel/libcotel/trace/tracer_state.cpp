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

#include "libcotel/trace/tracer_state.hpp"

#include <glog/logging.h>

#include <cstring>
#include <sstream>

namespace cotel::trace::detail {

namespace {

std::uint64_t id_key(const SpanId& span_id)
{
    std::uint64_t key{0};
    std::memcpy(&key, span_id.Id().data(), sizeof(key));
    return key;
}

}  // namespace

TracerState::TracerState(Resource resource,
                         std::shared_ptr<BatchExporter> exporter,
                         std::shared_ptr<Diagnostics> diagnostics,
                         std::size_t issued_span_id_capacity) :
  m_resource(std::make_shared<const Resource>(std::move(resource))),
  m_exporter(std::move(exporter)),
  m_diagnostics(std::move(diagnostics)),
  m_issued_capacity(issued_span_id_capacity)
{
    CHECK(m_exporter) << "a tracer provider requires an exporter";
    CHECK(m_diagnostics);
    CHECK_GT(m_issued_capacity, 0);
}

SpanContext TracerState::make_span_context(const std::optional<SpanContext>& parent)
{
    SpanContext context;

    if (parent && parent->is_valid())
    {
        if (!parent->remote && !was_issued(parent->span_id))
        {
            std::stringstream ss;
            ss << "starting span under a parent that was not issued by this tracer provider: " << *parent;
            m_diagnostics->report(Error{ErrorCode::usage_error, ss.str()});
        }

        context.trace_id       = parent->trace_id;
        context.parent_span_id = parent->span_id;
        context.sampled        = parent->sampled;
    }
    else
    {
        context.trace_id = m_id_generator.GenerateTraceId();
    }

    context.span_id = m_id_generator.GenerateSpanId();
    remember(context.span_id);

    return context;
}

void TracerState::on_end(const SpanData& data)
{
    if (!data.context.sampled)
    {
        return;
    }

    m_exporter->submit(data);
}

bool TracerState::was_issued(const SpanId& span_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_issued.contains(id_key(span_id));
}

void TracerState::remember(const SpanId& span_id)
{
    const auto key = id_key(span_id);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_issued.insert(key).second)
    {
        return;
    }

    m_issued_order.push_back(key);
    if (m_issued_order.size() > m_issued_capacity)
    {
        m_issued.erase(m_issued_order.front());
        m_issued_order.pop_front();
    }
}

}  // namespace cotel::trace::detail
