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

#include "cotel/trace/span_sink.hpp"

#include <glog/logging.h>
#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/common/timestamp.h>
#include <opentelemetry/nostd/span.h>
#include <opentelemetry/sdk/common/attribute_utils.h>
#include <opentelemetry/sdk/common/exporter_utils.h>
#include <opentelemetry/sdk/trace/recordable.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/span_metadata.h>
#include <opentelemetry/trace/trace_flags.h>

#include <variant>

namespace cotel::trace {

namespace {

namespace otel_trace  = opentelemetry::trace;
namespace otel_common = opentelemetry::common;

otel_common::AttributeValue to_otel(const AttributeValue& value)
{
    return std::visit(
        [](const auto& v) -> otel_common::AttributeValue {
            using value_t = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<value_t, std::string>)
            {
                return opentelemetry::nostd::string_view(v);
            }
            else
            {
                return v;
            }
        },
        value);
}

opentelemetry::sdk::resource::Resource to_otel(const Resource& resource)
{
    opentelemetry::sdk::resource::ResourceAttributes attributes;
    for (const auto& [key, value] : resource.attributes())
    {
        attributes.SetAttribute(key, to_otel(value));
    }
    return opentelemetry::sdk::resource::Resource::Create(attributes);
}

otel_trace::StatusCode to_otel(SpanStatus status)
{
    switch (status)
    {
    case SpanStatus::ok:
        return otel_trace::StatusCode::kOk;
    case SpanStatus::error:
        return otel_trace::StatusCode::kError;
    case SpanStatus::unset:
        break;
    }
    return otel_trace::StatusCode::kUnset;
}

}  // namespace

Expected<> LogSpanSink::export_batch(const std::vector<SpanData>& batch)
{
    using cotel::operator<<;

    for (const auto& span : batch)
    {
        LOG(INFO) << "span " << span.name << " [" << span.context << "] duration="
                  << std::chrono::duration_cast<std::chrono::microseconds>(span.duration()).count()
                  << "us status=" << to_string(span.status) << " attributes=" << span.attributes;
    }
    return {};
}

OtelSpanSink::OtelSpanSink(std::unique_ptr<opentelemetry::sdk::trace::SpanExporter> exporter, const Resource& resource) :
  m_exporter(std::move(exporter)),
  m_resource(to_otel(resource))
{
    CHECK(m_exporter) << "OtelSpanSink requires an exporter";
}

OtelSpanSink::~OtelSpanSink()
{
    shutdown();
}

Expected<> OtelSpanSink::export_batch(const std::vector<SpanData>& batch)
{
    if (m_shutdown)
    {
        return cotel::unexpected(ErrorCode::export_failure, "span exporter has been shut down");
    }

    std::vector<std::unique_ptr<opentelemetry::sdk::trace::Recordable>> recordables;
    recordables.reserve(batch.size());

    for (const auto& span : batch)
    {
        auto recordable = m_exporter->MakeRecordable();

        otel_trace::SpanContext context(
            span.context.trace_id,
            span.context.span_id,
            otel_trace::TraceFlags(span.context.sampled ? otel_trace::TraceFlags::kIsSampled : 0),
            span.context.remote);

        recordable->SetIdentity(context, span.context.parent_span_id.value_or(SpanId{}));
        recordable->SetName(span.name);
        recordable->SetSpanKind(otel_trace::SpanKind::kInternal);
        recordable->SetStartTime(otel_common::SystemTimestamp(span.start_timestamp));
        recordable->SetDuration(std::chrono::duration_cast<std::chrono::nanoseconds>(span.duration()));

        for (const auto& [key, value] : span.attributes)
        {
            recordable->SetAttribute(key, to_otel(value));
        }

        recordable->SetStatus(to_otel(span.status), span.status_description);
        recordable->SetResource(m_resource);
        recordable->SetInstrumentationScope(scope(span));

        recordables.push_back(std::move(recordable));
    }

    opentelemetry::nostd::span<std::unique_ptr<opentelemetry::sdk::trace::Recordable>> spans(recordables.data(),
                                                                                              recordables.size());

    auto result = m_exporter->Export(spans);
    if (result != opentelemetry::sdk::common::ExportResult::kSuccess)
    {
        return cotel::unexpected(ErrorCode::export_failure,
                                 std::string("span exporter returned ") +
                                     opentelemetry::sdk::common::GetExportResultString(result));
    }

    return {};
}

void OtelSpanSink::shutdown()
{
    if (!m_shutdown)
    {
        m_shutdown = true;
        if (!m_exporter->Shutdown())
        {
            LOG(WARNING) << "span exporter did not shut down cleanly";
        }
    }
}

const opentelemetry::sdk::instrumentationscope::InstrumentationScope& OtelSpanSink::scope(const SpanData& span)
{
    auto key   = std::make_pair(span.scope_name, span.scope_version);
    auto found = m_scopes.find(key);
    if (found == m_scopes.end())
    {
        found = m_scopes
                    .emplace(key,
                             opentelemetry::sdk::instrumentationscope::InstrumentationScope::Create(span.scope_name,
                                                                                                     span.scope_version))
                    .first;
    }
    return *found->second;
}

}  // namespace cotel::trace
