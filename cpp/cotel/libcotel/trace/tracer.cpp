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

#include "cotel/trace/tracer.hpp"

#include "cotel/trace/propagation.hpp"
#include "libcotel/trace/runtime_context.hpp"
#include "libcotel/trace/tracer_state.hpp"

#include <glog/logging.h>

namespace cotel::trace {

Tracer::Tracer(std::shared_ptr<detail::TracerState> state, std::string name, std::string version) :
  m_state(std::move(state)),
  m_name(std::move(name)),
  m_version(std::move(version))
{}

ScopedSpan Tracer::start_span(std::string name, Attributes attributes)
{
    return ScopedSpan{create_span(std::move(name), current(), std::move(attributes))};
}

ScopedSpan Tracer::start_span(std::string name, const SpanContext& parent, Attributes attributes)
{
    return ScopedSpan{create_span(std::move(name), parent, std::move(attributes))};
}

Span Tracer::create_span(std::string name, const std::optional<SpanContext>& parent, Attributes attributes)
{
    auto context = m_state->make_span_context(parent);
    return {m_state, std::move(context), std::move(name), m_name, m_version, std::move(attributes)};
}

TracerProvider::TracerProvider(Resource resource,
                               std::shared_ptr<BatchExporter> exporter,
                               std::shared_ptr<Diagnostics> diagnostics) :
  TracerProvider(std::move(resource), std::move(exporter), std::move(diagnostics), Options{})
{}

TracerProvider::TracerProvider(Resource resource,
                               std::shared_ptr<BatchExporter> exporter,
                               std::shared_ptr<Diagnostics> diagnostics,
                               Options options) :
  m_state(std::make_shared<detail::TracerState>(
      std::move(resource), std::move(exporter), std::move(diagnostics), options.issued_span_id_capacity))
{
    // spans are made current through the coroutine aware storage
    RuntimeContext::init();
    VLOG(1) << "tracer provider created for service " << m_state->resource()->service_name();
}

TracerProvider::~TracerProvider() = default;

std::shared_ptr<Tracer> TracerProvider::get_tracer(std::string_view name, std::string_view version)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto found = m_tracers.find(name);
    if (found != m_tracers.end())
    {
        return found->second;
    }

    std::shared_ptr<Tracer> tracer(new Tracer(m_state, std::string(name), std::string(version)));
    m_tracers.emplace(std::string(name), tracer);
    return tracer;
}

const Resource& TracerProvider::resource() const
{
    return *m_state->resource();
}

Diagnostics& TracerProvider::diagnostics() const
{
    return m_state->diagnostics();
}

Expected<> TracerProvider::force_flush(std::chrono::milliseconds timeout)
{
    return m_state->exporter().flush(timeout);
}

}  // namespace cotel::trace
