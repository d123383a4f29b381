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
#include "cotel/diagnostics.hpp"
#include "cotel/expected.hpp"
#include "cotel/resource.hpp"
#include "cotel/trace/batch_exporter.hpp"
#include "cotel/trace/span.hpp"
#include "cotel/trace/span_context.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace cotel::trace {

/**
 * @brief Span factory for one instrumented component.
 */
class Tracer final
{
  public:
    /**
     * @brief Starts a span as a child of the current span, or as the root of a new trace if no span is current,
     * and makes it current until the returned ScopedSpan is destroyed.
     */
    [[nodiscard]] ScopedSpan start_span(std::string name, Attributes attributes = {});

    /**
     * @brief Starts a span as a child of an explicitly passed parent and makes it current.
     */
    [[nodiscard]] ScopedSpan start_span(std::string name, const SpanContext& parent, Attributes attributes = {});

    /**
     * @brief Starts a span without making it current. With no parent the span starts a new trace.
     */
    [[nodiscard]] Span create_span(std::string name, const std::optional<SpanContext>& parent, Attributes attributes = {});

    const std::string& name() const
    {
        return m_name;
    }

    const std::string& version() const
    {
        return m_version;
    }

  private:
    Tracer(std::shared_ptr<detail::TracerState> state, std::string name, std::string version);

    std::shared_ptr<detail::TracerState> m_state;
    std::string m_name;
    std::string m_version;

    friend class TracerProvider;
};

/**
 * @brief Owns the tracing pipeline of a process: the Resource, the exporter, and the identity of every span its
 * tracers start.
 *
 * Providers are explicitly constructed and passed to the components that need them. Independent providers do not
 * share any state, which is what tests rely on.
 */
class TracerProvider final
{
  public:
    struct Options
    {
        /// number of most recently issued span ids remembered for validating parents
        std::size_t issued_span_id_capacity = 65536;
    };

    TracerProvider(Resource resource, std::shared_ptr<BatchExporter> exporter, std::shared_ptr<Diagnostics> diagnostics);

    TracerProvider(Resource resource,
                   std::shared_ptr<BatchExporter> exporter,
                   std::shared_ptr<Diagnostics> diagnostics,
                   Options options);

    ~TracerProvider();

    COTEL_DELETE_COPYABILITY(TracerProvider);
    COTEL_DELETE_MOVEABILITY(TracerProvider);

    /**
     * @brief Returns the tracer for a component; repeated calls with the same name return the same tracer.
     */
    std::shared_ptr<Tracer> get_tracer(std::string_view name, std::string_view version = {});

    const Resource& resource() const;

    Diagnostics& diagnostics() const;

    /**
     * @brief Exports every span ended so far, waiting up to `timeout`.
     */
    Expected<> force_flush(std::chrono::milliseconds timeout);

  private:
    std::shared_ptr<detail::TracerState> m_state;

    std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<Tracer>, std::less<>> m_tracers;
};

}  // namespace cotel::trace
