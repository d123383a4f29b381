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

#include "cotel/diagnostics.hpp"
#include "cotel/resource.hpp"
#include "cotel/trace/batch_exporter.hpp"
#include "cotel/trace/span.hpp"
#include "cotel/trace/span_context.hpp"

#include <opentelemetry/sdk/trace/random_id_generator.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_set>

namespace cotel::trace::detail {

/**
 * @brief State shared by a TracerProvider, its tracers and every span they open. Spans keep it alive, so a span may
 * outlive the provider that started it.
 */
class TracerState final
{
  public:
    TracerState(Resource resource,
                std::shared_ptr<BatchExporter> exporter,
                std::shared_ptr<Diagnostics> diagnostics,
                std::size_t issued_span_id_capacity);

    // generates the identity of a new span; a parent that is neither remote nor issued here is reported
    SpanContext make_span_context(const std::optional<SpanContext>& parent);

    // hands a finished span to the exporter if it is sampled
    void on_end(const SpanData& data);

    const std::shared_ptr<const Resource>& resource() const
    {
        return m_resource;
    }

    BatchExporter& exporter()
    {
        return *m_exporter;
    }

    Diagnostics& diagnostics()
    {
        return *m_diagnostics;
    }

  private:
    bool was_issued(const SpanId& span_id);
    void remember(const SpanId& span_id);

    std::shared_ptr<const Resource> m_resource;
    std::shared_ptr<BatchExporter> m_exporter;
    std::shared_ptr<Diagnostics> m_diagnostics;
    opentelemetry::sdk::trace::RandomIdGenerator m_id_generator;

    // bounded memory of issued span ids; the oldest ids are forgotten first
    std::mutex m_mutex;
    std::unordered_set<std::uint64_t> m_issued;
    std::deque<std::uint64_t> m_issued_order;
    std::size_t m_issued_capacity;
};

}  // namespace cotel::trace::detail
