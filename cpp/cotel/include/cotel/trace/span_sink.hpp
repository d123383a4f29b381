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

#include "cotel/common/macros.hpp"
#include "cotel/expected.hpp"
#include "cotel/resource.hpp"
#include "cotel/trace/span.hpp"

#include <opentelemetry/sdk/instrumentationscope/instrumentation_scope.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/exporter.h>

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cotel::trace {

/**
 * @brief Destination of exported span batches, e.g. a network exporter. Called from the BatchExporter worker thread
 * only, never concurrently.
 */
class SpanSink
{
  public:
    virtual ~SpanSink() = default;

    /**
     * @brief Exports one batch; an error makes the BatchExporter retry the same batch.
     */
    virtual Expected<> export_batch(const std::vector<SpanData>& batch) = 0;

    virtual void shutdown() {}
};

/**
 * @brief Writes every span to the glog INFO log.
 */
class LogSpanSink final : public SpanSink
{
  public:
    Expected<> export_batch(const std::vector<SpanData>& batch) final;
};

/**
 * @brief Adapts an OpenTelemetry SDK span exporter (OTLP, ostream, in-memory, ...) to a SpanSink.
 */
class OtelSpanSink final : public SpanSink
{
  public:
    OtelSpanSink(std::unique_ptr<opentelemetry::sdk::trace::SpanExporter> exporter, const Resource& resource);
    ~OtelSpanSink() override;

    COTEL_DELETE_COPYABILITY(OtelSpanSink);
    COTEL_DELETE_MOVEABILITY(OtelSpanSink);

    Expected<> export_batch(const std::vector<SpanData>& batch) final;

    void shutdown() final;

  private:
    const opentelemetry::sdk::instrumentationscope::InstrumentationScope& scope(const SpanData& span);

    std::unique_ptr<opentelemetry::sdk::trace::SpanExporter> m_exporter;
    // recordables keep pointers to the resource and scopes, they must outlive every exported span
    opentelemetry::sdk::resource::Resource m_resource;
    std::map<std::pair<std::string, std::string>,
             std::unique_ptr<opentelemetry::sdk::instrumentationscope::InstrumentationScope>>
        m_scopes;
    bool m_shutdown{false};
};

}  // namespace cotel::trace
