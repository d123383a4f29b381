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
#include "cotel/diagnostics.hpp"
#include "cotel/expected.hpp"
#include "cotel/metrics/aggregator.hpp"
#include "cotel/metrics/instrument.hpp"
#include "cotel/metrics/registry.hpp"
#include "cotel/resource.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace cotel::metrics {

/**
 * @brief Instrument factory for one instrumented component. Instruments are identified by name across the whole
 * MeterProvider, not per meter.
 */
class Meter final
{
  public:
    Expected<Counter> create_counter(std::string name, std::string unit = {}, std::string description = {});

    /**
     * @brief Histogram with the default bucket boundaries.
     */
    Expected<Histogram> create_histogram(std::string name, std::string unit = {}, std::string description = {});

    Expected<Histogram> create_histogram(std::string name,
                                         std::vector<double> boundaries,
                                         std::string unit,
                                         std::string description);

    const std::string& name() const
    {
        return m_name;
    }

  private:
    Meter(std::string name,
          std::shared_ptr<InstrumentRegistry> registry,
          std::shared_ptr<Aggregator> aggregator,
          std::shared_ptr<Diagnostics> diagnostics);

    std::string m_name;
    std::shared_ptr<InstrumentRegistry> m_registry;
    std::shared_ptr<Aggregator> m_aggregator;
    std::shared_ptr<Diagnostics> m_diagnostics;

    friend class MeterProvider;
};

/**
 * @brief Owns the metrics pipeline of a process: instrument registry, aggregator and the Resource attached to
 * every exposition.
 *
 * With a non-zero `collect_interval` a worker thread collects periodically and scrape() serves the latest completed
 * window; otherwise every scrape() collects first.
 */
class MeterProvider final
{
  public:
    struct Options
    {
        std::chrono::milliseconds collect_interval{0};
        std::size_t max_buffered_points = 65536;
    };

    MeterProvider(Resource resource, std::shared_ptr<Diagnostics> diagnostics);
    MeterProvider(Resource resource, std::shared_ptr<Diagnostics> diagnostics, Options options);
    ~MeterProvider();

    COTEL_DELETE_COPYABILITY(MeterProvider);
    COTEL_DELETE_MOVEABILITY(MeterProvider);

    std::shared_ptr<Meter> get_meter(std::string_view name);

    std::shared_ptr<const MetricsSnapshot> collect();

    std::shared_ptr<const MetricsSnapshot> snapshot() const;

    /**
     * @brief Prometheus text exposition of the latest completed window.
     */
    std::string scrape();

    const Resource& resource() const
    {
        return m_resource;
    }

    InstrumentRegistry& registry()
    {
        return *m_registry;
    }

  private:
    void collector(std::stop_token stop_token);

    const Options m_options;
    const Resource m_resource;
    std::shared_ptr<Diagnostics> m_diagnostics;
    std::shared_ptr<InstrumentRegistry> m_registry;
    std::shared_ptr<Aggregator> m_aggregator;

    std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<Meter>, std::less<>> m_meters;

    std::mutex m_collector_mutex;
    std::condition_variable_any m_collector_cv;
    std::jthread m_collector;
};

}  // namespace cotel::metrics
