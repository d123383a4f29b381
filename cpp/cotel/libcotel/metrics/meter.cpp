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

#include "cotel/metrics/meter.hpp"

#include "cotel/metrics/exposition.hpp"

#include <glog/logging.h>

#include <utility>

namespace cotel::metrics {

Meter::Meter(std::string name,
             std::shared_ptr<InstrumentRegistry> registry,
             std::shared_ptr<Aggregator> aggregator,
             std::shared_ptr<Diagnostics> diagnostics) :
  m_name(std::move(name)),
  m_registry(std::move(registry)),
  m_aggregator(std::move(aggregator)),
  m_diagnostics(std::move(diagnostics))
{}

Expected<Counter> Meter::create_counter(std::string name, std::string unit, std::string description)
{
    return m_registry
        ->register_instrument(InstrumentDescriptor{.name        = std::move(name),
                                                   .kind        = InstrumentKind::counter,
                                                   .unit        = std::move(unit),
                                                   .description = std::move(description)})
        .map([this](std::shared_ptr<const InstrumentDescriptor> descriptor) {
            return Counter{std::move(descriptor), m_aggregator, m_diagnostics};
        });
}

Expected<Histogram> Meter::create_histogram(std::string name, std::string unit, std::string description)
{
    return create_histogram(
        std::move(name), default_histogram_boundaries(), std::move(unit), std::move(description));
}

Expected<Histogram> Meter::create_histogram(std::string name,
                                            std::vector<double> boundaries,
                                            std::string unit,
                                            std::string description)
{
    return m_registry
        ->register_instrument(InstrumentDescriptor{.name        = std::move(name),
                                                   .kind        = InstrumentKind::histogram,
                                                   .unit        = std::move(unit),
                                                   .description = std::move(description),
                                                   .boundaries  = std::move(boundaries)})
        .map([this](std::shared_ptr<const InstrumentDescriptor> descriptor) {
            return Histogram{std::move(descriptor), m_aggregator, m_diagnostics};
        });
}

MeterProvider::MeterProvider(Resource resource, std::shared_ptr<Diagnostics> diagnostics) :
  MeterProvider(std::move(resource), std::move(diagnostics), Options{})
{}

MeterProvider::MeterProvider(Resource resource, std::shared_ptr<Diagnostics> diagnostics, Options options) :
  m_options(options),
  m_resource(std::move(resource)),
  m_diagnostics(std::move(diagnostics)),
  m_registry(std::make_shared<InstrumentRegistry>(m_diagnostics)),
  m_aggregator(std::make_shared<Aggregator>(
      m_diagnostics, Aggregator::Options{.max_buffered_points = m_options.max_buffered_points}))
{
    if (m_options.collect_interval.count() > 0)
    {
        m_collector = std::jthread([this](std::stop_token stop_token) {
            collector(std::move(stop_token));
        });
    }
}

MeterProvider::~MeterProvider()
{
    if (m_collector.joinable())
    {
        m_collector.request_stop();
        m_collector.join();
    }
}

std::shared_ptr<Meter> MeterProvider::get_meter(std::string_view name)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto found = m_meters.find(name);
    if (found != m_meters.end())
    {
        return found->second;
    }

    std::shared_ptr<Meter> meter(new Meter(std::string(name), m_registry, m_aggregator, m_diagnostics));
    m_meters.emplace(std::string(name), meter);
    return meter;
}

std::shared_ptr<const MetricsSnapshot> MeterProvider::collect()
{
    return m_aggregator->collect();
}

std::shared_ptr<const MetricsSnapshot> MeterProvider::snapshot() const
{
    return m_aggregator->snapshot();
}

std::string MeterProvider::scrape()
{
    auto latest = m_collector.joinable() ? snapshot() : collect();
    return PrometheusExposition::render(*latest, m_resource);
}

void MeterProvider::collector(std::stop_token stop_token)
{
    VLOG(1) << "metrics collector started, interval=" << m_options.collect_interval.count() << "ms";

    std::unique_lock<std::mutex> lock(m_collector_mutex);
    while (!stop_token.stop_requested())
    {
        // only a stop request interrupts the wait
        m_collector_cv.wait_for(lock, stop_token, m_options.collect_interval, [] {
            return false;
        });

        if (stop_token.stop_requested())
        {
            break;
        }

        lock.unlock();
        collect();
        lock.lock();
    }
}

}  // namespace cotel::metrics
