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

#include "cotel/metrics/aggregator.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace cotel::metrics {

const AggregatedMetric* MetricsSnapshot::find(std::string_view name, const Attributes& attributes) const
{
    for (const auto& metric : metrics)
    {
        if (metric.name() == name && metric.attributes == attributes)
        {
            return &metric;
        }
    }
    return nullptr;
}

std::vector<const AggregatedMetric*> MetricsSnapshot::find_all(std::string_view name) const
{
    std::vector<const AggregatedMetric*> found;
    for (const auto& metric : metrics)
    {
        if (metric.name() == name)
        {
            found.push_back(&metric);
        }
    }
    return found;
}

Aggregator::Aggregator(std::shared_ptr<Diagnostics> diagnostics) : Aggregator(std::move(diagnostics), Options{}) {}

Aggregator::Aggregator(std::shared_ptr<Diagnostics> diagnostics, Options options) :
  m_options(options),
  m_diagnostics(std::move(diagnostics)),
  m_start(std::chrono::system_clock::now()),
  m_snapshot(std::make_shared<const MetricsSnapshot>(
      MetricsSnapshot{.window_start = m_start, .window_end = m_start, .collection = 0}))
{
    CHECK(m_diagnostics);
    CHECK_GT(m_options.max_buffered_points, 0);
}

void Aggregator::record(MetricPoint point)
{
    bool evicted = false;
    {
        std::lock_guard<std::mutex> lock(m_buffer_mutex);
        if (m_buffer.size() >= m_options.max_buffered_points)
        {
            m_buffer.pop_front();
            evicted = true;
        }
        m_buffer.push_back(std::move(point));
    }

    if (evicted)
    {
        m_diagnostics->report(Error{ErrorCode::buffer_overflow, "metric buffer full, evicted the oldest observation"});
    }
}

std::shared_ptr<const MetricsSnapshot> Aggregator::collect()
{
    std::lock_guard<std::mutex> collect_lock(m_collect_mutex);

    std::deque<MetricPoint> points;
    {
        std::lock_guard<std::mutex> lock(m_buffer_mutex);
        points.swap(m_buffer);
    }

    const auto now = std::chrono::system_clock::now();

    for (const auto& point : points)
    {
        auto key   = std::make_pair(point.instrument->name, point.attributes);
        auto found = m_series.find(key);
        if (found == m_series.end())
        {
            AggregatedMetric metric{.instrument = point.instrument, .attributes = point.attributes};
            if (point.instrument->kind == InstrumentKind::histogram)
            {
                HistogramData histogram;
                histogram.bucket_counts.resize(point.instrument->boundaries.size() + 1, 0);
                metric.data = std::move(histogram);
            }
            found = m_series.emplace(std::move(key), std::move(metric)).first;
        }

        fold(found->second, point);
    }

    auto snapshot          = std::make_shared<MetricsSnapshot>();
    snapshot->window_start = m_start;
    snapshot->window_end   = now;
    snapshot->collection   = ++m_collections;
    snapshot->metrics.reserve(m_series.size());

    for (auto& [key, metric] : m_series)
    {
        metric.window_start = m_start;
        metric.window_end   = now;
        snapshot->metrics.push_back(metric);
    }

    DVLOG(10) << "collection " << snapshot->collection << " folded " << points.size() << " observations into "
              << snapshot->metrics.size() << " series";

    std::shared_ptr<const MetricsSnapshot> published = std::move(snapshot);
    {
        std::lock_guard<std::mutex> lock(m_snapshot_mutex);
        m_snapshot = published;
    }
    return published;
}

std::shared_ptr<const MetricsSnapshot> Aggregator::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_snapshot_mutex);
    return m_snapshot;
}

std::size_t Aggregator::buffered() const
{
    std::lock_guard<std::mutex> lock(m_buffer_mutex);
    return m_buffer.size();
}

void Aggregator::fold(AggregatedMetric& metric, const MetricPoint& point)
{
    if (auto* sum = std::get_if<SumData>(&metric.data); sum != nullptr)
    {
        sum->value += point.value;
        return;
    }

    auto& histogram       = std::get<HistogramData>(metric.data);
    const auto& bounds    = point.instrument->boundaries;
    const auto bucket     = std::lower_bound(bounds.begin(), bounds.end(), point.value) - bounds.begin();
    histogram.bucket_counts[bucket] += 1;

    if (histogram.count == 0)
    {
        histogram.min = point.value;
        histogram.max = point.value;
    }
    else
    {
        histogram.min = std::min(histogram.min, point.value);
        histogram.max = std::max(histogram.max, point.value);
    }

    histogram.sum += point.value;
    histogram.count += 1;
}

}  // namespace cotel::metrics
