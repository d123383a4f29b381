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
#include "cotel/metrics/instrument.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace cotel::metrics {

/**
 * @brief One raw observation, buffered until the next collection.
 */
struct MetricPoint
{
    std::shared_ptr<const InstrumentDescriptor> instrument;
    double value{0};
    Attributes attributes;
    std::chrono::system_clock::time_point timestamp;
};

struct SumData
{
    double value{0};
};

struct HistogramData
{
    /// one count per boundary plus the overflow bucket
    std::vector<std::uint64_t> bucket_counts;
    double sum{0};
    std::uint64_t count{0};
    double min{0};
    double max{0};
};

/**
 * @brief Cumulative state of one series: an instrument and an exact attribute set.
 */
struct AggregatedMetric
{
    std::shared_ptr<const InstrumentDescriptor> instrument;
    Attributes attributes;
    std::variant<SumData, HistogramData> data;
    std::chrono::system_clock::time_point window_start;
    std::chrono::system_clock::time_point window_end;

    const std::string& name() const
    {
        return instrument->name;
    }
};

/**
 * @brief Immutable result of one collection.
 */
struct MetricsSnapshot
{
    /// ordered by instrument name, then attributes
    std::vector<AggregatedMetric> metrics;
    std::chrono::system_clock::time_point window_start;
    std::chrono::system_clock::time_point window_end;
    /// number of collections performed before and including this one
    std::uint64_t collection{0};

    const AggregatedMetric* find(std::string_view name, const Attributes& attributes) const;

    std::vector<const AggregatedMetric*> find_all(std::string_view name) const;
};

/**
 * @brief Reduces raw observations into per-series sums and histograms with cumulative temporality.
 *
 * Recording appends to a bounded buffer under a narrow lock. collect() swaps the buffer out, folds it into the
 * cumulative state and publishes a new snapshot; readers only ever see complete snapshots.
 */
class Aggregator final
{
  public:
    struct Options
    {
        /// raw observations buffered between collections; the oldest is evicted when full
        std::size_t max_buffered_points = 65536;
    };

    explicit Aggregator(std::shared_ptr<Diagnostics> diagnostics);
    Aggregator(std::shared_ptr<Diagnostics> diagnostics, Options options);

    COTEL_DELETE_COPYABILITY(Aggregator);
    COTEL_DELETE_MOVEABILITY(Aggregator);

    void record(MetricPoint point);

    std::shared_ptr<const MetricsSnapshot> collect();

    /**
     * @brief The latest published snapshot; empty until the first collection.
     */
    std::shared_ptr<const MetricsSnapshot> snapshot() const;

    std::size_t buffered() const;

  private:
    static void fold(AggregatedMetric& metric, const MetricPoint& point);

    const Options m_options;
    std::shared_ptr<Diagnostics> m_diagnostics;
    const std::chrono::system_clock::time_point m_start;

    mutable std::mutex m_buffer_mutex;
    std::deque<MetricPoint> m_buffer;

    // serializes collections
    std::mutex m_collect_mutex;
    std::map<std::pair<std::string, Attributes>, AggregatedMetric> m_series;
    std::uint64_t m_collections{0};

    mutable std::mutex m_snapshot_mutex;
    std::shared_ptr<const MetricsSnapshot> m_snapshot;
};

}  // namespace cotel::metrics
