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
#include "cotel/expected.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cotel {
class Diagnostics;
}  // namespace cotel

namespace cotel::metrics {

class Aggregator;

enum class InstrumentKind
{
    counter,
    histogram,
};

std::string_view to_string(InstrumentKind kind);

/**
 * @brief Registered identity of an instrument. The name is the identity; the kind is fixed by the first
 * registration.
 */
struct InstrumentDescriptor
{
    std::string name;
    InstrumentKind kind{InstrumentKind::counter};
    std::string unit;
    std::string description;
    /// upper bounds of the histogram buckets, strictly increasing; empty for counters
    std::vector<double> boundaries;
};

/**
 * @brief Default histogram bucket boundaries: 0, 5, 10, 25, 50, 75, 100, 250, 500, 750, 1000, 2500, 5000, 7500, 10000.
 */
const std::vector<double>& default_histogram_boundaries();

/**
 * @brief Monotonic sum. Cheap to copy; all copies record into the same instrument.
 */
class Counter final
{
  public:
    /**
     * @brief Adds a non-negative, finite value to the series identified by `attributes`; anything else is rejected
     * with invalid_observation and excluded from the aggregate.
     */
    Expected<> add(double value, Attributes attributes = {}) const;

    const InstrumentDescriptor& descriptor() const
    {
        return *m_descriptor;
    }

  private:
    Counter(std::shared_ptr<const InstrumentDescriptor> descriptor,
            std::shared_ptr<Aggregator> aggregator,
            std::shared_ptr<Diagnostics> diagnostics);

    std::shared_ptr<const InstrumentDescriptor> m_descriptor;
    std::shared_ptr<Aggregator> m_aggregator;
    std::shared_ptr<Diagnostics> m_diagnostics;

    friend class Meter;
};

/**
 * @brief Distribution of recorded values over the bucket boundaries fixed at registration.
 */
class Histogram final
{
  public:
    /**
     * @brief Records a finite value into the series identified by `attributes`; NaN and infinities are rejected
     * with invalid_observation.
     */
    Expected<> record(double value, Attributes attributes = {}) const;

    const InstrumentDescriptor& descriptor() const
    {
        return *m_descriptor;
    }

  private:
    Histogram(std::shared_ptr<const InstrumentDescriptor> descriptor,
              std::shared_ptr<Aggregator> aggregator,
              std::shared_ptr<Diagnostics> diagnostics);

    std::shared_ptr<const InstrumentDescriptor> m_descriptor;
    std::shared_ptr<Aggregator> m_aggregator;
    std::shared_ptr<Diagnostics> m_diagnostics;

    friend class Meter;
};

}  // namespace cotel::metrics
