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

#include "cotel/metrics/instrument.hpp"

#include "cotel/diagnostics.hpp"
#include "cotel/metrics/aggregator.hpp"

#include <chrono>
#include <cmath>
#include <sstream>
#include <string>
#include <variant>

namespace cotel::metrics {

namespace {

Error invalid_observation(const InstrumentDescriptor& descriptor, double value, const char* constraint)
{
    std::stringstream ss;
    ss << to_string(descriptor.kind) << " '" << descriptor.name << "' rejected " << value << ": " << constraint;
    return Error{ErrorCode::invalid_observation, ss.str()};
}

// series are keyed on the attribute mapping, which needs a strict weak ordering; NaN has none
const std::string* non_finite_attribute(const Attributes& attributes)
{
    for (const auto& [key, value] : attributes)
    {
        const auto* number = std::get_if<double>(&value);
        if (number != nullptr && !std::isfinite(*number))
        {
            return &key;
        }
    }
    return nullptr;
}

Error invalid_attribute(const InstrumentDescriptor& descriptor, const std::string& key)
{
    std::stringstream ss;
    ss << to_string(descriptor.kind) << " '" << descriptor.name << "' rejected attribute '" << key
       << "': attribute values must be finite";
    return Error{ErrorCode::invalid_observation, ss.str()};
}

}  // namespace

Counter::Counter(std::shared_ptr<const InstrumentDescriptor> descriptor,
                 std::shared_ptr<Aggregator> aggregator,
                 std::shared_ptr<Diagnostics> diagnostics) :
  m_descriptor(std::move(descriptor)),
  m_aggregator(std::move(aggregator)),
  m_diagnostics(std::move(diagnostics))
{}

Expected<> Counter::add(double value, Attributes attributes) const
{
    if (!std::isfinite(value) || value < 0)
    {
        return tl::make_unexpected(
            m_diagnostics->report(invalid_observation(*m_descriptor, value, "counters only accept finite values >= 0")));
    }

    if (const auto* key = non_finite_attribute(attributes); key != nullptr)
    {
        return tl::make_unexpected(m_diagnostics->report(invalid_attribute(*m_descriptor, *key)));
    }

    m_aggregator->record(MetricPoint{.instrument = m_descriptor,
                                     .value      = value,
                                     .attributes = std::move(attributes),
                                     .timestamp  = std::chrono::system_clock::now()});
    return {};
}

Histogram::Histogram(std::shared_ptr<const InstrumentDescriptor> descriptor,
                     std::shared_ptr<Aggregator> aggregator,
                     std::shared_ptr<Diagnostics> diagnostics) :
  m_descriptor(std::move(descriptor)),
  m_aggregator(std::move(aggregator)),
  m_diagnostics(std::move(diagnostics))
{}

Expected<> Histogram::record(double value, Attributes attributes) const
{
    if (!std::isfinite(value))
    {
        return tl::make_unexpected(
            m_diagnostics->report(invalid_observation(*m_descriptor, value, "histograms only accept finite values")));
    }

    if (const auto* key = non_finite_attribute(attributes); key != nullptr)
    {
        return tl::make_unexpected(m_diagnostics->report(invalid_attribute(*m_descriptor, *key)));
    }

    m_aggregator->record(MetricPoint{.instrument = m_descriptor,
                                     .value      = value,
                                     .attributes = std::move(attributes),
                                     .timestamp  = std::chrono::system_clock::now()});
    return {};
}

}  // namespace cotel::metrics
