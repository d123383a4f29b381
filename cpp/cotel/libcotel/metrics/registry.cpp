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

#include "cotel/metrics/registry.hpp"

#include <glog/logging.h>

#include <cmath>
#include <sstream>

namespace cotel::metrics {

std::string_view to_string(InstrumentKind kind)
{
    switch (kind)
    {
    case InstrumentKind::counter:
        return "counter";
    case InstrumentKind::histogram:
        return "histogram";
    }
    return "unknown";
}

const std::vector<double>& default_histogram_boundaries()
{
    static const std::vector<double> boundaries{
        0, 5, 10, 25, 50, 75, 100, 250, 500, 750, 1000, 2500, 5000, 7500, 10000};
    return boundaries;
}

InstrumentRegistry::InstrumentRegistry(std::shared_ptr<Diagnostics> diagnostics) :
  m_diagnostics(std::move(diagnostics))
{
    CHECK(m_diagnostics);
}

Expected<std::shared_ptr<const InstrumentDescriptor>> InstrumentRegistry::register_instrument(
    InstrumentDescriptor descriptor)
{
    auto valid = validate(descriptor);
    if (!valid)
    {
        return tl::make_unexpected(valid.error());
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    auto found = m_instruments.find(descriptor.name);
    if (found != m_instruments.end())
    {
        const auto& existing = found->second;
        if (existing->kind != descriptor.kind)
        {
            std::stringstream ss;
            ss << "instrument '" << descriptor.name << "' is already registered as a " << to_string(existing->kind)
               << ", cannot register it as a " << to_string(descriptor.kind);
            return tl::make_unexpected(m_diagnostics->report(Error{ErrorCode::usage_error, ss.str()}));
        }

        if (existing->boundaries != descriptor.boundaries || existing->unit != descriptor.unit)
        {
            VLOG(1) << "instrument '" << descriptor.name
                    << "' re-registered with a different unit or boundaries, keeping the first registration";
        }

        return existing;
    }

    auto registered = std::make_shared<const InstrumentDescriptor>(std::move(descriptor));
    m_instruments.emplace(registered->name, registered);
    VLOG(1) << "registered " << to_string(registered->kind) << " '" << registered->name << "'";
    return registered;
}

std::shared_ptr<const InstrumentDescriptor> InstrumentRegistry::find(std::string_view name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto found = m_instruments.find(name);
    if (found == m_instruments.end())
    {
        return nullptr;
    }
    return found->second;
}

std::vector<std::shared_ptr<const InstrumentDescriptor>> InstrumentRegistry::instruments() const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<std::shared_ptr<const InstrumentDescriptor>> instruments;
    instruments.reserve(m_instruments.size());
    for (const auto& [name, instrument] : m_instruments)
    {
        instruments.push_back(instrument);
    }
    return instruments;
}

Expected<> InstrumentRegistry::validate(const InstrumentDescriptor& descriptor) const
{
    if (descriptor.name.empty())
    {
        return tl::make_unexpected(m_diagnostics->report(Error{ErrorCode::usage_error, "instrument name is empty"}));
    }

    if (descriptor.kind == InstrumentKind::counter && !descriptor.boundaries.empty())
    {
        return tl::make_unexpected(m_diagnostics->report(
            Error{ErrorCode::usage_error, "counter '" + descriptor.name + "' cannot have bucket boundaries"}));
    }

    for (std::size_t i = 0; i < descriptor.boundaries.size(); ++i)
    {
        const auto boundary = descriptor.boundaries[i];
        if (!std::isfinite(boundary) || (i > 0 && boundary <= descriptor.boundaries[i - 1]))
        {
            return tl::make_unexpected(m_diagnostics->report(
                Error{ErrorCode::usage_error,
                      "histogram '" + descriptor.name + "' boundaries must be finite and strictly increasing"}));
        }
    }

    return {};
}

}  // namespace cotel::metrics
