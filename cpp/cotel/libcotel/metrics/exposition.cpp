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

#include "cotel/metrics/exposition.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <variant>

namespace cotel::metrics {

namespace {

void write_labels(std::ostream& os, const Attributes& attributes, std::string_view le = {})
{
    if (attributes.empty() && le.empty())
    {
        return;
    }

    os << "{";
    bool first = true;
    for (const auto& [key, value] : attributes)
    {
        os << (first ? "" : ",") << PrometheusExposition::sanitize_name(key) << "=\""
           << PrometheusExposition::escape_label_value(cotel::to_string(value)) << "\"";
        first = false;
    }
    if (!le.empty())
    {
        os << (first ? "" : ",") << "le=\"" << le << "\"";
    }
    os << "}";
}

void write_header(std::ostream& os, const std::string& name, const InstrumentDescriptor& instrument, const char* type)
{
    if (!instrument.description.empty())
    {
        os << "# HELP " << name << " " << PrometheusExposition::escape_help_text(instrument.description) << "\n";
    }
    os << "# TYPE " << name << " " << type << "\n";
}

}  // namespace

std::string PrometheusExposition::render(const MetricsSnapshot& snapshot, const Resource& resource)
{
    std::ostringstream os;

    os << "# HELP target_info Target metadata\n";
    os << "# TYPE target_info gauge\n";
    os << "target_info";
    write_labels(os, resource.attributes());
    os << " 1\n";

    // metrics are ordered by name, so every series of an instrument is contiguous
    const InstrumentDescriptor* current = nullptr;

    for (const auto& metric : snapshot.metrics)
    {
        auto name = sanitize_name(metric.name());

        if (const auto* sum = std::get_if<SumData>(&metric.data); sum != nullptr)
        {
            if (!name.ends_with("_total"))
            {
                name += "_total";
            }
            if (current != metric.instrument.get())
            {
                write_header(os, name, *metric.instrument, "counter");
                current = metric.instrument.get();
            }

            os << name;
            write_labels(os, metric.attributes);
            os << " " << format_value(sum->value) << "\n";
            continue;
        }

        const auto& histogram = std::get<HistogramData>(metric.data);
        const auto& bounds    = metric.instrument->boundaries;

        if (current != metric.instrument.get())
        {
            write_header(os, name, *metric.instrument, "histogram");
            current = metric.instrument.get();
        }

        std::uint64_t cumulative = 0;
        for (std::size_t i = 0; i < bounds.size(); ++i)
        {
            cumulative += histogram.bucket_counts[i];
            os << name << "_bucket";
            write_labels(os, metric.attributes, format_value(bounds[i]));
            os << " " << cumulative << "\n";
        }

        os << name << "_bucket";
        write_labels(os, metric.attributes, "+Inf");
        os << " " << histogram.count << "\n";

        os << name << "_sum";
        write_labels(os, metric.attributes);
        os << " " << format_value(histogram.sum) << "\n";

        os << name << "_count";
        write_labels(os, metric.attributes);
        os << " " << histogram.count << "\n";
    }

    return os.str();
}

std::string PrometheusExposition::sanitize_name(std::string_view name)
{
    std::string sanitized;
    sanitized.reserve(name.size() + 1);

    if (name.empty() || (name.front() >= '0' && name.front() <= '9'))
    {
        sanitized += '_';
    }

    for (char c : name)
    {
        const bool valid = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
                           c == ':';
        sanitized += valid ? c : '_';
    }

    return sanitized;
}

std::string PrometheusExposition::escape_label_value(std::string_view value)
{
    std::string escaped;
    escaped.reserve(value.size());

    for (char c : value)
    {
        switch (c)
        {
        case '\\':
            escaped += "\\\\";
            break;
        case '"':
            escaped += "\\\"";
            break;
        case '\n':
            escaped += "\\n";
            break;
        default:
            escaped += c;
        }
    }

    return escaped;
}

std::string PrometheusExposition::escape_help_text(std::string_view text)
{
    std::string escaped;
    escaped.reserve(text.size());

    for (char c : text)
    {
        switch (c)
        {
        case '\\':
            escaped += "\\\\";
            break;
        case '\n':
            escaped += "\\n";
            break;
        default:
            escaped += c;
        }
    }

    return escaped;
}

std::string PrometheusExposition::format_value(double value)
{
    if (std::isnan(value))
    {
        return "NaN";
    }
    if (std::isinf(value))
    {
        return value > 0 ? "+Inf" : "-Inf";
    }

    std::array<char, 32> buffer;
    // shortest representation that round-trips; 32 chars always fit a double
    auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    return {buffer.data(), result.ptr};
}

}  // namespace cotel::metrics
