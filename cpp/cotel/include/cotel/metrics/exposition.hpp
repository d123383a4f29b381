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
#include "cotel/metrics/aggregator.hpp"
#include "cotel/resource.hpp"

#include <string>
#include <string_view>

namespace cotel::metrics {

/**
 * @brief Prometheus text exposition (format 0.0.4) of a metrics snapshot.
 *
 * Metric and label names are sanitized (`.` and any other invalid character become `_`), counters get a `_total`
 * suffix and histograms are rendered as cumulative `_bucket{le=...}` series plus `_sum` and `_count`. The resource
 * is exposed as the labels of a `target_info` gauge.
 */
class PrometheusExposition
{
  public:
    static std::string render(const MetricsSnapshot& snapshot, const Resource& resource);

    static std::string sanitize_name(std::string_view name);

    static std::string escape_label_value(std::string_view value);

    // HELP text escapes backslash and line feed, quotes are kept
    static std::string escape_help_text(std::string_view text);

    static std::string format_value(double value);
};

}  // namespace cotel::metrics
