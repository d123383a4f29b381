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

#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <type_traits>
#include <variant>

namespace cotel {

/**
 * @brief Scalar attribute value attached to spans, metric points and the resource.
 */
using AttributeValue = std::variant<bool, std::int64_t, double, std::string>;  // NOLINT

/**
 * @brief Ordered attribute mapping. Ordering makes the mapping itself usable as the identity of a metric series: two
 * attribute sets are the same series if and only if they compare equal.
 */
using Attributes = std::map<std::string, AttributeValue>;  // NOLINT

// integral and string-like conversions so call sites can write {"item.id", 42} or {"route", "/items/{item_id}"}
template <typename T>
AttributeValue make_attribute(T&& value)
{
    using value_t = std::decay_t<T>;
    if constexpr (std::is_same_v<value_t, bool>)
    {
        return AttributeValue{value};
    }
    else if constexpr (std::is_integral_v<value_t>)
    {
        return AttributeValue{static_cast<std::int64_t>(value)};
    }
    else if constexpr (std::is_floating_point_v<value_t>)
    {
        return AttributeValue{static_cast<double>(value)};
    }
    else
    {
        return AttributeValue{std::string(std::forward<T>(value))};
    }
}

std::string to_string(const AttributeValue& value);

std::ostream& operator<<(std::ostream& os, const Attributes& attributes);

}  // namespace cotel
