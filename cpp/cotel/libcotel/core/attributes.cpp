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

#include "cotel/attributes.hpp"

#include <sstream>

namespace cotel {

std::string to_string(const AttributeValue& value)
{
    return std::visit(
        [](const auto& v) -> std::string {
            using value_t = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<value_t, std::string>)
            {
                return v;
            }
            else if constexpr (std::is_same_v<value_t, bool>)
            {
                return v ? "true" : "false";
            }
            else
            {
                std::stringstream ss;
                ss << v;
                return ss.str();
            }
        },
        value);
}

std::ostream& operator<<(std::ostream& os, const Attributes& attributes)
{
    os << "{";
    bool first = true;
    for (const auto& [key, value] : attributes)
    {
        os << (first ? "" : ", ") << key << "=" << to_string(value);
        first = false;
    }
    return os << "}";
}

}  // namespace cotel
