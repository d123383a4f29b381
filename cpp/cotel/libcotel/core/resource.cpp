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

#include "cotel/resource.hpp"

#include <glog/logging.h>

#include <cstdlib>
#include <string_view>

namespace cotel {

namespace {

std::string_view trim(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
    {
        s.remove_suffix(1);
    }
    return s;
}

void parse_resource_attributes(std::string_view encoded, Attributes& attributes)
{
    while (!encoded.empty())
    {
        auto comma = encoded.find(',');
        auto pair  = encoded.substr(0, comma);
        encoded    = (comma == std::string_view::npos) ? std::string_view{} : encoded.substr(comma + 1);

        auto eq = pair.find('=');
        if (eq == std::string_view::npos)
        {
            LOG(WARNING) << "ignoring malformed OTEL_RESOURCE_ATTRIBUTES entry: " << pair;
            continue;
        }

        auto key   = trim(pair.substr(0, eq));
        auto value = trim(pair.substr(eq + 1));
        if (key.empty())
        {
            LOG(WARNING) << "ignoring OTEL_RESOURCE_ATTRIBUTES entry with an empty key";
            continue;
        }
        attributes[std::string(key)] = std::string(value);
    }
}

}  // namespace

Resource::Resource(Attributes attributes) : m_attributes(std::move(attributes))
{
    if (!m_attributes.contains(kServiceName))
    {
        m_attributes[kServiceName] = std::string("unknown_service");
    }
}

Resource Resource::create(Attributes attributes)
{
    return Resource{std::move(attributes)};
}

Resource Resource::from_environment(Attributes defaults)
{
    if (const char* encoded = std::getenv("OTEL_RESOURCE_ATTRIBUTES"); encoded != nullptr)
    {
        parse_resource_attributes(encoded, defaults);
    }

    if (const char* service_name = std::getenv("OTEL_SERVICE_NAME"); service_name != nullptr && *service_name != '\0')
    {
        defaults[kServiceName] = std::string(service_name);
    }

    return Resource{std::move(defaults)};
}

std::string Resource::service_name() const
{
    return to_string(m_attributes.at(kServiceName));
}

}  // namespace cotel
