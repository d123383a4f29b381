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

#include <string>

namespace cotel {

/**
 * @brief Static identity of the process emitting telemetry.
 *
 * A Resource is built once at process start and is immutable afterwards. It is attached to every exported span and
 * to every metrics exposition.
 */
class Resource final
{
  public:
    static constexpr auto kServiceName           = "service.name";
    static constexpr auto kServiceVersion        = "service.version";
    static constexpr auto kDeploymentEnvironment = "deployment.environment";

    /**
     * @brief Build a resource from explicit attributes; `service.name` defaults to "unknown_service" when absent.
     */
    static Resource create(Attributes attributes);

    /**
     * @brief Build a resource from `defaults` overlaid with `OTEL_RESOURCE_ATTRIBUTES` (k=v,k=v) and
     * `OTEL_SERVICE_NAME`, in increasing order of precedence.
     */
    static Resource from_environment(Attributes defaults = {});

    const Attributes& attributes() const
    {
        return m_attributes;
    }

    std::string service_name() const;

  private:
    explicit Resource(Attributes attributes);

    Attributes m_attributes;
};

}  // namespace cotel
