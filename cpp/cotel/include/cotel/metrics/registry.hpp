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

#include "cotel/common/macros.hpp"
#include "cotel/diagnostics.hpp"
#include "cotel/expected.hpp"
#include "cotel/metrics/instrument.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace cotel::metrics {

/**
 * @brief Append-only set of instruments keyed by name.
 *
 * Registering a name a second time with the same kind returns the instrument registered first; registering it with
 * a different kind is a usage_error. Instruments are never removed.
 */
class InstrumentRegistry final
{
  public:
    explicit InstrumentRegistry(std::shared_ptr<Diagnostics> diagnostics);

    COTEL_DELETE_COPYABILITY(InstrumentRegistry);
    COTEL_DELETE_MOVEABILITY(InstrumentRegistry);

    Expected<std::shared_ptr<const InstrumentDescriptor>> register_instrument(InstrumentDescriptor descriptor);

    std::shared_ptr<const InstrumentDescriptor> find(std::string_view name) const;

    std::vector<std::shared_ptr<const InstrumentDescriptor>> instruments() const;

  private:
    Expected<> validate(const InstrumentDescriptor& descriptor) const;

    std::shared_ptr<Diagnostics> m_diagnostics;

    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<const InstrumentDescriptor>, std::less<>> m_instruments;
};

}  // namespace cotel::metrics
