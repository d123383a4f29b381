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
#include "cotel/expected.hpp"

#include <array>
#include <atomic>
#include <cstdint>

namespace cotel {

/**
 * @brief Sink for non-fatal telemetry diagnostics.
 *
 * Every telemetry-path error is absorbed here: it is logged via glog and counted per ErrorCode. One instance is
 * typically shared by the tracer provider, the exporter, the meter provider and the background bridge so the counts
 * describe the health of the whole pipeline.
 */
class Diagnostics final
{
  public:
    Diagnostics() = default;

    COTEL_DELETE_COPYABILITY(Diagnostics);
    COTEL_DELETE_MOVEABILITY(Diagnostics);

    // log and count the error; returns the error so call sites can `return unexpected(diagnostics.report(...))`
    const Error& report(const Error& error);

    // count `count` occurrences of `code` without logging each one
    void add(ErrorCode code, std::uint64_t count);

    std::uint64_t count(ErrorCode code) const;

  private:
    std::array<std::atomic<std::uint64_t>, kErrorCodeCount> m_counts{};
};

}  // namespace cotel
