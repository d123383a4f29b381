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

#include <tl/expected.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace cotel {

/**
 * @brief Classes of telemetry-path failures. None of these are ever raised into application code; they are returned
 * to the call site that caused them and counted by cotel::Diagnostics.
 */
enum class ErrorCode : std::uint8_t
{
    /// api misuse, e.g. ending a span twice or re-registering an instrument with a different kind
    usage_error = 0,
    /// a metric value that violates the instrument's constraint
    invalid_observation,
    /// the exporter sink failed or rejected a batch
    export_failure,
    /// a bounded buffer evicted its oldest entry
    buffer_overflow,
};

inline constexpr std::size_t kErrorCodeCount = 4;

std::string_view to_string(ErrorCode code);

class Error final
{
  public:
    Error(ErrorCode code, std::string message) : m_code(code), m_message(std::move(message)) {}

    ErrorCode code() const
    {
        return m_code;
    }

    const std::string& message() const
    {
        return m_message;
    }

  private:
    ErrorCode m_code;
    std::string m_message;
};

std::ostream& operator<<(std::ostream& os, const Error& error);

struct Success
{};

template <typename T = Success>
using Expected = tl::expected<T, Error>;  // NOLINT

inline auto unexpected(ErrorCode code, std::string message)
{
    return tl::make_unexpected(Error{code, std::move(message)});
}

}  // namespace cotel
