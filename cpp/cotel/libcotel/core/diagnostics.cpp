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

#include "cotel/diagnostics.hpp"

#include <glog/logging.h>

namespace cotel {

std::string_view to_string(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::usage_error:
        return "usage_error";
    case ErrorCode::invalid_observation:
        return "invalid_observation";
    case ErrorCode::export_failure:
        return "export_failure";
    case ErrorCode::buffer_overflow:
        return "buffer_overflow";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Error& error)
{
    return os << to_string(error.code()) << ": " << error.message();
}

const Error& Diagnostics::report(const Error& error)
{
    add(error.code(), 1);

    switch (error.code())
    {
    case ErrorCode::usage_error:
        LOG(WARNING) << error;
        break;
    case ErrorCode::invalid_observation:
        // returned to the caller as well, keep the log quiet
        VLOG(1) << error;
        break;
    case ErrorCode::export_failure:
        LOG(ERROR) << error;
        break;
    case ErrorCode::buffer_overflow:
        LOG_EVERY_N(WARNING, 1000) << error << " (" << google::COUNTER << " occurrences)";
        break;
    }

    return error;
}

void Diagnostics::add(ErrorCode code, std::uint64_t count)
{
    m_counts[static_cast<std::size_t>(code)].fetch_add(count, std::memory_order::relaxed);
}

std::uint64_t Diagnostics::count(ErrorCode code) const
{
    return m_counts[static_cast<std::size_t>(code)].load(std::memory_order::relaxed);
}

}  // namespace cotel
