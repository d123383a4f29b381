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
#include "cotel/trace/span.hpp"
#include "cotel/trace/span_sink.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace cotel::trace {

/**
 * @brief Buffers finished spans and exports them in batches from a dedicated worker thread.
 *
 * submit() never blocks beyond the buffer lock: when the buffer is full the oldest span is evicted and counted as
 * dropped. The worker exports every `schedule_delay`, or as soon as `max_export_batch_size` spans are buffered,
 * whichever happens first. A failed batch is retried with exponential backoff and dropped after
 * `max_export_attempts`.
 */
class BatchExporter final
{
  public:
    struct Options
    {
        std::size_t max_queue_size = 2048;
        std::size_t max_export_batch_size = 512;
        std::chrono::milliseconds schedule_delay{5000};
        std::uint32_t max_export_attempts = 3;
        std::chrono::milliseconds initial_backoff{100};
        /// bound of the final flush performed by the destructor
        std::chrono::milliseconds shutdown_timeout{5000};
    };

    struct Stats
    {
        std::uint64_t submitted{0};
        std::uint64_t exported{0};
        std::uint64_t dropped{0};
        std::uint64_t export_failures{0};
    };

    BatchExporter(std::unique_ptr<SpanSink> sink, std::shared_ptr<Diagnostics> diagnostics);
    BatchExporter(std::unique_ptr<SpanSink> sink, std::shared_ptr<Diagnostics> diagnostics, Options options);
    ~BatchExporter();

    COTEL_DELETE_COPYABILITY(BatchExporter);
    COTEL_DELETE_MOVEABILITY(BatchExporter);

    void submit(SpanData span);

    /**
     * @brief Exports everything submitted before the call, waiting up to `timeout` for the worker to finish.
     */
    Expected<> flush(std::chrono::milliseconds timeout);

    /**
     * @brief Final flush bounded by `timeout`, then stops the worker and shuts the sink down. Spans still buffered
     * afterwards, and spans submitted later, are counted as dropped.
     */
    Expected<> shutdown(std::chrono::milliseconds timeout);

    Stats stats() const;

    const Options& options() const
    {
        return m_options;
    }

  private:
    void worker(std::stop_token stop_token);

    // exports everything buffered; called by the worker with `lock` held, the lock is released around the sink
    void export_buffered(std::unique_lock<std::mutex>& lock, const std::stop_token& stop_token);

    void export_with_retry(const std::vector<SpanData>& batch, const std::stop_token& stop_token);

    void count_dropped(std::uint64_t count, const char* reason);

    const Options m_options;
    std::unique_ptr<SpanSink> m_sink;
    std::shared_ptr<Diagnostics> m_diagnostics;

    mutable std::mutex m_mutex;
    std::condition_variable_any m_work_cv;
    std::condition_variable m_flush_cv;
    std::deque<SpanData> m_queue;
    std::uint64_t m_flush_requested{0};
    std::uint64_t m_flush_completed{0};
    bool m_accepting{true};
    bool m_worker_stopped{false};

    // interrupts retry backoff on shutdown
    std::mutex m_backoff_mutex;
    std::condition_variable_any m_backoff_cv;

    std::atomic<std::uint64_t> m_submitted{0};
    std::atomic<std::uint64_t> m_exported{0};
    std::atomic<std::uint64_t> m_dropped{0};
    std::atomic<std::uint64_t> m_export_failures{0};

    std::jthread m_worker;
};

}  // namespace cotel::trace
