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

#include "cotel/trace/batch_exporter.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <exception>
#include <sstream>
#include <string>
#include <utility>

namespace cotel::trace {

BatchExporter::BatchExporter(std::unique_ptr<SpanSink> sink, std::shared_ptr<Diagnostics> diagnostics) :
  BatchExporter(std::move(sink), std::move(diagnostics), Options{})
{}

BatchExporter::BatchExporter(std::unique_ptr<SpanSink> sink, std::shared_ptr<Diagnostics> diagnostics, Options options) :
  m_options(std::move(options)),
  m_sink(std::move(sink)),
  m_diagnostics(std::move(diagnostics))
{
    CHECK(m_sink) << "BatchExporter requires a sink";
    CHECK(m_diagnostics);
    CHECK_GT(m_options.max_queue_size, 0);
    CHECK_GT(m_options.max_export_batch_size, 0);
    CHECK_GT(m_options.max_export_attempts, 0);

    m_worker = std::jthread([this](std::stop_token stop_token) {
        worker(std::move(stop_token));
    });
}

BatchExporter::~BatchExporter()
{
    auto result = shutdown(m_options.shutdown_timeout);
    if (!result)
    {
        LOG(WARNING) << "batch exporter shutdown: " << result.error();
    }
}

void BatchExporter::submit(SpanData span)
{
    m_submitted.fetch_add(1, std::memory_order::relaxed);

    bool wake_worker = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!m_accepting)
        {
            m_dropped.fetch_add(1, std::memory_order::relaxed);
            m_diagnostics->add(ErrorCode::buffer_overflow, 1);
            m_diagnostics->report(
                Error{ErrorCode::usage_error, "span '" + span.name + "' submitted after the exporter was shut down"});
            return;
        }

        if (m_queue.size() >= m_options.max_queue_size)
        {
            m_queue.pop_front();
            m_dropped.fetch_add(1, std::memory_order::relaxed);
            m_diagnostics->report(Error{ErrorCode::buffer_overflow, "span buffer full, evicted the oldest span"});
        }

        m_queue.push_back(std::move(span));
        wake_worker = (m_queue.size() >= m_options.max_export_batch_size);
    }

    if (wake_worker)
    {
        m_work_cv.notify_one();
    }
}

Expected<> BatchExporter::flush(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);

    if (m_worker_stopped)
    {
        return cotel::unexpected(ErrorCode::usage_error, "flush called after the exporter was shut down");
    }

    const auto ticket = ++m_flush_requested;
    m_work_cv.notify_one();

    if (!m_flush_cv.wait_for(lock, timeout, [this, ticket] {
            return m_flush_completed >= ticket;
        }))
    {
        std::stringstream ss;
        ss << "flush did not complete within " << timeout.count() << "ms";
        return tl::make_unexpected(m_diagnostics->report(Error{ErrorCode::export_failure, ss.str()}));
    }

    return {};
}

Expected<> BatchExporter::shutdown(std::chrono::milliseconds timeout)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_accepting)
        {
            return {};
        }
    }

    auto flushed = flush(timeout);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_accepting = false;
    }

    m_worker.request_stop();
    if (m_worker.joinable())
    {
        m_worker.join();
    }

    std::uint64_t leftover = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_worker_stopped = true;
        leftover         = m_queue.size();
        m_queue.clear();
    }

    if (leftover > 0)
    {
        count_dropped(leftover, "still buffered at shutdown");
    }

    m_sink->shutdown();

    auto stats = this->stats();
    VLOG(1) << "batch exporter shut down: submitted=" << stats.submitted << " exported=" << stats.exported
            << " dropped=" << stats.dropped << " export_failures=" << stats.export_failures;

    return flushed;
}

BatchExporter::Stats BatchExporter::stats() const
{
    return Stats{.submitted       = m_submitted.load(std::memory_order::relaxed),
                 .exported        = m_exported.load(std::memory_order::relaxed),
                 .dropped         = m_dropped.load(std::memory_order::relaxed),
                 .export_failures = m_export_failures.load(std::memory_order::relaxed)};
}

void BatchExporter::worker(std::stop_token stop_token)
{
    std::unique_lock<std::mutex> lock(m_mutex);

    while (!stop_token.stop_requested())
    {
        m_work_cv.wait_for(lock, stop_token, m_options.schedule_delay, [this] {
            return m_queue.size() >= m_options.max_export_batch_size || m_flush_requested > m_flush_completed;
        });

        if (stop_token.stop_requested())
        {
            break;
        }

        const auto flush_target = m_flush_requested;

        export_buffered(lock, stop_token);

        if (flush_target > m_flush_completed)
        {
            m_flush_completed = flush_target;
            m_flush_cv.notify_all();
        }
    }

    // release flushes that raced with shutdown
    m_flush_completed = m_flush_requested;
    m_flush_cv.notify_all();
}

void BatchExporter::export_buffered(std::unique_lock<std::mutex>& lock, const std::stop_token& stop_token)
{
    // once stopped, whatever is left is accounted for by shutdown()
    while (!m_queue.empty() && !stop_token.stop_requested())
    {
        const auto count = std::min(m_queue.size(), m_options.max_export_batch_size);

        std::vector<SpanData> batch;
        batch.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            batch.push_back(std::move(m_queue.front()));
            m_queue.pop_front();
        }

        lock.unlock();
        export_with_retry(batch, stop_token);
        lock.lock();
    }
}

void BatchExporter::export_with_retry(const std::vector<SpanData>& batch, const std::stop_token& stop_token)
{
    auto backoff = m_options.initial_backoff;

    for (std::uint32_t attempt = 1; attempt <= m_options.max_export_attempts; ++attempt)
    {
        // shutdown bounds the export to the attempt already in flight
        if (attempt > 1 && stop_token.stop_requested())
        {
            count_dropped(batch.size(), "exporter stopped between export attempts");
            return;
        }

        Expected<> result;
        try
        {
            result = m_sink->export_batch(batch);
        } catch (const std::exception& e)
        {
            result = cotel::unexpected(ErrorCode::export_failure, std::string("span sink threw: ") + e.what());
        }

        if (result)
        {
            m_exported.fetch_add(batch.size(), std::memory_order::relaxed);
            DVLOG(10) << "exported batch of " << batch.size() << " spans";
            return;
        }

        m_export_failures.fetch_add(1, std::memory_order::relaxed);
        std::stringstream ss;
        ss << "export attempt " << attempt << "/" << m_options.max_export_attempts << " failed: "
           << result.error().message();
        m_diagnostics->report(Error{ErrorCode::export_failure, ss.str()});

        if (attempt < m_options.max_export_attempts)
        {
            std::unique_lock<std::mutex> backoff_lock(m_backoff_mutex);
            m_backoff_cv.wait_for(backoff_lock, stop_token, backoff, [] {
                return false;
            });
            backoff *= 2;
        }
    }

    count_dropped(batch.size(), "export attempts exhausted");
}

void BatchExporter::count_dropped(std::uint64_t count, const char* reason)
{
    m_dropped.fetch_add(count, std::memory_order::relaxed);
    m_diagnostics->add(ErrorCode::buffer_overflow, count);
    LOG(WARNING) << "dropped " << count << " spans: " << reason;
}

}  // namespace cotel::trace
