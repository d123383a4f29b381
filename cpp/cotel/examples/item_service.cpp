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

// Item service: request handlers instrumented with cotel, in a "slow" variant with the bottlenecks in place and a
// "fast" variant with them removed.
//
//   item_service [slow|fast] [requests]
//
// Spans are exported over OTLP/HTTP when OTEL_EXPORTER_OTLP_TRACES_ENDPOINT is set, to the log otherwise. The
// Prometheus exposition of the request and background job histograms is printed on exit.

#include "cotel/background/task_bridge.hpp"
#include "cotel/coro/sync_wait.hpp"
#include "cotel/coro/task.hpp"
#include "cotel/coro/thread_pool.hpp"
#include "cotel/coro/when_all.hpp"
#include "cotel/diagnostics.hpp"
#include "cotel/metrics/meter.hpp"
#include "cotel/resource.hpp"
#include "cotel/trace/batch_exporter.hpp"
#include "cotel/trace/propagation.hpp"
#include "cotel/trace/span_sink.hpp"
#include "cotel/trace/tracer.hpp"

#include <glog/logging.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace cotel;

namespace {

struct Mode
{
    std::string name;
    std::chrono::milliseconds db_delay;
    bool offload_cpu_work;
    std::int64_t cpu_iterations;
    std::chrono::milliseconds post_processing_delay;
    std::chrono::milliseconds job_duration;
    std::string job_type;
};

const Mode kSlow{.name                  = "bottlenecks",
                 .db_delay              = 400ms,
                 .offload_cpu_work      = false,
                 .cpu_iterations        = 7'000'000,
                 .post_processing_delay = 100ms,
                 .job_duration          = 1200ms,
                 .job_type              = "slow"};

const Mode kFast{.name                  = "optimized",
                 .db_delay              = 80ms,
                 .offload_cpu_work      = true,
                 .cpu_iterations        = 7'000'000,
                 .post_processing_delay = 20ms,
                 .job_duration          = 200ms,
                 .job_type              = "fast"};

double to_ms(std::chrono::steady_clock::duration duration)
{
    return std::chrono::duration<double, std::milli>(duration).count();
}

std::int64_t cpu_work(std::int64_t iterations)
{
    std::int64_t total = 0;
    for (std::int64_t i = 0; i < iterations; ++i)
    {
        total += i ^ (total >> 7);
    }
    return total;
}

class ItemService
{
  public:
    ItemService(Mode mode,
                std::shared_ptr<trace::Tracer> tracer,
                metrics::Histogram request_duration,
                metrics::Histogram job_duration,
                coro::ThreadPool& io,
                coro::ThreadPool& cpu,
                background::TaskBridge& bridge) :
      m_mode(std::move(mode)),
      m_tracer(std::move(tracer)),
      m_request_duration(std::move(request_duration)),
      m_job_duration(std::move(job_duration)),
      m_io(io),
      m_cpu(cpu),
      m_bridge(bridge)
    {}

    // GET /items/{item_id}
    coro::Task<std::string> get_item(std::int64_t item_id)
    {
        auto span = m_tracer->start_span("handler.get_item", {{"item.id", item_id}});

        co_await db_query();

        if (m_mode.offload_cpu_work)
        {
            co_await cpu_work_offloaded();
        }
        else
        {
            cpu_work_blocking();
        }

        {
            auto post_processing = m_tracer->start_span("post.processing");
            co_await m_io.schedule_after(m_mode.post_processing_delay);
        }

        span.end();
        record(m_request_duration, span.span().elapsed(), {{"route", "/items/{item_id}"}});

        std::stringstream ss;
        ss << R"({"item_id": )" << item_id << R"(, "status": "ok", "mode": ")" << m_mode.name << R"("})";
        co_return ss.str();
    }

    // POST /process/{task_id}
    std::string process(const std::string& task_id)
    {
        auto span = m_tracer->start_span("handler.process", {{"task.id", task_id}});

        m_bridge.enqueue(trace::detach(), [this, task_id] {
            background_job(task_id);
        });

        std::stringstream ss;
        ss << R"({"status": "queued", "task_id": ")" << task_id << R"(", "mode": ")" << m_mode.name << R"("})";
        return ss.str();
    }

  private:
    coro::Task<void> db_query()
    {
        auto span = m_tracer->start_span("db.query");
        co_await m_io.schedule_after(m_mode.db_delay);
    }

    void cpu_work_blocking()
    {
        auto span = m_tracer->start_span("cpu.work.blocking");
        span->set_attribute("cpu.result", cpu_work(m_mode.cpu_iterations)).or_else([](const Error& error) {
            LOG(WARNING) << error;
        });
    }

    coro::Task<void> cpu_work_offloaded()
    {
        auto span = m_tracer->start_span("cpu.work.offloaded");

        co_await m_cpu.schedule();
        {
            auto work = m_tracer->start_span("cpu.work");
            work->set_attribute("cpu.result", cpu_work(m_mode.cpu_iterations)).or_else([](const Error& error) {
                LOG(WARNING) << error;
            });
        }
        co_await m_io.schedule();
    }

    void background_job(const std::string& task_id)
    {
        auto span = m_tracer->start_span("background.job", {{"task.id", task_id}});
        std::this_thread::sleep_for(m_mode.job_duration);
        span.end();

        record(m_job_duration, span.span().elapsed(), {{"task.type", m_mode.job_type}});
    }

    static void record(const metrics::Histogram& histogram,
                       std::chrono::steady_clock::duration duration,
                       Attributes attributes)
    {
        histogram.record(to_ms(duration), std::move(attributes)).or_else([](const Error& error) {
            LOG(WARNING) << error;
        });
    }

    Mode m_mode;
    std::shared_ptr<trace::Tracer> m_tracer;
    metrics::Histogram m_request_duration;
    metrics::Histogram m_job_duration;
    coro::ThreadPool& m_io;
    coro::ThreadPool& m_cpu;
    background::TaskBridge& m_bridge;
};

coro::Task<void> serve_item(ItemService& service, coro::ThreadPool& io, std::int64_t item_id)
{
    co_await io.schedule();
    auto response = co_await service.get_item(item_id);
    LOG(INFO) << "GET /items/" << item_id << " -> " << response;
}

std::unique_ptr<trace::SpanSink> make_sink(const Resource& resource)
{
    const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
    if (endpoint == nullptr || *endpoint == '\0')
    {
        LOG(INFO) << "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT not set, logging spans";
        return std::make_unique<trace::LogSpanSink>();
    }

    opentelemetry::exporter::otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    LOG(INFO) << "exporting spans to " << options.url;

    return std::make_unique<trace::OtelSpanSink>(
        std::make_unique<opentelemetry::exporter::otlp::OtlpHttpExporter>(options), resource);
}

}  // namespace

int main(int argc, char* argv[])
{
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    const std::string mode_name = (argc > 1) ? argv[1] : "slow";
    if (mode_name != "slow" && mode_name != "fast")
    {
        std::cerr << "usage: " << argv[0] << " [slow|fast] [requests]" << std::endl;
        return EXIT_FAILURE;
    }
    const auto& mode = (mode_name == "slow") ? kSlow : kFast;
    const int requests = (argc > 2) ? std::atoi(argv[2]) : 4;

    auto resource = Resource::from_environment({{Resource::kServiceName, "item-service-" + mode_name},
                                                {Resource::kServiceVersion, "0.1.0"},
                                                {Resource::kDeploymentEnvironment, "dev"}});

    auto diagnostics = std::make_shared<Diagnostics>();

    auto exporter = std::make_shared<trace::BatchExporter>(
        make_sink(resource), diagnostics, trace::BatchExporter::Options{.schedule_delay = 1000ms});
    trace::TracerProvider tracer_provider(resource, exporter, diagnostics);
    metrics::MeterProvider meter_provider(resource, diagnostics);

    auto meter            = meter_provider.get_meter("item_service");
    auto request_duration = meter->create_histogram(
        "http.server.request_duration", "ms", "End-to-end request duration measured in handler");
    auto job_duration = meter->create_histogram("background.job.duration", "ms", "Background job duration");
    if (!request_duration || !job_duration)
    {
        LOG(ERROR) << "unable to create instruments";
        return EXIT_FAILURE;
    }

    coro::ThreadPool io(coro::ThreadPool::Options{.thread_count = 2, .description = "io"});
    coro::ThreadPool cpu(coro::ThreadPool::Options{.thread_count = 2, .description = "cpu"});
    background::TaskBridge bridge;

    ItemService service(mode,
                        tracer_provider.get_tracer("item_service", "0.1.0"),
                        *request_duration,
                        *job_duration,
                        io,
                        cpu,
                        bridge);

    std::vector<coro::Task<void>> calls;
    for (int i = 0; i < requests; ++i)
    {
        calls.push_back(serve_item(service, io, i + 1));
    }
    coro::sync_wait(coro::when_all(std::move(calls)));

    for (int i = 0; i < requests; ++i)
    {
        LOG(INFO) << "POST /process/task-" << i << " -> " << service.process("task-" + std::to_string(i));
    }

    bridge.drain();

    auto flushed = tracer_provider.force_flush(5s);
    if (!flushed)
    {
        LOG(WARNING) << "span flush: " << flushed.error();
    }

    std::cout << meter_provider.scrape();

    auto stats = exporter->stats();
    LOG(INFO) << "spans submitted=" << stats.submitted << " exported=" << stats.exported
              << " dropped=" << stats.dropped << " export_failures=" << stats.export_failures;

    return EXIT_SUCCESS;
}
