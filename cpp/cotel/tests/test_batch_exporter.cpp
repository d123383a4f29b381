#include "test_telemetry.hpp"

#include "cotel/diagnostics.hpp"
#include "cotel/trace/batch_exporter.hpp"
#include "cotel/trace/span_sink.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cotel;
using namespace std::chrono_literals;

namespace {

class ThrowingSink final : public trace::SpanSink
{
  public:
    Expected<> export_batch(const std::vector<trace::SpanData>& /*batch*/) final
    {
        throw std::runtime_error("connection refused");
    }
};

std::vector<std::string> names(const std::vector<trace::SpanData>& spans)
{
    std::vector<std::string> result;
    for (const auto& span : spans)
    {
        result.push_back(span.name);
    }
    return result;
}

}  // namespace

class BatchExporter : public ::testing::Test
{
  protected:
    std::unique_ptr<trace::BatchExporter> make_exporter(trace::BatchExporter::Options options)
    {
        return std::make_unique<trace::BatchExporter>(
            std::make_unique<tests::CollectingSink>(m_storage), m_diagnostics, options);
    }

    std::shared_ptr<tests::SpanStorage> m_storage{std::make_shared<tests::SpanStorage>()};
    std::shared_ptr<Diagnostics> m_diagnostics{std::make_shared<Diagnostics>()};
};

TEST_F(BatchExporter, FlushExportsEverythingBuffered)
{
    auto exporter = make_exporter({.schedule_delay = 10s});

    for (int i = 0; i < 5; ++i)
    {
        exporter->submit(tests::make_span_data("span." + std::to_string(i)));
    }
    EXPECT_TRUE(m_storage->snapshot().empty());

    EXPECT_TRUE(exporter->flush(5s));
    EXPECT_EQ(names(m_storage->snapshot()),
              (std::vector<std::string>{"span.0", "span.1", "span.2", "span.3", "span.4"}));

    auto stats = exporter->stats();
    EXPECT_EQ(stats.submitted, 5);
    EXPECT_EQ(stats.exported, 5);
    EXPECT_EQ(stats.dropped, 0);
}

TEST_F(BatchExporter, FullBatchExportsWithoutFlush)
{
    auto exporter = make_exporter({.max_export_batch_size = 4, .schedule_delay = 10s});

    for (int i = 0; i < 4; ++i)
    {
        exporter->submit(tests::make_span_data("batched"));
    }

    EXPECT_TRUE(m_storage->wait_for_count(4, 2s));
}

TEST_F(BatchExporter, ScheduleDelayExportsPartialBatch)
{
    auto exporter = make_exporter({.schedule_delay = 20ms});

    exporter->submit(tests::make_span_data("lonely"));

    EXPECT_TRUE(m_storage->wait_for_count(1, 2s));
}

TEST_F(BatchExporter, FullQueueEvictsOldest)
{
    auto exporter = make_exporter({.max_queue_size = 3, .max_export_batch_size = 100, .schedule_delay = 10s});

    for (const auto* name : {"a", "b", "c", "d", "e"})
    {
        exporter->submit(tests::make_span_data(name));
    }

    EXPECT_TRUE(exporter->flush(5s));
    EXPECT_EQ(names(m_storage->snapshot()), (std::vector<std::string>{"c", "d", "e"}));

    EXPECT_EQ(exporter->stats().dropped, 2);
    EXPECT_EQ(m_diagnostics->count(ErrorCode::buffer_overflow), 2);
}

TEST_F(BatchExporter, RetriesUntilSinkRecovers)
{
    m_storage->fail_next = 2;
    auto exporter = make_exporter({.schedule_delay = 10s, .max_export_attempts = 3, .initial_backoff = 1ms});

    exporter->submit(tests::make_span_data("retried"));
    EXPECT_TRUE(exporter->flush(5s));

    EXPECT_EQ(m_storage->snapshot().size(), 1U);
    EXPECT_EQ(m_storage->calls, 3U);

    auto stats = exporter->stats();
    EXPECT_EQ(stats.exported, 1);
    EXPECT_EQ(stats.export_failures, 2);
    EXPECT_EQ(stats.dropped, 0);
    EXPECT_EQ(m_diagnostics->count(ErrorCode::export_failure), 2);
}

TEST_F(BatchExporter, DropsBatchWhenAttemptsAreExhausted)
{
    m_storage->fail_next = 10;
    auto exporter = make_exporter({.schedule_delay = 10s, .max_export_attempts = 3, .initial_backoff = 1ms});

    exporter->submit(tests::make_span_data("lost.0"));
    exporter->submit(tests::make_span_data("lost.1"));

    // a flush completes once the batch has been handled, exported or not
    EXPECT_TRUE(exporter->flush(5s));

    EXPECT_TRUE(m_storage->snapshot().empty());
    EXPECT_EQ(m_storage->calls, 3U);

    auto stats = exporter->stats();
    EXPECT_EQ(stats.exported, 0);
    EXPECT_EQ(stats.export_failures, 3);
    EXPECT_EQ(stats.dropped, 2);
    EXPECT_EQ(m_diagnostics->count(ErrorCode::export_failure), 3);
    EXPECT_EQ(m_diagnostics->count(ErrorCode::buffer_overflow), 2);
}

TEST_F(BatchExporter, ThrowingSinkIsAbsorbed)
{
    trace::BatchExporter exporter(std::make_unique<ThrowingSink>(),
                                  m_diagnostics,
                                  {.schedule_delay = 10s, .max_export_attempts = 2, .initial_backoff = 1ms});

    exporter.submit(tests::make_span_data("thrown"));
    EXPECT_TRUE(exporter.flush(5s));

    auto stats = exporter.stats();
    EXPECT_EQ(stats.export_failures, 2);
    EXPECT_EQ(stats.dropped, 1);
}

TEST_F(BatchExporter, ShutdownDropsWhatItCannotExport)
{
    constexpr int kSpans = 10;

    m_storage->delay = 50ms;
    auto exporter    = make_exporter({.max_export_batch_size = 1, .schedule_delay = 10s});

    for (int i = 0; i < kSpans; ++i)
    {
        exporter->submit(tests::make_span_data("slow"));
    }

    auto result = exporter->shutdown(20ms);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::export_failure);

    auto stats = exporter->stats();
    EXPECT_GT(stats.dropped, 0);
    EXPECT_EQ(stats.exported + stats.dropped, kSpans);
    EXPECT_EQ(m_storage->snapshot().size(), stats.exported);
}

TEST_F(BatchExporter, ShutdownStopsRetryingAfterTheAttemptInFlight)
{
    m_storage->delay     = 500ms;
    m_storage->fail_next = 10;
    auto exporter        = make_exporter({.schedule_delay = 10s, .max_export_attempts = 3, .initial_backoff = 1ms});

    exporter->submit(tests::make_span_data("unreachable"));

    const auto started = std::chrono::steady_clock::now();
    auto result        = exporter->shutdown(20ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::export_failure);

    // one slow attempt at most, never the full 3 x 500ms
    EXPECT_LT(elapsed, 1200ms);

    auto stats = exporter->stats();
    EXPECT_EQ(stats.exported, 0);
    EXPECT_EQ(stats.dropped, 1);
    EXPECT_LE(stats.export_failures, 1);
    EXPECT_TRUE(m_storage->snapshot().empty());
}

TEST_F(BatchExporter, SubmitAfterShutdownIsDropped)
{
    auto exporter = make_exporter({.schedule_delay = 10s});

    exporter->submit(tests::make_span_data("before"));
    EXPECT_TRUE(exporter->shutdown(5s));
    EXPECT_EQ(m_storage->snapshot().size(), 1U);

    exporter->submit(tests::make_span_data("after"));

    EXPECT_EQ(exporter->stats().dropped, 1);
    EXPECT_EQ(m_diagnostics->count(ErrorCode::usage_error), 1);
    EXPECT_EQ(m_diagnostics->count(ErrorCode::buffer_overflow), 1);

    auto flushed = exporter->flush(1s);
    ASSERT_FALSE(flushed);
    EXPECT_EQ(flushed.error().code(), ErrorCode::usage_error);

    // shutting down again is a no-op
    EXPECT_TRUE(exporter->shutdown(1s));
    EXPECT_EQ(m_storage->snapshot().size(), 1U);
}
