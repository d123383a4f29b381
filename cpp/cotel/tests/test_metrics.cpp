#include "cotel/diagnostics.hpp"
#include "cotel/metrics/aggregator.hpp"
#include "cotel/metrics/instrument.hpp"
#include "cotel/metrics/meter.hpp"
#include "cotel/metrics/registry.hpp"
#include "cotel/resource.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace cotel;
using namespace std::chrono_literals;

class Metrics : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        m_diagnostics = std::make_shared<Diagnostics>();
        m_provider    = std::make_unique<metrics::MeterProvider>(
            Resource::create({{Resource::kServiceName, "cotel-test"}}), m_diagnostics);
        m_meter = m_provider->get_meter("cotel.test");
    }

    static const metrics::SumData& sum_of(const metrics::AggregatedMetric* metric)
    {
        return std::get<metrics::SumData>(metric->data);
    }

    static const metrics::HistogramData& histogram_of(const metrics::AggregatedMetric* metric)
    {
        return std::get<metrics::HistogramData>(metric->data);
    }

    std::shared_ptr<Diagnostics> m_diagnostics;
    std::unique_ptr<metrics::MeterProvider> m_provider;
    std::shared_ptr<metrics::Meter> m_meter;
};

TEST_F(Metrics, CounterSumsPerAttributeSet)
{
    auto requests = m_meter->create_counter("http.server.requests", "1", "Handled requests");
    ASSERT_TRUE(requests);

    EXPECT_TRUE(requests->add(1, {{"route", std::string("/items")}}));
    EXPECT_TRUE(requests->add(2, {{"route", std::string("/items")}}));
    EXPECT_TRUE(requests->add(5, {{"route", std::string("/process")}}));
    EXPECT_TRUE(requests->add(0.5));

    auto snapshot = m_provider->collect();
    ASSERT_EQ(snapshot->find_all("http.server.requests").size(), 3U);

    const auto* items = snapshot->find("http.server.requests", {{"route", std::string("/items")}});
    ASSERT_NE(items, nullptr);
    EXPECT_DOUBLE_EQ(sum_of(items).value, 3);

    const auto* process = snapshot->find("http.server.requests", {{"route", std::string("/process")}});
    ASSERT_NE(process, nullptr);
    EXPECT_DOUBLE_EQ(sum_of(process).value, 5);

    const auto* bare = snapshot->find("http.server.requests", {});
    ASSERT_NE(bare, nullptr);
    EXPECT_DOUBLE_EQ(sum_of(bare).value, 0.5);
}

TEST_F(Metrics, InvalidObservationsAreRejected)
{
    auto counter   = m_meter->create_counter("jobs.completed");
    auto histogram = m_meter->create_histogram("jobs.duration", "ms");
    ASSERT_TRUE(counter);
    ASSERT_TRUE(histogram);

    EXPECT_TRUE(counter->add(4));
    EXPECT_TRUE(histogram->record(10));

    auto negative = counter->add(-1);
    ASSERT_FALSE(negative);
    EXPECT_EQ(negative.error().code(), ErrorCode::invalid_observation);

    EXPECT_FALSE(counter->add(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_FALSE(counter->add(std::numeric_limits<double>::infinity()));
    EXPECT_FALSE(histogram->record(std::numeric_limits<double>::quiet_NaN()));

    // negative values are valid histogram observations
    EXPECT_TRUE(histogram->record(-3));

    EXPECT_EQ(m_diagnostics->count(ErrorCode::invalid_observation), 4);

    auto snapshot = m_provider->collect();
    EXPECT_DOUBLE_EQ(sum_of(snapshot->find("jobs.completed", {})).value, 4);
    EXPECT_EQ(histogram_of(snapshot->find("jobs.duration", {})).count, 2);
}

TEST_F(Metrics, NonFiniteAttributeValuesAreRejected)
{
    auto counter   = m_meter->create_counter("cache.lookups");
    auto histogram = m_meter->create_histogram("cache.latency", "ms");
    ASSERT_TRUE(counter);
    ASSERT_TRUE(histogram);

    EXPECT_TRUE(counter->add(1, {{"ratio", 1.0}}));
    auto nan_ratio = counter->add(10, {{"ratio", std::numeric_limits<double>::quiet_NaN()}});
    ASSERT_FALSE(nan_ratio);
    EXPECT_EQ(nan_ratio.error().code(), ErrorCode::invalid_observation);
    EXPECT_TRUE(counter->add(100, {{"ratio", 2.0}}));

    EXPECT_FALSE(histogram->record(5, {{"ratio", std::numeric_limits<double>::infinity()}}));
    EXPECT_EQ(m_diagnostics->count(ErrorCode::invalid_observation), 2);

    auto snapshot = m_provider->collect();
    EXPECT_EQ(snapshot->find_all("cache.lookups").size(), 2U);
    const auto* one = snapshot->find("cache.lookups", {{"ratio", 1.0}});
    const auto* two = snapshot->find("cache.lookups", {{"ratio", 2.0}});
    ASSERT_NE(one, nullptr);
    ASSERT_NE(two, nullptr);
    EXPECT_DOUBLE_EQ(sum_of(one).value, 1);
    EXPECT_DOUBLE_EQ(sum_of(two).value, 100);
    EXPECT_TRUE(snapshot->find_all("cache.latency").empty());
}

TEST_F(Metrics, BackgroundJobDurations)
{
    auto durations = m_meter->create_histogram("background.job.duration", "ms", "Background job duration");
    ASSERT_TRUE(durations);

    for (int i = 0; i < 3; ++i)
    {
        EXPECT_TRUE(durations->record(1200, {{"task.type", std::string("slow")}}));
    }
    for (int i = 0; i < 2; ++i)
    {
        EXPECT_TRUE(durations->record(200, {{"task.type", std::string("fast")}}));
    }

    auto snapshot = m_provider->collect();

    const auto* slow = snapshot->find("background.job.duration", {{"task.type", std::string("slow")}});
    const auto* fast = snapshot->find("background.job.duration", {{"task.type", std::string("fast")}});
    ASSERT_NE(slow, nullptr);
    ASSERT_NE(fast, nullptr);

    EXPECT_EQ(histogram_of(slow).count, 3);
    EXPECT_DOUBLE_EQ(histogram_of(slow).sum, 3600);
    EXPECT_EQ(histogram_of(fast).count, 2);
    EXPECT_DOUBLE_EQ(histogram_of(fast).sum, 400);
}

TEST_F(Metrics, HistogramBucketsAndExtremes)
{
    auto latency = m_meter->create_histogram("latency", {10, 100, 1000}, "ms", {});
    ASSERT_TRUE(latency);

    for (double value : {1.0, 10.0, 11.0, 99.0, 500.0, 5000.0})
    {
        EXPECT_TRUE(latency->record(value));
    }

    auto snapshot         = m_provider->collect();
    const auto& histogram = histogram_of(snapshot->find("latency", {}));

    // a value equal to a boundary falls in that boundary's bucket
    EXPECT_EQ(histogram.bucket_counts, (std::vector<std::uint64_t>{2, 2, 1, 1}));
    EXPECT_EQ(histogram.count, 6);
    EXPECT_DOUBLE_EQ(histogram.sum, 5621);
    EXPECT_DOUBLE_EQ(histogram.min, 1);
    EXPECT_DOUBLE_EQ(histogram.max, 5000);
}

TEST_F(Metrics, DefaultBoundaries)
{
    auto histogram = m_meter->create_histogram("default.buckets");
    ASSERT_TRUE(histogram);
    EXPECT_EQ(histogram->descriptor().boundaries, metrics::default_histogram_boundaries());
    EXPECT_EQ(histogram->descriptor().kind, metrics::InstrumentKind::histogram);
}

TEST_F(Metrics, RepeatedPullsAreIdempotent)
{
    auto counter = m_meter->create_counter("pulls");
    ASSERT_TRUE(counter);
    EXPECT_TRUE(counter->add(3));

    auto first  = m_provider->collect();
    auto second = m_provider->collect();

    EXPECT_EQ(second->collection, first->collection + 1);
    EXPECT_DOUBLE_EQ(sum_of(first->find("pulls", {})).value, 3);
    EXPECT_DOUBLE_EQ(sum_of(second->find("pulls", {})).value, 3);
    EXPECT_EQ(m_provider->scrape(), m_provider->scrape());
}

TEST_F(Metrics, AggregatesAreCumulative)
{
    auto counter = m_meter->create_counter("cumulative");
    ASSERT_TRUE(counter);

    EXPECT_TRUE(counter->add(1));
    auto first = m_provider->collect();

    EXPECT_TRUE(counter->add(2));
    auto second = m_provider->collect();

    EXPECT_DOUBLE_EQ(sum_of(first->find("cumulative", {})).value, 1);
    EXPECT_DOUBLE_EQ(sum_of(second->find("cumulative", {})).value, 3);
    EXPECT_EQ(second->window_start, first->window_start);
    EXPECT_GE(second->window_end, first->window_end);

    // the latest collection stays readable without collecting again
    EXPECT_EQ(m_provider->snapshot(), second);
}

TEST_F(Metrics, SnapshotBeforeFirstCollection)
{
    auto snapshot = m_provider->snapshot();
    ASSERT_TRUE(snapshot);
    EXPECT_EQ(snapshot->collection, 0);
    EXPECT_TRUE(snapshot->metrics.empty());
}

TEST_F(Metrics, SameNameReturnsExistingInstrument)
{
    auto first  = m_meter->create_counter("registered.once", "1", "first");
    auto second = m_provider->get_meter("another.meter")->create_counter("registered.once", "1", "second");
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);

    EXPECT_EQ(&first->descriptor(), &second->descriptor());
    EXPECT_EQ(second->descriptor().description, "first");
    EXPECT_EQ(m_provider->registry().instruments().size(), 1U);

    EXPECT_TRUE(first->add(1));
    EXPECT_TRUE(second->add(1));
    auto snapshot = m_provider->collect();
    ASSERT_EQ(snapshot->find_all("registered.once").size(), 1U);
    EXPECT_DOUBLE_EQ(sum_of(snapshot->find("registered.once", {})).value, 2);
}

TEST_F(Metrics, KindMismatchIsUsageError)
{
    ASSERT_TRUE(m_meter->create_counter("mixed"));

    auto histogram = m_meter->create_histogram("mixed");
    ASSERT_FALSE(histogram);
    EXPECT_EQ(histogram.error().code(), ErrorCode::usage_error);
    EXPECT_EQ(m_diagnostics->count(ErrorCode::usage_error), 1);

    EXPECT_EQ(m_provider->registry().find("mixed")->kind, metrics::InstrumentKind::counter);
}

TEST_F(Metrics, InvalidDescriptorsAreRejected)
{
    EXPECT_FALSE(m_meter->create_counter(""));
    EXPECT_FALSE(m_meter->create_histogram("unordered", {10, 5}, "ms", {}));
    EXPECT_FALSE(m_meter->create_histogram("repeated", {1, 1}, "ms", {}));
    EXPECT_FALSE(m_meter->create_histogram("infinite", {1, std::numeric_limits<double>::infinity()}, "ms", {}));

    metrics::InstrumentRegistry registry(m_diagnostics);
    EXPECT_FALSE(registry.register_instrument(
        {.name = "bucketed.counter", .kind = metrics::InstrumentKind::counter, .boundaries = {1, 2}}));

    EXPECT_EQ(m_diagnostics->count(ErrorCode::usage_error), 5);
    EXPECT_TRUE(m_provider->registry().instruments().empty());
}

TEST_F(Metrics, ConcurrentRecordingDuringCollection)
{
    constexpr int kWriters      = 4;
    constexpr int kAddsPerWriter = 20000;

    auto counter = m_meter->create_counter("concurrent");
    ASSERT_TRUE(counter);

    std::atomic<bool> writing{true};
    std::vector<std::jthread> writers;
    for (int w = 0; w < kWriters; ++w)
    {
        writers.emplace_back([&] {
            for (int i = 0; i < kAddsPerWriter; ++i)
            {
                EXPECT_TRUE(counter->add(1));
            }
        });
    }

    std::jthread collector([&] {
        while (writing)
        {
            m_provider->collect();
        }
    });

    for (auto& writer : writers)
    {
        writer.join();
    }
    writing = false;
    collector.join();

    auto snapshot = m_provider->collect();
    EXPECT_DOUBLE_EQ(sum_of(snapshot->find("concurrent", {})).value, kWriters * kAddsPerWriter);
}

TEST_F(Metrics, FullBufferEvictsOldest)
{
    metrics::MeterProvider provider(
        Resource::create({}), m_diagnostics, metrics::MeterProvider::Options{.max_buffered_points = 4});

    auto counter = provider.get_meter("bounded")->create_counter("bounded");
    ASSERT_TRUE(counter);

    for (double value : {100.0, 200.0, 1.0, 2.0, 3.0, 4.0})
    {
        EXPECT_TRUE(counter->add(value));
    }

    EXPECT_EQ(m_diagnostics->count(ErrorCode::buffer_overflow), 2);

    auto snapshot = provider.collect();
    EXPECT_DOUBLE_EQ(sum_of(snapshot->find("bounded", {})).value, 10);
}

TEST_F(Metrics, PeriodicCollection)
{
    metrics::MeterProvider provider(
        Resource::create({}), m_diagnostics, metrics::MeterProvider::Options{.collect_interval = 10ms});

    auto counter = provider.get_meter("periodic")->create_counter("ticks");
    ASSERT_TRUE(counter);
    EXPECT_TRUE(counter->add(7));

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    std::shared_ptr<const metrics::MetricsSnapshot> snapshot;
    while (std::chrono::steady_clock::now() < deadline)
    {
        snapshot = provider.snapshot();
        if (snapshot->find("ticks", {}) != nullptr)
        {
            break;
        }
        std::this_thread::sleep_for(5ms);
    }

    ASSERT_NE(snapshot->find("ticks", {}), nullptr);
    EXPECT_GE(snapshot->collection, 1);
    EXPECT_DOUBLE_EQ(sum_of(snapshot->find("ticks", {})).value, 7);
}
