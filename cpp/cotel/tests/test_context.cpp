#include "test_telemetry.hpp"

#include "cotel/core/thread.hpp"
#include "cotel/coro/event.hpp"
#include "cotel/coro/sync_wait.hpp"
#include "cotel/coro/task.hpp"
#include "cotel/coro/thread_pool.hpp"
#include "cotel/coro/when_all.hpp"
#include "cotel/trace/propagation.hpp"

#include <gtest/gtest.h>
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/default_span.h>

#include <atomic>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cotel;

class Propagation : public ::testing::Test
{
  protected:
    // installs the coroutine aware runtime context storage
    tests::TracingPipeline m_pipeline;
};

TEST_F(Propagation, NothingCurrentByDefault)
{
    EXPECT_FALSE(trace::current().has_value());
    EXPECT_FALSE(trace::detach().context.has_value());
}

TEST_F(Propagation, NestedScopes)
{
    auto outer = tests::random_context();
    auto inner = tests::random_context();

    {
        trace::Scope outer_scope(outer);
        EXPECT_EQ(trace::current(), outer);

        {
            trace::Scope inner_scope(inner);
            EXPECT_EQ(trace::current(), inner);
            EXPECT_EQ(trace::detach().context, inner);
        }

        EXPECT_EQ(trace::current(), outer);
    }

    EXPECT_FALSE(trace::current().has_value());
}

TEST_F(Propagation, EmptyContextMasksEnclosingSpan)
{
    auto outer = tests::random_context();
    trace::Scope scope(outer);

    trace::with_context(std::nullopt, [] {
        EXPECT_FALSE(trace::current().has_value());
    });

    EXPECT_EQ(trace::current(), outer);
}

TEST_F(Propagation, WithContextRestoresOnException)
{
    auto context = tests::random_context();

    EXPECT_THROW(trace::with_context(context,
                                     [&] {
                                         EXPECT_EQ(trace::current(), context);
                                         throw std::runtime_error("boom");
                                     }),
                 std::runtime_error);

    EXPECT_FALSE(trace::current().has_value());
}

TEST_F(Propagation, WithContextReturnsValue)
{
    auto context = tests::random_context();
    auto span_id = trace::with_context(context, [] {
        return trace::current()->span_id;
    });
    EXPECT_EQ(span_id, context.span_id);
}

TEST_F(Propagation, ParentTravelsWithContext)
{
    auto parent  = tests::random_context();
    auto context = tests::random_context();
    context.trace_id       = parent.trace_id;
    context.parent_span_id = parent.span_id;

    trace::Scope scope(context);
    auto observed = trace::current();
    ASSERT_TRUE(observed.has_value());
    ASSERT_TRUE(observed->parent_span_id.has_value());
    EXPECT_EQ(*observed->parent_span_id, parent.span_id);
    EXPECT_FALSE(observed->is_root());
}

TEST_F(Propagation, TaskCapturesContextAtCreation)
{
    auto context = tests::random_context();

    auto observe = []() -> coro::Task<std::optional<trace::SpanContext>> {
        co_return trace::current();
    };

    coro::Task<std::optional<trace::SpanContext>> task;
    {
        trace::Scope scope(context);
        task = observe();
    }

    EXPECT_EQ(coro::sync_wait(std::move(task)), context);
    EXPECT_FALSE(coro::sync_wait(observe()).has_value());
}

TEST_F(Propagation, SuspendedTaskDoesNotLeakItsScope)
{
    coro::Event e{};
    auto context = tests::random_context();
    std::optional<trace::SpanContext> after_resume;

    auto wait_for_event = [&]() -> coro::Task<void> {
        trace::Scope scope(context);
        co_await e;
        after_resume = trace::current();
    };

    auto task = wait_for_event();

    task.resume();
    ASSERT_FALSE(task.is_ready());
    EXPECT_FALSE(trace::current().has_value());

    e.set();
    EXPECT_TRUE(task.is_ready());
    EXPECT_EQ(after_resume, context);
    EXPECT_FALSE(trace::current().has_value());
}

TEST_F(Propagation, ContextFollowsTaskAcrossPools)
{
    coro::ThreadPool first{coro::ThreadPool::Options{.thread_count = 1, .description = "first"}};
    coro::ThreadPool second{coro::ThreadPool::Options{.thread_count = 1, .description = "second"}};

    auto context = tests::random_context();

    auto task = [&]() -> coro::Task<std::vector<std::string>> {
        std::vector<std::string> threads;
        trace::Scope scope(context);

        co_await first.schedule();
        EXPECT_EQ(trace::current(), context);
        threads.push_back(cotel::this_thread::get_id());

        co_await second.schedule();
        EXPECT_EQ(trace::current(), context);
        threads.push_back(cotel::this_thread::get_id());

        co_await first.schedule_after(std::chrono::milliseconds(5));
        EXPECT_EQ(trace::current(), context);
        threads.push_back(cotel::this_thread::get_id());

        co_return threads;
    };

    auto threads = coro::sync_wait(task());

    ASSERT_EQ(threads.size(), 3U);
    EXPECT_EQ(threads[0], "first/0");
    EXPECT_EQ(threads[1], "second/0");
    EXPECT_EQ(threads[2], "first/0");
    EXPECT_FALSE(trace::current().has_value());
}

TEST_F(Propagation, InterleavedTasksAreIsolated)
{
    constexpr int kTasks  = 32;
    constexpr int kYields = 50;

    // one thread forces every task to share it
    coro::ThreadPool tp{coro::ThreadPool::Options{.thread_count = 1}};
    std::atomic<int> mismatches{0};
    std::atomic<int> checks{0};

    auto worker = [&](trace::SpanContext context, unsigned seed) -> coro::Task<void> {
        std::mt19937 rng(seed);
        std::uniform_int_distribution<int> coin(0, 1);

        co_await tp.schedule();
        trace::Scope scope(context);

        for (int i = 0; i < kYields; ++i)
        {
            if (coin(rng) == 1)
            {
                co_await tp.yield();
            }

            checks++;
            if (trace::current() != context)
            {
                mismatches++;
            }
        }
    };

    std::vector<coro::Task<void>> tasks;
    for (int i = 0; i < kTasks; ++i)
    {
        tasks.push_back(worker(tests::random_context(), static_cast<unsigned>(i)));
    }

    coro::sync_wait(coro::when_all(std::move(tasks)));

    EXPECT_EQ(checks, kTasks * kYields);
    EXPECT_EQ(mismatches, 0);
}

TEST_F(Propagation, OpenTelemetryApiSeesScopedSpan)
{
    auto span = m_pipeline.tracer->start_span("interop");

    auto otel_span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
    auto otel      = otel_span->GetContext();

    ASSERT_TRUE(otel.IsValid());
    EXPECT_EQ(otel.trace_id(), span.context().trace_id);
    EXPECT_EQ(otel.span_id(), span.context().span_id);
    EXPECT_TRUE(otel.IsSampled());
}

TEST_F(Propagation, ContextAttachedThroughOpenTelemetryApi)
{
    auto context = tests::random_context();

    opentelemetry::trace::SpanContext otel(context.trace_id,
                                           context.span_id,
                                           opentelemetry::trace::TraceFlags(opentelemetry::trace::TraceFlags::kIsSampled),
                                           true);
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span(new opentelemetry::trace::DefaultSpan(otel));

    {
        auto token = opentelemetry::context::RuntimeContext::Attach(
            opentelemetry::trace::SetSpan(opentelemetry::context::RuntimeContext::GetCurrent(), span));

        auto observed = trace::current();
        ASSERT_TRUE(observed.has_value());
        EXPECT_EQ(observed->span_id, context.span_id);
        EXPECT_TRUE(observed->remote);
    }

    EXPECT_FALSE(trace::current().has_value());
}
