#include "test_telemetry.hpp"

#include "cotel/coro/event.hpp"
#include "cotel/coro/sync_wait.hpp"
#include "cotel/coro/task.hpp"
#include "cotel/coro/thread_pool.hpp"
#include "cotel/coro/when_all.hpp"
#include "cotel/trace/propagation.hpp"
#include "cotel/trace/tracer.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

using namespace cotel;
using namespace std::chrono_literals;

class Tracing : public ::testing::Test
{
  protected:
    tests::TracingPipeline m_pipeline;
};

TEST_F(Tracing, NestedSpansShareOneTrace)
{
    trace::SpanContext root_context;
    trace::SpanContext child_context;
    trace::SpanContext leaf_context;

    {
        auto root    = m_pipeline.tracer->start_span("request");
        root_context = root.context();
        {
            auto child    = m_pipeline.tracer->start_span("db.query");
            child_context = child.context();
            {
                auto leaf    = m_pipeline.tracer->start_span("db.connect");
                leaf_context = leaf.context();
                EXPECT_EQ(trace::current(), leaf_context);
            }
            EXPECT_EQ(trace::current(), child_context);
        }
        EXPECT_EQ(trace::current(), root_context);
    }
    EXPECT_FALSE(trace::current().has_value());

    EXPECT_TRUE(root_context.is_root());
    EXPECT_EQ(child_context.trace_id, root_context.trace_id);
    EXPECT_EQ(leaf_context.trace_id, root_context.trace_id);
    EXPECT_EQ(child_context.parent_span_id, root_context.span_id);
    EXPECT_EQ(leaf_context.parent_span_id, child_context.span_id);

    auto spans = m_pipeline.flush();
    ASSERT_EQ(spans.size(), 3U);

    // children end first
    EXPECT_EQ(spans[0].name, "db.connect");
    EXPECT_EQ(spans[1].name, "db.query");
    EXPECT_EQ(spans[2].name, "request");

    for (const auto& span : spans)
    {
        EXPECT_EQ(span.status, trace::SpanStatus::ok);
        EXPECT_GE(span.end_time, span.start_time);
        EXPECT_EQ(span.scope_name, "cotel.test");
        EXPECT_EQ(span.scope_version, "1.0");
        ASSERT_TRUE(span.resource);
        EXPECT_EQ(span.resource->service_name(), "cotel-test");
    }

    EXPECT_EQ(m_pipeline.diagnostics->count(ErrorCode::usage_error), 0);
}

TEST_F(Tracing, RequestWithDatabaseAndCpuWork)
{
    coro::ThreadPool tp{coro::ThreadPool::Options{.thread_count = 2}};

    auto handle_request = [&]() -> coro::Task<void> {
        co_await tp.schedule();
        const auto started = std::chrono::steady_clock::now();

        auto request = m_pipeline.tracer->start_span("request");
        {
            auto db = m_pipeline.tracer->start_span("db.query");
            co_await tp.schedule_after(400ms);
        }
        {
            auto cpu = m_pipeline.tracer->start_span("cpu.work");
            std::this_thread::sleep_for(170ms);
        }

        const auto remaining = 750ms - (std::chrono::steady_clock::now() - started);
        if (remaining > 0ms)
        {
            co_await tp.schedule_after(remaining);
        }
    };

    coro::sync_wait(handle_request());

    auto spans = m_pipeline.flush();
    ASSERT_EQ(spans.size(), 3U);

    const auto* request = tests::find_span(spans, "request");
    const auto* db      = tests::find_span(spans, "db.query");
    const auto* cpu     = tests::find_span(spans, "cpu.work");
    ASSERT_NE(request, nullptr);
    ASSERT_NE(db, nullptr);
    ASSERT_NE(cpu, nullptr);

    EXPECT_EQ(db->context.trace_id, request->context.trace_id);
    EXPECT_EQ(cpu->context.trace_id, request->context.trace_id);
    EXPECT_EQ(db->context.parent_span_id, request->context.span_id);
    EXPECT_EQ(cpu->context.parent_span_id, request->context.span_id);

    constexpr auto kTolerance = 150ms;

    EXPECT_GE(tests::to_ms(db->duration()), 400ms);
    EXPECT_LT(tests::to_ms(db->duration()), 400ms + kTolerance);
    EXPECT_GE(tests::to_ms(cpu->duration()), 170ms);
    EXPECT_LT(tests::to_ms(cpu->duration()), 170ms + kTolerance);
    EXPECT_GE(tests::to_ms(request->duration()), 740ms);
    EXPECT_LT(tests::to_ms(request->duration()), 750ms + kTolerance);
}

TEST_F(Tracing, EndTwiceIsReportedAndExportedOnce)
{
    {
        auto span = m_pipeline.tracer->start_span("once");
        EXPECT_TRUE(span.end());

        auto again = span.end();
        ASSERT_FALSE(again);
        EXPECT_EQ(again.error().code(), ErrorCode::usage_error);

        // an early end restores the enclosing context
        EXPECT_FALSE(trace::current().has_value());
    }

    auto spans = m_pipeline.flush();
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].name, "once");
    EXPECT_EQ(m_pipeline.diagnostics->count(ErrorCode::usage_error), 1);
}

TEST_F(Tracing, EarlyEndRestoresParent)
{
    auto root = m_pipeline.tracer->start_span("root");
    {
        auto child = m_pipeline.tracer->start_span("child");
        EXPECT_EQ(trace::current(), child.context());
        EXPECT_TRUE(child.end(trace::SpanStatus::ok));
        EXPECT_EQ(trace::current(), root.context());
    }
    EXPECT_EQ(trace::current(), root.context());
}

TEST_F(Tracing, AttributesAfterEndAreRejected)
{
    auto span = m_pipeline.tracer->create_span("detached", std::nullopt, {{"initial", std::int64_t{1}}});
    EXPECT_TRUE(span.set_attribute("route", std::string("/items/{item_id}")));
    EXPECT_TRUE(span.end());

    auto rejected = span.set_attribute("late", true);
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().code(), ErrorCode::usage_error);

    auto spans = m_pipeline.flush();
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].attributes.count("initial"), 1U);
    EXPECT_EQ(std::get<std::string>(spans[0].attributes.at("route")), "/items/{item_id}");
    EXPECT_EQ(spans[0].attributes.count("late"), 0U);
}

TEST_F(Tracing, CreateSpanDoesNotBecomeCurrent)
{
    auto span = m_pipeline.tracer->create_span("manual", std::nullopt);
    EXPECT_FALSE(trace::current().has_value());
    EXPECT_TRUE(span.context().is_root());
}

TEST_F(Tracing, RecordErrorSetsStatus)
{
    {
        auto span = m_pipeline.tracer->start_span("failing");
        EXPECT_TRUE(span->record_error(std::invalid_argument("bad item id")));
    }
    {
        auto span = m_pipeline.tracer->start_span("failing.message");
        EXPECT_TRUE(span->record_error("upstream returned 503"));
    }

    auto spans = m_pipeline.flush();
    ASSERT_EQ(spans.size(), 2U);

    const auto* failing = tests::find_span(spans, "failing");
    ASSERT_NE(failing, nullptr);
    EXPECT_EQ(failing->status, trace::SpanStatus::error);
    EXPECT_EQ(failing->status_description, "bad item id");
    EXPECT_EQ(std::get<std::string>(failing->attributes.at("exception.type")), "std::invalid_argument");
    EXPECT_EQ(std::get<std::string>(failing->attributes.at("exception.message")), "bad item id");

    const auto* message = tests::find_span(spans, "failing.message");
    ASSERT_NE(message, nullptr);
    EXPECT_EQ(message->status, trace::SpanStatus::error);
    EXPECT_EQ(message->attributes.count("exception.type"), 0U);
}

TEST_F(Tracing, ExplicitStatusOverridesDefault)
{
    {
        auto span = m_pipeline.tracer->start_span("rejected");
        EXPECT_TRUE(span.end(trace::SpanStatus::error, "quota exceeded"));
    }

    auto spans = m_pipeline.flush();
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].status, trace::SpanStatus::error);
    EXPECT_EQ(spans[0].status_description, "quota exceeded");
}

TEST_F(Tracing, UnknownParentIsReported)
{
    auto stranger = tests::random_context();

    {
        auto span = m_pipeline.tracer->start_span("orphan", stranger);
        EXPECT_EQ(span.context().trace_id, stranger.trace_id);
        EXPECT_EQ(span.context().parent_span_id, stranger.span_id);
    }

    EXPECT_EQ(m_pipeline.diagnostics->count(ErrorCode::usage_error), 1);
}

TEST_F(Tracing, RemoteParentIsAccepted)
{
    auto inbound = tests::random_context();
    auto remote  = trace::SpanContext::from_remote(inbound.trace_id, inbound.span_id);

    {
        auto span = m_pipeline.tracer->start_span("server", remote);
        EXPECT_EQ(span.context().trace_id, inbound.trace_id);
        EXPECT_EQ(span.context().parent_span_id, inbound.span_id);
        EXPECT_FALSE(span.context().remote);
    }

    EXPECT_EQ(m_pipeline.diagnostics->count(ErrorCode::usage_error), 0);
    EXPECT_EQ(m_pipeline.flush().size(), 1U);
}

TEST_F(Tracing, UnsampledTracesAreNotExported)
{
    auto inbound = tests::random_context();
    auto remote  = trace::SpanContext::from_remote(inbound.trace_id, inbound.span_id, false);

    {
        auto root = m_pipeline.tracer->start_span("unsampled", remote);
        EXPECT_FALSE(root.context().sampled);

        auto child = m_pipeline.tracer->start_span("unsampled.child");
        EXPECT_FALSE(child.context().sampled);
    }
    {
        auto sampled = m_pipeline.tracer->start_span("sampled");
    }

    auto spans = m_pipeline.flush();
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].name, "sampled");
}

TEST_F(Tracing, ExceptionEndsSpanWithError)
{
    auto handler = [&] {
        auto span = m_pipeline.tracer->start_span("handler");
        throw std::runtime_error("db connection reset");
    };

    EXPECT_THROW(handler(), std::runtime_error);
    EXPECT_FALSE(trace::current().has_value());

    auto spans = m_pipeline.flush();
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].status, trace::SpanStatus::error);
}

TEST_F(Tracing, CancelledTaskEndsOpenSpans)
{
    coro::Event never_set{};

    auto handler = [&]() -> coro::Task<void> {
        auto span = m_pipeline.tracer->start_span("handler");
        auto db   = m_pipeline.tracer->start_span("db.query");
        co_await never_set;
    };

    {
        auto root = m_pipeline.tracer->start_span("request");

        auto task = handler();
        task.resume();
        ASSERT_FALSE(task.is_ready());
        EXPECT_EQ(trace::current(), root.context());

        // destroying the suspended task cancels it
        EXPECT_TRUE(task.destroy());
        EXPECT_EQ(trace::current(), root.context());
    }

    auto spans = m_pipeline.flush();
    ASSERT_EQ(spans.size(), 3U);

    for (const auto* name : {"handler", "db.query"})
    {
        const auto* span = tests::find_span(spans, name);
        ASSERT_NE(span, nullptr) << name;
        EXPECT_EQ(span->status, trace::SpanStatus::error) << name;
        EXPECT_EQ(span->status_description, "cancelled") << name;
        ASSERT_EQ(span->attributes.count("cancelled"), 1U) << name;
        EXPECT_TRUE(std::get<bool>(span->attributes.at("cancelled"))) << name;
    }

    const auto* request = tests::find_span(spans, "request");
    ASSERT_NE(request, nullptr);
    EXPECT_EQ(request->status, trace::SpanStatus::ok);
    EXPECT_EQ(request->attributes.count("cancelled"), 0U);
}

namespace {

struct SetOnExit
{
    ~SetOnExit()
    {
        event.set();
    }

    coro::Event& event;
};

}  // namespace

TEST_F(Tracing, TaskResumedWhileUnwindingEndsNormally)
{
    coro::Event ready{};

    auto handler = [&]() -> coro::Task<void> {
        auto span = m_pipeline.tracer->start_span("handler");
        co_await ready;
    };

    auto task = handler();
    task.resume();
    ASSERT_FALSE(task.is_ready());

    try
    {
        // the guard resumes the task inline while this thread unwinds
        SetOnExit guard{ready};
        throw std::runtime_error("request aborted");
    } catch (const std::runtime_error& e)
    {
        EXPECT_STREQ(e.what(), "request aborted");
    }
    EXPECT_TRUE(task.is_ready());

    auto spans = m_pipeline.flush();
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].status, trace::SpanStatus::ok);
}

TEST_F(Tracing, TaskCancelledWhileUnwindingIsMarkedCancelled)
{
    coro::Event never_set{};

    auto handler = [&]() -> coro::Task<void> {
        auto span = m_pipeline.tracer->start_span("handler");
        co_await never_set;
    };

    try
    {
        auto task = handler();
        task.resume();
        throw std::runtime_error("request aborted");
    } catch (const std::runtime_error& e)
    {
        EXPECT_STREQ(e.what(), "request aborted");
    }

    auto spans = m_pipeline.flush();
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].status, trace::SpanStatus::error);
    EXPECT_EQ(spans[0].status_description, "cancelled");
}

TEST_F(Tracing, UnrelatedRootsGetDistinctTraces)
{
    constexpr int kRoots = 64;

    std::set<std::string> trace_ids;
    std::set<std::string> span_ids;
    for (int i = 0; i < kRoots; ++i)
    {
        auto span = m_pipeline.tracer->create_span("root", std::nullopt);
        trace_ids.insert(trace::to_hex(span.context().trace_id));
        span_ids.insert(trace::to_hex(span.context().span_id));
    }

    EXPECT_EQ(trace_ids.size(), kRoots);
    EXPECT_EQ(span_ids.size(), kRoots);
}

TEST_F(Tracing, ConcurrentRequestsKeepTheirOwnTraces)
{
    constexpr int kRequests = 16;

    coro::ThreadPool tp{coro::ThreadPool::Options{.thread_count = 2}};

    auto handle_request = [&](int id) -> coro::Task<void> {
        co_await tp.schedule();
        auto root = m_pipeline.tracer->start_span("request", {{"request.id", std::int64_t{id}}});
        for (int i = 0; i < 3; ++i)
        {
            auto child = m_pipeline.tracer->start_span("step", {{"request.id", std::int64_t{id}}});
            co_await tp.schedule_after(1ms);
            EXPECT_EQ(trace::current(), child.context());
        }
    };

    std::vector<coro::Task<void>> requests;
    for (int i = 0; i < kRequests; ++i)
    {
        requests.push_back(handle_request(i));
    }
    coro::sync_wait(coro::when_all(std::move(requests)));

    auto spans = m_pipeline.flush();
    ASSERT_EQ(spans.size(), kRequests * 4U);

    std::map<std::int64_t, const trace::SpanData*> roots;
    for (const auto& span : spans)
    {
        if (span.name == "request")
        {
            roots[std::get<std::int64_t>(span.attributes.at("request.id"))] = &span;
        }
    }
    ASSERT_EQ(roots.size(), kRequests);

    for (const auto& span : spans)
    {
        if (span.name != "step")
        {
            continue;
        }
        const auto* root = roots.at(std::get<std::int64_t>(span.attributes.at("request.id")));
        EXPECT_EQ(span.context.trace_id, root->context.trace_id);
        EXPECT_EQ(span.context.parent_span_id, root->context.span_id);
    }
}
