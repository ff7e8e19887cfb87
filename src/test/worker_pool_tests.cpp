// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

/**
 * Unit tests for WorkerPool and DNAPipeline
 *
 * Tests the pool's concurrency bound, crash recovery, error propagation
 * and shutdown, then the hot/cold pipeline built on top of it.
 */

// Part of main Boost test suite (no BOOST_TEST_MODULE here)
#include <boost/test/unit_test.hpp>

#include <art_dna/artist_context.h>
#include <art_dna/dna_errors.h>
#include <art_dna/dna_pipeline.h>
#include <art_dna/worker_pool.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace art_dna;

namespace {

/** Echoes distance requests; "crash" throws, "block" waits on the gate */
class ScriptedHandler : public IWorkerHandler {
public:
    ScriptedHandler(std::atomic<int>& active, std::atomic<int>& peak, std::shared_future<void> gate)
        : m_active(active), m_peak(peak), m_gate(std::move(gate)) {}

    WorkerResponse handle(const WorkerMessage& message) override {
        int now = ++m_active;
        int seen = m_peak.load();
        while (now > seen && !m_peak.compare_exchange_weak(seen, now)) {}

        if (message.session_id == "block" && m_gate.valid()) m_gate.wait();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --m_active;

        if (message.session_id == "crash") throw std::runtime_error("handler blew up");

        WorkerResponse response;
        response.type = WorkerResponseType::DISTANCE_RESULT;
        response.distance = message.dna_a.empty() ? 0.0 : message.dna_a[0];
        return response;
    }

private:
    std::atomic<int>& m_active;
    std::atomic<int>& m_peak;
    std::shared_future<void> m_gate;
};

struct PoolFixture {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::promise<void> gate;
    std::shared_future<void> gate_future{gate.get_future().share()};

    WorkerPool::HandlerFactory Factory() {
        return [this]() {
            return std::unique_ptr<IWorkerHandler>(new ScriptedHandler(active, peak, gate_future));
        };
    }

    static WorkerMessage Request(float value, const std::string& marker = "") {
        WorkerMessage msg = WorkerMessage::CalculateDistance({value}, {value}, DistanceMetric::EUCLIDEAN);
        msg.session_id = marker;
        return msg;
    }
};

StrokeInput MakeStroke(const std::string& id) {
    StrokeInput input;
    input.stroke_id = id;
    input.canvas_width = 800;
    input.canvas_height = 600;
    for (int i = 0; i < 12; i++) {
        StrokePoint p;
        p.x = 50.0 + i * 10.0;
        p.y = 80.0 + i * 3.0;
        p.pressure = 0.6;
        p.timestamp = i * 16.0;
        input.points.push_back(p);
    }
    return input;
}

CanvasSnapshot MakeSnapshot() {
    CanvasSnapshot snapshot;
    snapshot.snapshot_id = "snap";
    snapshot.width = 32;
    snapshot.height = 32;
    snapshot.rgba.assign(32 * 32 * 4, 255);
    for (size_t i = 0; i < snapshot.rgba.size(); i += 4) {
        snapshot.rgba[i] = static_cast<uint8_t>(i % 256);
    }
    return snapshot;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(worker_pool_tests, PoolFixture)

BOOST_AUTO_TEST_CASE(concurrency_is_bounded_by_pool_size) {
    WorkerPool pool(3, Factory());
    BOOST_CHECK(pool.initialize());
    BOOST_CHECK(!pool.initialize());

    std::vector<std::future<WorkerResponse>> futures;
    for (int i = 0; i < 20; i++) futures.push_back(pool.submit(Request(static_cast<float>(i))));

    for (int i = 0; i < 20; i++) {
        WorkerResponse response = futures[i].get();
        BOOST_CHECK_EQUAL(response.distance, static_cast<double>(i));
        BOOST_CHECK_EQUAL(response.task_id.rfind("task_", 0), 0u);
    }
    BOOST_CHECK(peak.load() <= 3);
    BOOST_CHECK(peak.load() >= 1);

    pool.wait_for_completion();
    WorkerPool::Stats stats = pool.get_stats();
    BOOST_CHECK_EQUAL(stats.total_workers, 3u);
    BOOST_CHECK_EQUAL(stats.completed, 20u);
    BOOST_CHECK_EQUAL(stats.failed, 0u);
    BOOST_CHECK_EQUAL(stats.queued_tasks, 0u);
    BOOST_CHECK_EQUAL(stats.available_workers, 3u);
}

BOOST_AUTO_TEST_CASE(task_ids_are_unique) {
    WorkerPool pool(2, Factory());
    pool.initialize();
    std::string a = pool.submit(Request(1.0f)).get().task_id;
    std::string b = pool.submit(Request(2.0f)).get().task_id;
    BOOST_CHECK(a != b);
}

BOOST_AUTO_TEST_CASE(crash_rejects_only_that_task) {
    WorkerPool pool(1, Factory());
    pool.initialize();

    std::future<WorkerResponse> crashed = pool.submit(Request(1.0f, "crash"));
    std::future<WorkerResponse> after = pool.submit(Request(7.0f));

    BOOST_CHECK_THROW(crashed.get(), WorkerFailure);
    BOOST_CHECK_EQUAL(after.get().distance, 7.0);

    // The replacement worker keeps serving
    BOOST_CHECK_EQUAL(pool.submit(Request(9.0f)).get().distance, 9.0);

    pool.wait_for_completion();
    WorkerPool::Stats stats = pool.get_stats();
    BOOST_CHECK_EQUAL(stats.restarts, 1u);
    BOOST_CHECK_EQUAL(stats.failed, 1u);
    BOOST_CHECK_EQUAL(stats.completed, 2u);
}

BOOST_AUTO_TEST_CASE(repeated_crashes_keep_retired_threads_bounded) {
    WorkerPool pool(1, Factory());
    pool.initialize();

    for (int i = 0; i < 6; i++) {
        BOOST_CHECK_THROW(pool.submit(Request(1.0f, "crash")).get(), WorkerFailure);
        // Served by the replacement, so the respawn has finished
        BOOST_CHECK_EQUAL(pool.submit(Request(2.0f)).get().distance, 2.0);
        BOOST_CHECK(pool.get_stats().retired_workers <= 1u);
    }

    WorkerPool::Stats stats = pool.get_stats();
    BOOST_CHECK_EQUAL(stats.restarts, 6u);
    BOOST_CHECK_EQUAL(stats.retired_workers, 1u);

    pool.terminate();
    BOOST_CHECK_EQUAL(pool.get_stats().retired_workers, 0u);
}

BOOST_AUTO_TEST_CASE(error_response_becomes_worker_failure) {
    WorkerPool pool{DNAConfig()};
    pool.initialize();

    std::future<WorkerResponse> bad = pool.submit(
        WorkerMessage::CalculateDistance({1.0f, 2.0f}, {1.0f}, DistanceMetric::EUCLIDEAN));
    BOOST_CHECK_THROW(bad.get(), WorkerFailure);

    WorkerResponse good = pool.submit(
        WorkerMessage::CalculateDistance({0.0f, 0.0f}, {3.0f, 4.0f}, DistanceMetric::EUCLIDEAN)).get();
    BOOST_CHECK(good.type == WorkerResponseType::DISTANCE_RESULT);
    BOOST_CHECK_CLOSE(good.distance, 5.0, 1e-9);

    WorkerResponse batch = pool.submit(
        WorkerMessage::BatchDistance({0.0f}, {{1.0f}, {2.0f}}, DistanceMetric::MANHATTAN)).get();
    BOOST_REQUIRE_EQUAL(batch.distances.size(), 2u);
    BOOST_CHECK_EQUAL(batch.distances[1], 2.0);

    BOOST_CHECK_EQUAL(pool.get_stats().restarts, 0u);
}

BOOST_AUTO_TEST_CASE(stopped_pool_rejects_submissions) {
    WorkerPool pool(2, Factory());
    BOOST_CHECK(!pool.is_running());

    std::future<WorkerResponse> rejected = pool.submit(Request(1.0f));
    BOOST_REQUIRE(rejected.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    BOOST_CHECK_THROW(rejected.get(), WorkerFailure);

    pool.initialize();
    pool.terminate();
    BOOST_CHECK_THROW(pool.submit(Request(1.0f)).get(), WorkerFailure);
}

BOOST_AUTO_TEST_CASE(terminate_rejects_queued_tasks) {
    WorkerPool pool(1, Factory());
    pool.initialize();

    std::future<WorkerResponse> running = pool.submit(Request(1.0f, "block"));
    while (active.load() == 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    std::future<WorkerResponse> queued1 = pool.submit(Request(2.0f));
    std::future<WorkerResponse> queued2 = pool.submit(Request(3.0f));

    std::thread stopper([&pool] { pool.terminate(); });
    while (pool.is_running()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    gate.set_value();
    stopper.join();

    BOOST_CHECK_EQUAL(running.get().distance, 1.0);
    BOOST_CHECK_THROW(queued1.get(), WorkerFailure);
    BOOST_CHECK_THROW(queued2.get(), WorkerFailure);
    BOOST_CHECK_EQUAL(pool.get_stats().failed, 2u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(pipeline_tests)

BOOST_AUTO_TEST_CASE(fresh_pipeline_is_healthy) {
    DNAConfig config;
    WorkerPool pool(config);
    pool.initialize();
    DNAPipeline pipeline(config, pool);

    BOOST_CHECK(pipeline.is_healthy());
    BOOST_CHECK_EQUAL(pipeline.get_performance_summary(),
                      "Pipeline Performance:\n"
                      "- Total encodings: 0\n"
                      "- Hot path avg: 0.00ms\n"
                      "- Cold path avg: 0.00ms\n"
                      "- Budget violations: 0 (0.0%)\n"
                      "- Worker utilization: 0.0%");
}

BOOST_AUTO_TEST_CASE(process_stroke_merges_cold_results) {
    DNAConfig config;
    config.worker_pool_size = 2;
    WorkerPool pool(config);
    pool.initialize();
    DNAPipeline pipeline(config, pool);

    const int64_t now = 1700000000000LL;
    ArtistContextManager context("session-p", now);
    DNASession session;
    session.session_id = "session-p";
    session.started_at = now;

    HotPathResult hot = pipeline.process_stroke(session, MakeStroke("s1"), context.get_context(), MakeSnapshot());
    BOOST_CHECK_EQUAL(hot.stroke_dna.session_id, "session-p");
    BOOST_CHECK_EQUAL(session.stroke_dna.size(), 1u);
    BOOST_CHECK_EQUAL(session.total_strokes, 1u);
    BOOST_CHECK(hot.encoding_time_ms >= 0.0);

    BOOST_CHECK_EQUAL(pipeline.wait_for_cold_path(session), 2u);
    BOOST_CHECK_EQUAL(pipeline.pending_count("session-p"), 0u);
    BOOST_REQUIRE_EQUAL(session.image_dna.size(), 1u);
    BOOST_REQUIRE_EQUAL(session.temporal_dna.size(), 1u);
    BOOST_CHECK_EQUAL(session.image_dna[0].session_id, "session-p");
    BOOST_CHECK_EQUAL(session.temporal_dna[0].total_strokes, 1u);

    // Nothing left to merge
    BOOST_CHECK_EQUAL(pipeline.merge_completed(session), 0u);
    BOOST_CHECK_EQUAL(pipeline.wait_for_cold_path(session), 0u);

    PipelineMetrics metrics = pipeline.get_metrics();
    BOOST_CHECK_EQUAL(metrics.total_encodings, 1u);
    BOOST_CHECK_EQUAL(metrics.cold_path_completed, 2u);
    BOOST_CHECK_EQUAL(metrics.cold_path_failures, 0u);
    BOOST_CHECK(metrics.avg_cold_path_time_ms >= 0.0);
}

BOOST_AUTO_TEST_CASE(merge_completed_does_not_block) {
    DNAConfig config;
    WorkerPool pool(config);
    pool.initialize();
    DNAPipeline pipeline(config, pool);

    DNASession session;
    session.session_id = "session-m";
    ArtistContext context;
    for (int i = 0; i < 3; i++) {
        pipeline.process_stroke(session, MakeStroke("s" + std::to_string(i)), context);
    }

    size_t merged = pipeline.merge_completed(session);
    BOOST_CHECK(merged <= 3u);
    pool.wait_for_completion();
    merged += pipeline.merge_completed(session);
    BOOST_CHECK_EQUAL(merged, 3u);
    BOOST_CHECK_EQUAL(session.temporal_dna.size(), 3u);
}

BOOST_AUTO_TEST_CASE(hot_path_failure_leaves_metrics_untouched) {
    DNAConfig config;
    WorkerPool pool(config);
    pool.initialize();
    DNAPipeline pipeline(config, pool);

    DNASession session;
    session.session_id = "session-e";
    StrokeInput empty;
    empty.canvas_width = 800;
    empty.canvas_height = 600;

    BOOST_CHECK_THROW(pipeline.process_stroke(session, empty, ArtistContext()), InvalidInput);
    BOOST_CHECK(session.stroke_dna.empty());
    BOOST_CHECK_EQUAL(pipeline.pending_count("session-e"), 0u);
    BOOST_CHECK_EQUAL(pipeline.get_metrics().total_encodings, 0u);

    HotPathResult ok = pipeline.encode_stroke(MakeStroke("s-ok"), ArtistContext());
    BOOST_CHECK(ok.stroke_dna.features.is_finite());
    BOOST_CHECK_EQUAL(pipeline.get_metrics().total_encodings, 1u);

    pipeline.reset_metrics();
    BOOST_CHECK_EQUAL(pipeline.get_metrics().total_encodings, 0u);
}

BOOST_AUTO_TEST_CASE(budget_violations_make_pipeline_unhealthy) {
    DNAConfig config;
    // Every encode takes at least 0ms, so each one overruns
    config.hot_path_budget_ms = -1.0;
    WorkerPool pool(config);
    pool.initialize();
    DNAPipeline pipeline(config, pool);

    for (int i = 0; i < 4; i++) {
        HotPathResult result = pipeline.encode_stroke(MakeStroke("v" + std::to_string(i)), ArtistContext());
        BOOST_CHECK(!result.within_budget);
    }

    PipelineMetrics metrics = pipeline.get_metrics();
    BOOST_CHECK_EQUAL(metrics.total_encodings, 4u);
    BOOST_CHECK_EQUAL(metrics.hot_path_violations, 4u);
    BOOST_CHECK(!pipeline.is_healthy());
    BOOST_CHECK(pipeline.get_performance_summary().find("- Budget violations: 4 (100.0%)") != std::string::npos);

    pipeline.reset_metrics();
    BOOST_CHECK_EQUAL(pipeline.get_metrics().hot_path_violations, 0u);

    // A generous budget keeps the same workload healthy
    DNAConfig relaxed;
    relaxed.hot_path_budget_ms = 1e6;
    DNAPipeline fast(relaxed, pool);
    for (int i = 0; i < 4; i++) fast.encode_stroke(MakeStroke("r" + std::to_string(i)), ArtistContext());
    BOOST_CHECK_EQUAL(fast.get_metrics().hot_path_violations, 0u);
    BOOST_CHECK(fast.is_healthy());
}

BOOST_AUTO_TEST_CASE(cold_path_failure_is_counted) {
    DNAConfig config;
    WorkerPool pool(config);
    pool.initialize();
    DNAPipeline pipeline(config, pool);

    DNASession session;
    session.session_id = "session-f";
    CanvasSnapshot broken;
    broken.width = 4;
    broken.height = 4;

    pipeline.schedule_cold_path(session, ArtistContext(), broken);
    BOOST_CHECK_EQUAL(pipeline.pending_count("session-f"), 2u);
    BOOST_CHECK_EQUAL(pipeline.wait_for_cold_path(session), 1u);
    BOOST_CHECK(session.image_dna.empty());
    BOOST_CHECK_EQUAL(session.temporal_dna.size(), 1u);
    BOOST_CHECK_EQUAL(pipeline.get_metrics().cold_path_failures, 1u);
}

BOOST_AUTO_TEST_SUITE_END()
