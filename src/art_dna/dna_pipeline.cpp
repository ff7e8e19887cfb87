// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/dna_pipeline.h>

#include <art_dna/dna_errors.h>
#include <util/error_format.h>
#include <util/logging.h>
#include <util/strencodings.h>
#include <util/time.h>

#include <algorithm>
#include <chrono>

namespace art_dna {

DNAPipeline::DNAPipeline(const DNAConfig& config, WorkerPool& pool)
    : m_budget_ms(config.hot_path_budget_ms), m_encoder(config), m_pool(pool) {}

HotPathResult DNAPipeline::encode_stroke(const StrokeInput& input, const ArtistContext& context) {
    double start = GetSteadyMillis();

    HotPathResult result;
    try {
        result.stroke_dna = m_encoder.encode(input, &context);
    } catch (const std::exception& e) {
        LogPrintPipeline(ERROR, "Hot path encoding failed for stroke %s: %s", input.stroke_id.c_str(), e.what());
        throw;
    }

    result.encoding_time_ms = std::max(0.0, GetSteadyMillis() - start);
    result.within_budget = result.encoding_time_ms <= m_budget_ms;

    std::lock_guard<std::mutex> lock(m_metrics_mutex);
    m_metrics.total_encodings++;
    m_hot_total_ms += result.encoding_time_ms;
    m_metrics.avg_hot_path_time_ms = m_hot_total_ms / static_cast<double>(m_metrics.total_encodings);
    if (!result.within_budget) {
        m_metrics.hot_path_violations++;
        LogPrintPipeline(WARN, "Hot path violation: %.2fms (budget: %.0fms)", result.encoding_time_ms, m_budget_ms);
    }
    return result;
}

HotPathResult DNAPipeline::process_stroke(DNASession& session, const StrokeInput& input, const ArtistContext& context,
                                          const std::optional<CanvasSnapshot>& snapshot,
                                          const SessionActivity& activity) {
    StrokeInput owned = input;
    if (owned.session_id.empty()) owned.session_id = session.session_id;

    HotPathResult result = encode_stroke(owned, context);
    session.add_stroke(result.stroke_dna);

    schedule_cold_path(session, context, snapshot, activity);
    return result;
}

void DNAPipeline::schedule_cold_path(const DNASession& session, const ArtistContext& context,
                                     const std::optional<CanvasSnapshot>& snapshot,
                                     const SessionActivity& activity) {
    std::vector<PendingTask> tasks;
    if (snapshot) {
        tasks.push_back({WorkerMessageType::ENCODE_IMAGE,
                         m_pool.submit(WorkerMessage::EncodeImage(*snapshot, session.session_id))});
    }
    tasks.push_back({WorkerMessageType::ENCODE_TEMPORAL,
                     m_pool.submit(WorkerMessage::EncodeTemporal(session, context, activity))});

    std::lock_guard<std::mutex> lock(m_pending_mutex);
    std::vector<PendingTask>& pending = m_pending[session.session_id];
    for (PendingTask& task : tasks) pending.push_back(std::move(task));
}

size_t DNAPipeline::merge_ready(DNASession& session, std::vector<PendingTask>& ready) {
    size_t merged = 0;
    for (PendingTask& task : ready) {
        try {
            WorkerResponse response = task.future.get();
            if (response.image_dna) {
                session.image_dna.push_back(std::move(*response.image_dna));
                merged++;
            }
            if (response.temporal_dna) {
                session.temporal_dna.push_back(std::move(*response.temporal_dna));
                merged++;
            }

            std::lock_guard<std::mutex> lock(m_metrics_mutex);
            m_metrics.cold_path_completed++;
            m_cold_total_ms += response.encoding_time_ms;
            m_metrics.avg_cold_path_time_ms = m_cold_total_ms / static_cast<double>(m_metrics.cold_path_completed);
        } catch (const WorkerFailure& e) {
            LogPrintPipeline(WARN, "%s", CErrorFormatter::FormatForLog(CErrorFormatter::WorkerError(
                WorkerMessageTypeName(task.type), "session " + session.session_id + ": " + e.what())).c_str());
            std::lock_guard<std::mutex> lock(m_metrics_mutex);
            m_metrics.cold_path_failures++;
        }
    }
    return merged;
}

size_t DNAPipeline::merge_completed(DNASession& session) {
    std::vector<PendingTask> ready;
    {
        std::lock_guard<std::mutex> lock(m_pending_mutex);
        auto it = m_pending.find(session.session_id);
        if (it == m_pending.end()) return 0;

        // Only a prefix is taken so results keep submission order
        std::vector<PendingTask>& pending = it->second;
        size_t done = 0;
        while (done < pending.size() &&
               pending[done].future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            done++;
        }
        for (size_t i = 0; i < done; i++) ready.push_back(std::move(pending[i]));
        pending.erase(pending.begin(), pending.begin() + done);
        if (pending.empty()) m_pending.erase(it);
    }
    return merge_ready(session, ready);
}

size_t DNAPipeline::wait_for_cold_path(DNASession& session) {
    std::vector<PendingTask> all;
    {
        std::lock_guard<std::mutex> lock(m_pending_mutex);
        auto it = m_pending.find(session.session_id);
        if (it == m_pending.end()) return 0;
        all = std::move(it->second);
        m_pending.erase(it);
    }
    for (PendingTask& task : all) task.future.wait();
    return merge_ready(session, all);
}

size_t DNAPipeline::pending_count(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(m_pending_mutex);
    auto it = m_pending.find(session_id);
    return it == m_pending.end() ? 0 : it->second.size();
}

PipelineMetrics DNAPipeline::get_metrics() const {
    WorkerPool::Stats pool = m_pool.get_stats();
    std::lock_guard<std::mutex> lock(m_metrics_mutex);
    PipelineMetrics metrics = m_metrics;
    metrics.worker_utilization = pool.total_workers > 0
        ? static_cast<double>(pool.pending_tasks) / static_cast<double>(pool.total_workers)
        : 0.0;
    return metrics;
}

std::string DNAPipeline::get_performance_summary() const {
    PipelineMetrics m = get_metrics();
    double violation_rate = m.total_encodings > 0
        ? static_cast<double>(m.hot_path_violations) / static_cast<double>(m.total_encodings) * 100.0
        : 0.0;

    return strprintf("Pipeline Performance:\n"
                     "- Total encodings: %llu\n"
                     "- Hot path avg: %.2fms\n"
                     "- Cold path avg: %.2fms\n"
                     "- Budget violations: %llu (%.1f%%)\n"
                     "- Worker utilization: %.1f%%",
                     static_cast<unsigned long long>(m.total_encodings),
                     m.avg_hot_path_time_ms, m.avg_cold_path_time_ms,
                     static_cast<unsigned long long>(m.hot_path_violations), violation_rate,
                     m.worker_utilization * 100.0);
}

void DNAPipeline::reset_metrics() {
    std::lock_guard<std::mutex> lock(m_metrics_mutex);
    m_metrics = PipelineMetrics();
    m_hot_total_ms = 0.0;
    m_cold_total_ms = 0.0;
}

bool DNAPipeline::is_healthy() const {
    std::lock_guard<std::mutex> lock(m_metrics_mutex);
    double violation_rate = m_metrics.total_encodings > 0
        ? static_cast<double>(m_metrics.hot_path_violations) / static_cast<double>(m_metrics.total_encodings)
        : 0.0;
    return m_metrics.avg_hot_path_time_ms < m_budget_ms && violation_rate < 0.05;
}

} // namespace art_dna
