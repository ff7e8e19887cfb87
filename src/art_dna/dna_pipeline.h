// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_DNA_PIPELINE_H
#define ARTDNA_DNA_PIPELINE_H

/**
 * Two-pass encoding pipeline.
 *
 * Hot path: the stroke encoder runs synchronously on the caller's thread
 * and is measured against the frame budget (16ms by default).
 *
 * Cold path: image and temporal encodes are submitted to the WorkerPool
 * and never waited on by the hot path. Finished results are held per
 * session until the session's owner calls merge_completed() or
 * wait_for_cold_path() on its own thread; the pipeline never touches a
 * DNASession from a worker.
 */

#include <art_dna/dna_config.h>
#include <art_dna/dna_types.h>
#include <art_dna/stroke_encoder.h>
#include <art_dna/worker_pool.h>

#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace art_dna {

struct PipelineMetrics {
    uint64_t total_encodings{0};
    uint64_t hot_path_violations{0};
    double avg_hot_path_time_ms{0.0};
    double avg_cold_path_time_ms{0.0};
    double worker_utilization{0.0};     // busy workers / pool size, sampled
    uint64_t cold_path_completed{0};
    uint64_t cold_path_failures{0};
};

struct HotPathResult {
    StrokeDNA stroke_dna;
    double encoding_time_ms{0.0};
    bool within_budget{true};
};

class DNAPipeline {
public:
    DNAPipeline(const DNAConfig& config, WorkerPool& pool);

    /**
     * Hot path only: encode one stroke and record its timing.
     * @throws InvalidInput from the stroke encoder; a failed call is not counted
     */
    HotPathResult encode_stroke(const StrokeInput& input, const ArtistContext& context);

    /**
     * Full per-stroke flow: hot-path encode, append the StrokeDNA to the
     * session, then queue a temporal encode of the updated session (and an
     * image encode when a snapshot is given). Returns without waiting on
     * the cold path.
     */
    HotPathResult process_stroke(DNASession& session, const StrokeInput& input, const ArtistContext& context,
                                 const std::optional<CanvasSnapshot>& snapshot = std::nullopt,
                                 const SessionActivity& activity = SessionActivity());

    /** Queue cold-path encodes for the session as it is now */
    void schedule_cold_path(const DNASession& session, const ArtistContext& context,
                            const std::optional<CanvasSnapshot>& snapshot = std::nullopt,
                            const SessionActivity& activity = SessionActivity());

    /**
     * Append finished cold-path results for this session, in submission
     * order. Does not block.
     * @return number of records merged
     */
    size_t merge_completed(DNASession& session);

    /** Block until every outstanding task for the session is done, then merge */
    size_t wait_for_cold_path(DNASession& session);

    /** Outstanding cold-path tasks for the session */
    size_t pending_count(const std::string& session_id) const;

    PipelineMetrics get_metrics() const;
    std::string get_performance_summary() const;
    void reset_metrics();

    /** Average hot time under budget and fewer than 5% of encodes over it */
    bool is_healthy() const;

private:
    struct PendingTask {
        WorkerMessageType type;
        std::future<WorkerResponse> future;
    };

    size_t merge_ready(DNASession& session, std::vector<PendingTask>& ready);

    const double m_budget_ms;
    StrokeEncoder m_encoder;
    WorkerPool& m_pool;

    std::map<std::string, std::vector<PendingTask>> m_pending;
    mutable std::mutex m_pending_mutex;

    mutable std::mutex m_metrics_mutex;
    PipelineMetrics m_metrics;
    double m_hot_total_ms{0.0};
    double m_cold_total_ms{0.0};
};

} // namespace art_dna

#endif // ARTDNA_DNA_PIPELINE_H
