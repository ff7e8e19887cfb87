// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_DNA_WORKER_H
#define ARTDNA_DNA_WORKER_H

/**
 * Typed request/response channel between the pipeline and the worker pool.
 *
 * A WorkerMessage carries one request kind and the payload it needs; the
 * pool stamps it with a task id and the matching WorkerResponse echoes
 * that id back. A handler reports expected failures (bad input, dimension
 * mismatch) as an ERROR response. An exception that escapes handle() is
 * treated by the pool as a worker crash.
 */

#include <art_dna/dna_config.h>
#include <art_dna/dna_types.h>
#include <art_dna/image_encoder.h>
#include <art_dna/temporal_encoder.h>

#include <optional>
#include <string>
#include <vector>

namespace art_dna {

enum class WorkerMessageType : uint8_t {
    ENCODE_IMAGE = 0,
    ENCODE_TEMPORAL,
    CALCULATE_DISTANCE,
    BATCH_DISTANCE
};

enum class WorkerResponseType : uint8_t {
    ENCODE_IMAGE_RESULT = 0,
    ENCODE_TEMPORAL_RESULT,
    DISTANCE_RESULT,
    BATCH_DISTANCE_RESULT,
    ERROR
};

std::string WorkerMessageTypeName(WorkerMessageType type);

struct WorkerMessage {
    WorkerMessageType type = WorkerMessageType::CALCULATE_DISTANCE;
    std::string task_id;

    // ENCODE_IMAGE
    std::optional<CanvasSnapshot> snapshot;
    std::string session_id;

    // ENCODE_TEMPORAL
    std::optional<DNASession> session;
    std::optional<ArtistContext> context;
    SessionActivity activity;

    // CALCULATE_DISTANCE / BATCH_DISTANCE
    std::vector<float> dna_a;
    std::vector<float> dna_b;
    std::vector<std::vector<float>> targets;
    DistanceMetric metric = DistanceMetric::COSINE;

    static WorkerMessage EncodeImage(const CanvasSnapshot& snapshot, const std::string& session_id);
    static WorkerMessage EncodeTemporal(const DNASession& session, const ArtistContext& context,
                                        const SessionActivity& activity = SessionActivity());
    static WorkerMessage CalculateDistance(const std::vector<float>& a, const std::vector<float>& b,
                                           DistanceMetric metric);
    static WorkerMessage BatchDistance(const std::vector<float>& query, const std::vector<std::vector<float>>& targets,
                                       DistanceMetric metric);
};

struct WorkerResponse {
    WorkerResponseType type = WorkerResponseType::ERROR;
    std::string task_id;

    std::optional<ImageDNA> image_dna;
    std::optional<TemporalDNA> temporal_dna;
    double distance = 0.0;
    std::vector<double> distances;
    double encoding_time_ms = 0.0;

    std::string error;  // ERROR only

    static WorkerResponse Error(const std::string& message);
};

/** Executes one request on the calling (worker) thread */
class IWorkerHandler {
public:
    virtual ~IWorkerHandler() = default;
    virtual WorkerResponse handle(const WorkerMessage& message) = 0;
};

/** Default handler: image and temporal encoders plus the distance metrics */
class DNAWorker : public IWorkerHandler {
public:
    explicit DNAWorker(const DNAConfig& config = DNAConfig());

    WorkerResponse handle(const WorkerMessage& message) override;

private:
    ImageEncoder image_encoder_;
    TemporalEncoder temporal_encoder_;
};

} // namespace art_dna

#endif // ARTDNA_DNA_WORKER_H
