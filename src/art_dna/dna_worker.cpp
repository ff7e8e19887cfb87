// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/dna_worker.h>

#include <art_dna/distance_calculator.h>
#include <art_dna/dna_errors.h>
#include <util/logging.h>
#include <util/time.h>

#include <algorithm>

namespace art_dna {

std::string WorkerMessageTypeName(WorkerMessageType type) {
    switch (type) {
        case WorkerMessageType::ENCODE_IMAGE: return "encode_image";
        case WorkerMessageType::ENCODE_TEMPORAL: return "encode_temporal";
        case WorkerMessageType::CALCULATE_DISTANCE: return "calculate_distance";
        case WorkerMessageType::BATCH_DISTANCE: return "batch_distance";
    }
    return "unknown";
}

WorkerMessage WorkerMessage::EncodeImage(const CanvasSnapshot& snapshot, const std::string& session_id) {
    WorkerMessage msg;
    msg.type = WorkerMessageType::ENCODE_IMAGE;
    msg.snapshot = snapshot;
    msg.session_id = session_id;
    return msg;
}

WorkerMessage WorkerMessage::EncodeTemporal(const DNASession& session, const ArtistContext& context,
                                            const SessionActivity& activity) {
    WorkerMessage msg;
    msg.type = WorkerMessageType::ENCODE_TEMPORAL;
    msg.session = session;
    msg.context = context;
    msg.activity = activity;
    msg.session_id = session.session_id;
    return msg;
}

WorkerMessage WorkerMessage::CalculateDistance(const std::vector<float>& a, const std::vector<float>& b,
                                               DistanceMetric metric) {
    WorkerMessage msg;
    msg.type = WorkerMessageType::CALCULATE_DISTANCE;
    msg.dna_a = a;
    msg.dna_b = b;
    msg.metric = metric;
    return msg;
}

WorkerMessage WorkerMessage::BatchDistance(const std::vector<float>& query,
                                           const std::vector<std::vector<float>>& targets,
                                           DistanceMetric metric) {
    WorkerMessage msg;
    msg.type = WorkerMessageType::BATCH_DISTANCE;
    msg.dna_a = query;
    msg.targets = targets;
    msg.metric = metric;
    return msg;
}

WorkerResponse WorkerResponse::Error(const std::string& message) {
    WorkerResponse response;
    response.type = WorkerResponseType::ERROR;
    response.error = message;
    return response;
}

DNAWorker::DNAWorker(const DNAConfig& config)
    : image_encoder_(config) {}

WorkerResponse DNAWorker::handle(const WorkerMessage& message) {
    double start = GetSteadyMillis();
    WorkerResponse response;

    try {
        switch (message.type) {
            case WorkerMessageType::ENCODE_IMAGE:
                if (!message.snapshot) return WorkerResponse::Error("encode_image without a snapshot");
                response.type = WorkerResponseType::ENCODE_IMAGE_RESULT;
                response.image_dna = image_encoder_.encode_in_worker(*message.snapshot, message.session_id);
                break;

            case WorkerMessageType::ENCODE_TEMPORAL:
                if (!message.session || !message.context) {
                    return WorkerResponse::Error("encode_temporal without session and context");
                }
                response.type = WorkerResponseType::ENCODE_TEMPORAL_RESULT;
                response.temporal_dna = temporal_encoder_.encode_in_worker(*message.session, *message.context,
                                                                           message.activity);
                break;

            case WorkerMessageType::CALCULATE_DISTANCE: {
                DistanceCalculator calculator(message.metric);
                response.type = WorkerResponseType::DISTANCE_RESULT;
                response.distance = calculator.calculate_distance(message.dna_a, message.dna_b);
                break;
            }

            case WorkerMessageType::BATCH_DISTANCE: {
                DistanceCalculator calculator(message.metric);
                response.type = WorkerResponseType::BATCH_DISTANCE_RESULT;
                response.distances = calculator.calculate_batch_distances(message.dna_a, message.targets);
                break;
            }
        }
    } catch (const InvalidInput& e) {
        LogPrintWorker(WARN, "%s rejected: %s", WorkerMessageTypeName(message.type).c_str(), e.what());
        return WorkerResponse::Error(e.what());
    } catch (const DimensionMismatch& e) {
        LogPrintWorker(WARN, "%s rejected: %s", WorkerMessageTypeName(message.type).c_str(), e.what());
        return WorkerResponse::Error(e.what());
    }

    response.encoding_time_ms = std::max(0.0, GetSteadyMillis() - start);
    return response;
}

} // namespace art_dna
