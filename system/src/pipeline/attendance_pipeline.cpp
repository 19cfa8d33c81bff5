// ============= src/pipeline/attendance_pipeline.cpp =============
#include "pipeline/attendance_pipeline.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace rollcall {

AttendancePipeline::AttendancePipeline(EmbeddingGallery& gallery,
                                       const FrameProcessor& processor,
                                       Deduplicator& deduplicator,
                                       EmbeddingProvider& provider,
                                       float threshold,
                                       const OfficePolicy* office)
    : gallery(gallery), processor(processor), deduplicator(deduplicator),
      provider(provider), match_threshold(threshold), office(office)
{
    if (!(threshold >= 0.0f && threshold <= 1.0f)) {
        throw std::invalid_argument("threshold must be in [0, 1]");
    }
}

std::vector<std::vector<float>> AttendancePipeline::extract_embeddings(const std::string& image_bytes) {
    auto faces = provider.extract(image_bytes);

    std::vector<std::vector<float>> queries;
    queries.reserve(faces.size());
    for (auto& face : faces) {
        queries.push_back(std::move(face.embedding));
    }
    return queries;
}

FaceResult AttendancePipeline::resolve(const MatchResult& match, EventType event_type, TimePoint now) {
    FaceResult face;
    face.match = match;
    face.event_type = event_type;

    if (!match.accepted) {
        face.outcome = FaceOutcome::Unmatched;
        return face;
    }

    Decision decision = deduplicator.decide(*match.identity_id, event_type, match.similarity, now);
    face.timestamp = decision.last_event_at;

    switch (decision.reason) {
        case DecisionReason::Accepted:
            face.outcome = FaceOutcome::Accepted;
            face.event_id = decision.event_id;
            if (office) {
                face.punctuality = office->classify(event_type, now);
            }
            if (on_event) {
                AttendanceEvent event;
                event.event_id = decision.event_id;
                event.identity_id = *match.identity_id;
                event.event_type = event_type;
                event.occurred_at = now;
                event.confidence = match.similarity;
                on_event(event, match.display_name.value_or(""), face.punctuality);
            }
            break;
        case DecisionReason::AlreadyMarked:
            face.outcome = FaceOutcome::AlreadyMarked;
            break;
        case DecisionReason::PersistenceFailed:
            face.outcome = FaceOutcome::PersistFailed;
            break;
    }
    return face;
}

FrameResponse AttendancePipeline::recognize(const std::vector<std::vector<float>>& queries,
                                            EventType event_type,
                                            TimePoint now,
                                            const CancelCheck& cancelled) {
    if (queries.empty()) {
        return NoFaceResponse{};
    }

    auto snapshot = gallery.snapshot();
    auto matches = processor.process(queries, snapshot, match_threshold);

    std::vector<FaceResult> faces;
    faces.reserve(matches.size());
    for (const auto& match : matches) {
        // Punto de suspensión: antes de cada append
        if (cancelled && cancelled()) {
            return ErrorResponse{ErrorKind::Cancelled, "Session closed"};
        }
        faces.push_back(resolve(match, event_type, now));
    }

    spdlog::debug("Pipeline: {} face(s), {} {}", faces.size(), to_string(event_type),
                  faces.size() == 1 ? to_string(faces[0].match.reason) : "multi");

    if (faces.size() == 1) {
        return SingleResponse{std::move(faces[0])};
    }
    return MultipleResponse{std::move(faces)};
}

FrameResponse AttendancePipeline::capture(const std::string& image_bytes,
                                          EventType event_type,
                                          const CancelCheck& cancelled) {
    try {
        auto queries = extract_embeddings(image_bytes);

        // Punto de suspensión: después del provider
        if (cancelled && cancelled()) {
            return ErrorResponse{ErrorKind::Cancelled, "Session closed"};
        }

        return recognize(queries, event_type, Clock::now(), cancelled);
    } catch (const NoFaceDetected&) {
        return NoFaceResponse{};
    } catch (const std::exception& e) {
        return to_error_response(e);
    }
}

DiagnosticResult AttendancePipeline::diagnose(const std::string& image_bytes, float threshold) {
    if (!(threshold >= 0.0f && threshold <= 1.0f)) {
        throw std::invalid_argument("threshold must be in [0, 1]");
    }

    auto queries = extract_embeddings(image_bytes);
    if (queries.empty()) {
        throw NoFaceDetected();
    }

    auto snapshot = gallery.snapshot();

    DiagnosticResult result;
    result.threshold = threshold;
    result.all_similarities = SimilarityMatcher::rank(queries.front(), *snapshot, threshold);
    if (!result.all_similarities.empty()) {
        result.best_match = result.all_similarities.front();
        result.match_found = result.best_match->match;
    }
    return result;
}

ErrorResponse to_error_response(const std::exception& e) {
    if (dynamic_cast<const DecodeError*>(&e)) {
        return {ErrorKind::Decode, e.what()};
    }
    if (dynamic_cast<const ProviderTimeout*>(&e)) {
        return {ErrorKind::ProviderTimeout, e.what()};
    }
    if (dynamic_cast<const ProviderError*>(&e)) {
        spdlog::error("Provider failure: {}", e.what());
        return {ErrorKind::Provider, e.what()};
    }
    spdlog::error("Frame processing failed: {}", e.what());
    return {ErrorKind::Internal, e.what()};
}

}  // namespace rollcall
