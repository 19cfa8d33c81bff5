// ============= include/pipeline/attendance_pipeline.hpp =============
/*
 * Attendance Pipeline
 *
 *   bytes ──► provider ──► FrameProcessor (snapshot) ──► Deduplicator ──► FrameResponse
 *
 * Compartido por la sesión de streaming y por la captura single-shot.
 * La respuesta es un variant resuelto una sola vez antes de serializar:
 *   SingleResponse | MultipleResponse | ErrorResponse | NoFaceResponse
 */

#pragma once
#include "attendance/deduplicator.hpp"
#include "attendance/office_policy.hpp"
#include "gallery/embedding_gallery.hpp"
#include "matching/frame_processor.hpp"
#include "provider/embedding_provider.hpp"
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rollcall {

enum class FaceOutcome {
    Accepted,        // evento nuevo persistido
    AlreadyMarked,   // dentro del cooldown
    Unmatched,       // below_threshold / ambiguous_match / empty_gallery
    PersistFailed    // match válido pero el append falló
};

struct FaceResult {
    MatchResult match;
    FaceOutcome outcome = FaceOutcome::Unmatched;
    EventType event_type = EventType::Entry;
    std::optional<TimePoint> timestamp;   // nuevo evento o el previo (already_marked)
    int64_t event_id = 0;
    std::optional<Punctuality> punctuality;   // solo eventos aceptados con horario
};

struct SingleResponse {
    FaceResult face;
};

struct MultipleResponse {
    std::vector<FaceResult> faces;
};

enum class ErrorKind {
    Decode,
    ProviderTimeout,
    Provider,
    Cancelled,
    Internal
};

struct ErrorResponse {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
};

struct NoFaceResponse {};

using FrameResponse = std::variant<SingleResponse, MultipleResponse, ErrorResponse, NoFaceResponse>;

struct DiagnosticResult {
    bool match_found = false;
    std::optional<RankedSimilarity> best_match;
    float threshold = 0.0f;
    std::vector<RankedSimilarity> all_similarities;
};

class AttendancePipeline {
public:
    // Notificación por cada evento aceptado (broadcast)
    using EventListener = std::function<void(const AttendanceEvent&,
                                             const std::string& display_name,
                                             const std::optional<Punctuality>& punctuality)>;

    // true -> abandonar el mensaje en el próximo punto de suspensión
    using CancelCheck = std::function<bool()>;

    AttendancePipeline(EmbeddingGallery& gallery,
                       const FrameProcessor& processor,
                       Deduplicator& deduplicator,
                       EmbeddingProvider& provider,
                       float threshold,
                       const OfficePolicy* office = nullptr);

    // Provider -> embeddings. Lanza DecodeError / ProviderTimeout / ProviderError
    std::vector<std::vector<float>> extract_embeddings(const std::string& image_bytes);

    // Matching + dedup sobre embeddings ya extraídos
    FrameResponse recognize(const std::vector<std::vector<float>>& queries,
                            EventType event_type,
                            TimePoint now,
                            const CancelCheck& cancelled = {});

    // Camino completo; los errores se devuelven como ErrorResponse
    FrameResponse capture(const std::string& image_bytes,
                          EventType event_type,
                          const CancelCheck& cancelled = {});

    // Ranking completo de la primera cara. NoFaceDetected si no hay cara
    DiagnosticResult diagnose(const std::string& image_bytes, float threshold);

    void set_event_listener(EventListener listener) { on_event = std::move(listener); }

    float threshold() const { return match_threshold; }

private:
    EmbeddingGallery& gallery;
    const FrameProcessor& processor;
    Deduplicator& deduplicator;
    EmbeddingProvider& provider;
    float match_threshold;
    const OfficePolicy* office;
    EventListener on_event;

    FaceResult resolve(const MatchResult& match, EventType event_type, TimePoint now);
};

// Mapea excepciones del motor a ErrorResponse
ErrorResponse to_error_response(const std::exception& e);

}  // namespace rollcall
