// ============= src/capture/capture_pipeline.cpp =============
#include "capture/capture_pipeline.hpp"
#include "core/errors.hpp"
#include "core/utils.hpp"
#include "vision/image_decoder.hpp"
#include <spdlog/spdlog.h>

namespace facegate {

CapturePipeline::CapturePipeline(Storage& storage,
                                 FeatureExtractor& extractor,
                                 AuditLog& audit,
                                 const AppConfig::Capture& config)
    : storage(storage), extractor(extractor), audit(audit), config(config) {}

std::vector<float> CapturePipeline::live_embedding(const std::string& payload,
                                                   const std::string& purpose) {
    // Guard barato antes del decode
    if (payload.empty() || payload.size() < static_cast<size_t>(config.min_payload_chars)) {
        audit.append("ERROR: Invalid face data (" + purpose + ") - image too small or empty");
        throw FaceGateError(ErrorKind::InvalidInput, "Invalid face data - image too small or empty");
    }

    cv::Mat image;
    try {
        image = decode_image_payload(payload);
    } catch (const FaceGateError& e) {
        audit.append("ERROR: Image decode failed (" + purpose + ") - " + e.what());
        throw;
    }

    std::vector<DetectedFace> faces;
    try {
        faces = extractor.extract(image);
    } catch (const cv::Exception& e) {
        audit.append("ERROR: Face extraction failed (" + purpose + ") - " + e.what());
        throw FaceGateError(ErrorKind::EncodingFailure,
                            "Failed to process face. Please try again with better lighting.");
    }

    if (faces.empty()) {
        audit.append("ERROR: No face detected (" + purpose + ")");
        throw FaceGateError(ErrorKind::NoFaceDetected,
                            "No face detected in the image. Please ensure your face is clearly "
                            "visible, well-lit, and centered in the camera.");
    }

    if (faces.size() > 1) {
        audit.append("WARNING: Multiple faces detected (" + std::to_string(faces.size()) +
                     ") (" + purpose + ")");
        throw FaceGateError(ErrorKind::MultipleFacesDetected,
                            "Multiple faces detected (" + std::to_string(faces.size()) +
                            "). Please ensure only one person is in frame.");
    }

    if (faces[0].embedding.empty()) {
        audit.append("ERROR: Failed to generate face encoding (" + purpose + ")");
        throw FaceGateError(ErrorKind::EncodingFailure,
                            "Failed to process face. Please try again with better lighting.");
    }

    return faces[0].embedding;
}

void CapturePipeline::capture(const std::string& session_token, const std::string& payload) {
    std::vector<float> embedding = live_embedding(payload, "registration");

    CaptureTicket ticket;
    ticket.session_token = session_token;
    ticket.preview = payload.substr(0, static_cast<size_t>(config.preview_chars));
    ticket.embedding = std::move(embedding);
    ticket.created_at = now_ms();

    try {
        storage.upsert_ticket(ticket);
    } catch (const FaceGateError& e) {
        audit.append(std::string("ERROR: Face capture failed - ") + e.what());
        throw;
    }

    spdlog::info("✓ Rostro capturado (session {}..., dim={})",
                 session_token.substr(0, 8), ticket.embedding.size());
    audit.append("Face captured and validated for registration (Session: " +
                 session_token.substr(0, 8) + "...)");
}

void CapturePipeline::clear(const std::string& session_token) {
    if (storage.delete_ticket(session_token)) {
        spdlog::debug("Ticket eliminado (session {}...)", session_token.substr(0, 8));
    }
}

}  // namespace facegate
