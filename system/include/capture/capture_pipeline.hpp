// ============= include/capture/capture_pipeline.hpp =============
/*
 * Capture Pipeline
 *
 * payload (base64) -> imagen -> FeatureExtractor -> exactamente 1 rostro
 * -> embedding -> CaptureTicket (upsert por session token)
 *
 * ERRORES (FaceGateError):
 * - InvalidInput          payload vacio o menor a min_payload_chars
 * - DecodeFailure         base64 o imagen invalidos
 * - NoFaceDetected        0 rostros
 * - MultipleFacesDetected mas de 1 rostro
 * - EncodingFailure       rostro sin embedding utilizable
 *
 * Cada resultado (exito o fallo) deja una entrada en el audit log.
 */

#pragma once
#include "audit/audit_log.hpp"
#include "core/config.hpp"
#include "storage/storage.hpp"
#include "vision/feature_extractor.hpp"
#include <string>
#include <vector>

namespace facegate {

class CapturePipeline {
public:
    CapturePipeline(Storage& storage,
                    FeatureExtractor& extractor,
                    AuditLog& audit,
                    const AppConfig::Capture& config = AppConfig::Capture());

    // Deja exactamente un ticket valido para session_token
    void capture(const std::string& session_token, const std::string& payload);

    // Idempotente
    void clear(const std::string& session_token);

    // Misma validacion que capture() sin guardar nada.
    // purpose aparece en los mensajes de auditoria ("registration", "approval").
    std::vector<float> live_embedding(const std::string& payload, const std::string& purpose);

private:
    Storage& storage;
    FeatureExtractor& extractor;
    AuditLog& audit;
    AppConfig::Capture config;
};

}  // namespace facegate
