// ============= include/core/errors.hpp =============
/*
 * Errores del dominio FaceGate
 *
 * Todas las operaciones de captura, registro, matching y sesiones
 * reportan sus fallos con FaceGateError + ErrorKind. La capa HTTP
 * traduce cada kind a un status code.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace facegate {

enum class ErrorKind {
    InvalidInput,
    DecodeFailure,
    NoFaceDetected,
    MultipleFacesDetected,
    EncodingFailure,
    MissingCapture,
    DuplicateIdentity,
    NotFound,
    NoMatch,
    Unauthorized,
    StorageUnavailable
};

const char* to_string(ErrorKind kind);

class FaceGateError : public std::runtime_error {
public:
    FaceGateError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace facegate
