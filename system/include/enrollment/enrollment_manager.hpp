// ============= include/enrollment/enrollment_manager.hpp =============
#pragma once
#include "audit/audit_log.hpp"
#include "storage/storage.hpp"
#include <string>

namespace facegate {

struct EnrollmentResult {
    std::string access_code;
    std::string name;
};

// Convierte el CaptureTicket de una sesion en una Identity permanente.
// Insert de la identidad + borrado del ticket ocurren en una sola operacion
// del storage, de modo que nunca se observa un estado intermedio.
class EnrollmentManager {
public:
    EnrollmentManager(Storage& storage, AuditLog& audit);

    // InvalidInput | MissingCapture | DuplicateIdentity | StorageUnavailable
    EnrollmentResult enroll(const std::string& session_token,
                            const std::string& name,
                            const std::string& group,
                            const std::string& roll);

    // 12 caracteres hexadecimales en mayusculas
    static std::string generate_access_code();

private:
    Storage& storage;
    AuditLog& audit;
};

}  // namespace facegate
