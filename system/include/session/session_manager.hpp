// ============= include/session/session_manager.hpp =============
#pragma once
#include "audit/audit_log.hpp"
#include "storage/storage.hpp"
#include <string>

namespace facegate {

// Una sesion activa por persona: issue() reemplaza cualquier sesion previa
// con el mismo nombre. Las sesiones no expiran solas.
class SessionManager {
public:
    SessionManager(Storage& storage, AuditLog& audit);

    AccessSession issue(const Identity& identity, double confidence);

    // NotFound si el id no existe
    AccessSession get(const std::string& session_id);
    void end(const std::string& session_id);

private:
    Storage& storage;
    AuditLog& audit;
};

}  // namespace facegate
