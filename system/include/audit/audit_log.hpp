// ============= include/audit/audit_log.hpp =============
/*
 * Audit Log - registro de eventos del sistema
 *
 * - Cada evento se guarda como "[YYYY-MM-DD HH:MM:SS] accion"
 * - Solo se conservan las max_entries mas recientes (100 por defecto)
 * - Un fallo del storage al escribir NUNCA bloquea la operacion principal:
 *   se reporta con spdlog y se descarta
 */

#pragma once
#include "storage/storage.hpp"
#include <string>
#include <vector>

namespace facegate {

class AuditLog {
public:
    AuditLog(Storage& storage, size_t max_entries = 100);

    void append(const std::string& action);

    // Mas reciente primero, a lo sumo max_entries
    std::vector<std::string> recent();

    size_t max_entries() const { return max_entries_; }

private:
    Storage& storage;
    size_t max_entries_;
};

}  // namespace facegate
