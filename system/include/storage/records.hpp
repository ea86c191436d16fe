// ============= include/storage/records.hpp =============
/*
 * Registros persistidos por FaceGate
 *
 * COLECCIONES:
 * ├── identities       - personas registradas (name = clave unica)
 * ├── capture_tickets  - rostro capturado pendiente de registro (TTL 1h)
 * ├── sessions         - accesos activos (uno por persona)
 * └── console_logs     - auditoria (ultimas 100 entradas)
 *
 * Los timestamps son milisegundos Unix.
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace facegate {

struct Identity {
    std::string name;
    std::vector<float> embedding;   // inmutable tras el registro
    std::string group;              // "class" en la API
    std::string roll;
    std::string access_code;
    int64_t registered_at = 0;
};

struct CaptureTicket {
    std::string session_token;
    std::string preview;            // solo auditoria/UI, nunca para matching
    std::vector<float> embedding;
    int64_t created_at = 0;
};

struct AccessSession {
    std::string session_id;
    std::string name;               // referencia por valor a Identity
    std::string group;
    std::string roll;
    std::string access_code;
    int64_t started_at = 0;
    double confidence = 0.0;        // 0 - 100
};

struct LogEntry {
    int64_t timestamp = 0;
    std::string action;
    std::string formatted;          // "[YYYY-MM-DD HH:MM:SS] action"
};

}  // namespace facegate
