// ============= include/storage/storage.hpp =============
/*
 * Storage - contrato comun de persistencia
 *
 * IMPLEMENTACIONES:
 * - SqliteStorage: durable, constraints UNIQUE + transacciones
 * - MemoryStorage: volatil (fallback), mutex + sweep de tickets
 *
 * Ambas deben comportarse igual vista desde los componentes.
 * Cualquier fallo del backend se lanza como FaceGateError(StorageUnavailable).
 */

#pragma once
#include "storage/records.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace facegate {

enum class EnrollOutcome {
    Committed,
    NameTaken,
    TicketMissing
};

enum class UpdateOutcome {
    Updated,
    NotFound,
    NameTaken
};

class Storage {
public:
    explicit Storage(int64_t ticket_ttl_ms) : ticket_ttl_ms_(ticket_ttl_ms) {}
    virtual ~Storage() = default;

    Storage(const Storage&) = delete;
    Storage& operator=(const Storage&) = delete;

    virtual std::string backend_name() const = 0;

    // ===== IDENTITIES =====

    virtual std::optional<Identity> find_identity(const std::string& name) = 0;

    // Orden de registro
    virtual std::vector<Identity> list_identities() = 0;

    virtual size_t count_identities() = 0;

    // Consume el ticket vigente e inserta la identidad en una sola operacion.
    // NameTaken / TicketMissing: nada cambia (el ticket sigue si existia).
    virtual EnrollOutcome commit_enrollment(const Identity& identity,
                                            const std::string& ticket_token,
                                            int64_t now) = 0;

    // Cambia name/group/roll; el embedding no se toca
    virtual UpdateOutcome update_identity(const std::string& old_name,
                                          const std::string& new_name,
                                          const std::string& group,
                                          const std::string& roll) = 0;

    virtual bool delete_identity(const std::string& name) = 0;

    // ===== CAPTURE TICKETS =====

    // Reemplaza (no mezcla) el ticket previo del mismo token
    virtual void upsert_ticket(const CaptureTicket& ticket) = 0;

    // Tickets expirados son invisibles
    virtual std::optional<CaptureTicket> find_ticket(const std::string& token, int64_t now) = 0;

    virtual bool delete_ticket(const std::string& token) = 0;

    virtual size_t purge_expired_tickets(int64_t now) = 0;

    // ===== SESSIONS =====

    // Borra todas las sesiones de session.name e inserta la nueva.
    // Retorna cuantas sesiones fueron reemplazadas.
    virtual size_t replace_session(const AccessSession& session) = 0;

    virtual std::optional<AccessSession> find_session(const std::string& session_id) = 0;

    virtual bool delete_session(const std::string& session_id) = 0;

    virtual std::vector<AccessSession> list_sessions() = 0;

    // ===== LOGS =====

    // Inserta y recorta a las `retain` entradas mas recientes
    virtual void append_log(const LogEntry& entry, size_t retain) = 0;

    // Mas reciente primero
    virtual std::vector<LogEntry> recent_logs(size_t limit) = 0;

    int64_t ticket_ttl_ms() const { return ticket_ttl_ms_; }

protected:
    bool ticket_expired(const CaptureTicket& ticket, int64_t now) const {
        return now - ticket.created_at >= ticket_ttl_ms_;
    }

private:
    int64_t ticket_ttl_ms_;
};

}  // namespace facegate
