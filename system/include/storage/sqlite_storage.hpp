// ============= include/storage/sqlite_storage.hpp =============
/*
 * SQLite Storage - backend durable
 *
 * TABLAS:
 * ├── identities       (name UNIQUE, embedding BLOB de floats)
 * ├── capture_tickets  (session_token PRIMARY KEY, created_at indexado)
 * ├── sessions         (session_id PRIMARY KEY, name UNIQUE)
 * └── console_logs     (id AUTOINCREMENT, timestamp indexado)
 *
 * - Una sola conexion protegida por db_mutex, journal WAL
 * - Operaciones multi-fila en transacciones BEGIN IMMEDIATE
 * - La unicidad la imponen los constraints, no el codigo
 * - TTL de tickets: filtro por created_at en lectura + purga en cada escritura
 */

#pragma once
#include "storage/storage.hpp"
#include <mutex>
#include <sqlite3.h>

namespace facegate {

class SqliteStorage : public Storage {
public:
    // Lanza std::runtime_error si no puede abrir o crear el schema
    SqliteStorage(const std::string& db_path, int64_t ticket_ttl_ms);
    ~SqliteStorage() override;

    std::string backend_name() const override { return "sqlite"; }

    // SELECT 1 contra la conexion abierta
    bool ping();

    const std::string& path() const { return db_path; }

    std::optional<Identity> find_identity(const std::string& name) override;
    std::vector<Identity> list_identities() override;
    size_t count_identities() override;
    EnrollOutcome commit_enrollment(const Identity& identity, const std::string& ticket_token,
                                    int64_t now) override;
    UpdateOutcome update_identity(const std::string& old_name,
                                  const std::string& new_name,
                                  const std::string& group,
                                  const std::string& roll) override;
    bool delete_identity(const std::string& name) override;

    void upsert_ticket(const CaptureTicket& ticket) override;
    std::optional<CaptureTicket> find_ticket(const std::string& token, int64_t now) override;
    bool delete_ticket(const std::string& token) override;
    size_t purge_expired_tickets(int64_t now) override;

    size_t replace_session(const AccessSession& session) override;
    std::optional<AccessSession> find_session(const std::string& session_id) override;
    bool delete_session(const std::string& session_id) override;
    std::vector<AccessSession> list_sessions() override;

    void append_log(const LogEntry& entry, size_t retain) override;
    std::vector<LogEntry> recent_logs(size_t limit) override;

private:
    sqlite3* db;
    std::string db_path;
    std::mutex db_mutex;

    bool init_database();
    bool create_tables();

    size_t purge_expired_locked(int64_t now);

    static std::vector<unsigned char> serialize_embedding(const std::vector<float>& emb);
    static std::vector<float> deserialize_embedding(const void* data, int size);
};

}  // namespace facegate
