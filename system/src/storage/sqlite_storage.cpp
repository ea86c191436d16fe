// ============= src/storage/sqlite_storage.cpp =============
#include "storage/sqlite_storage.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <cstring>
#include <filesystem>

namespace facegate {

namespace {

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
    std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : "no connection");
    spdlog::error("SQLite error - {}", msg);
    throw FaceGateError(ErrorKind::StorageUnavailable, msg);
}

bool is_constraint(int rc) {
    return (rc & 0xFF) == SQLITE_CONSTRAINT;
}

// Prepared statement con finalize automatico
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db(db), stmt(nullptr) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            fail(db, "prepare");
        }
    }

    ~Statement() {
        if (stmt) sqlite3_finalize(stmt);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, const std::string& value) {
        sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bind(int idx, int64_t value) {
        sqlite3_bind_int64(stmt, idx, value);
    }

    void bind(int idx, double value) {
        sqlite3_bind_double(stmt, idx, value);
    }

    void bind_blob(int idx, const std::vector<unsigned char>& blob) {
        if (blob.empty()) {
            sqlite3_bind_zeroblob(stmt, idx, 0);   // NULL violaria NOT NULL
            return;
        }
        sqlite3_bind_blob(stmt, idx, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    }

    // SQLITE_ROW / SQLITE_DONE / constraint; cualquier otro codigo lanza
    int step() {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_ROW && rc != SQLITE_DONE && !is_constraint(rc)) {
            fail(db, "step");
        }
        return rc;
    }

    // step() que solo acepta SQLITE_DONE
    void exec() {
        if (step() != SQLITE_DONE) fail(db, "exec");
    }

    std::string text(int col) const {
        const unsigned char* t = sqlite3_column_text(stmt, col);
        return t ? reinterpret_cast<const char*>(t) : "";
    }

    int64_t int64(int col) const { return sqlite3_column_int64(stmt, col); }
    double real(int col) const { return sqlite3_column_double(stmt, col); }
    const void* blob(int col) const { return sqlite3_column_blob(stmt, col); }
    int bytes(int col) const { return sqlite3_column_bytes(stmt, col); }

private:
    sqlite3* db;
    sqlite3_stmt* stmt;
};

// BEGIN IMMEDIATE ... COMMIT; rollback si no se llego a commit()
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db(db), done(false) {
        if (sqlite3_exec(db, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            fail(db, "begin");
        }
    }

    ~Transaction() {
        if (!done && sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            spdlog::error("SQLite rollback fallido: {}", sqlite3_errmsg(db));
        }
    }

    void commit() {
        if (sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            fail(db, "commit");
        }
        done = true;
    }

private:
    sqlite3* db;
    bool done;
};

}  // namespace

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

SqliteStorage::SqliteStorage(const std::string& db_path, int64_t ticket_ttl_ms)
    : Storage(ticket_ttl_ms), db(nullptr), db_path(db_path)
{
    spdlog::info("🗄️ Inicializando SQLite storage");
    spdlog::info("   Path: {}", db_path);

    std::filesystem::path p(db_path);
    if (db_path != ":memory:" && p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            spdlog::warn("No se pudo crear {}: {}", p.parent_path().string(), ec.message());
        }
    }

    if (!init_database()) {
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
        throw std::runtime_error("No se pudo inicializar la base de datos: " + db_path);
    }

    spdlog::info("✓ SQLite storage listo ({} identidades)", count_identities());
}

SqliteStorage::~SqliteStorage() {
    if (db) sqlite3_close(db);
}

// ==================== INITIALIZATION ====================

bool SqliteStorage::init_database() {
    int rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
        spdlog::error("Cannot open database: {}", db ? sqlite3_errmsg(db) : "out of memory");
        return false;
    }

    sqlite3_busy_timeout(db, 5000);

    char* err = nullptr;
    if (sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &err) != SQLITE_OK) {
        spdlog::warn("WAL no disponible: {}", err ? err : "?");
        sqlite3_free(err);
        err = nullptr;
    }
    if (sqlite3_exec(db, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, &err) != SQLITE_OK) {
        spdlog::warn("PRAGMA synchronous fallido: {}", err ? err : "?");
        sqlite3_free(err);
    }

    return create_tables();
}

bool SqliteStorage::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS identities (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL UNIQUE,
            embedding BLOB NOT NULL,
            class TEXT NOT NULL,
            roll TEXT NOT NULL,
            code TEXT NOT NULL,
            registered_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS capture_tickets (
            session_token TEXT PRIMARY KEY,
            preview TEXT NOT NULL,
            embedding BLOB NOT NULL,
            created_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS sessions (
            session_id TEXT PRIMARY KEY,
            name TEXT NOT NULL UNIQUE,
            class TEXT NOT NULL,
            roll TEXT NOT NULL,
            code TEXT NOT NULL,
            start_time INTEGER NOT NULL,
            match_confidence REAL NOT NULL
        );

        CREATE TABLE IF NOT EXISTS console_logs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp INTEGER NOT NULL,
            action TEXT NOT NULL,
            formatted TEXT NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_tickets_created_at ON capture_tickets(created_at);
        CREATE INDEX IF NOT EXISTS idx_logs_timestamp ON console_logs(timestamp);
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        spdlog::error("SQL error: {}", err_msg ? err_msg : sqlite3_errmsg(db));
        sqlite3_free(err_msg);
        return false;
    }

    return true;
}

bool SqliteStorage::ping() {
    std::lock_guard<std::mutex> lock(db_mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT 1", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bool ok = sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_int(stmt, 0) == 1;
    sqlite3_finalize(stmt);
    return ok;
}

// ==================== SERIALIZATION ====================

std::vector<unsigned char> SqliteStorage::serialize_embedding(const std::vector<float>& emb) {
    std::vector<unsigned char> blob(emb.size() * sizeof(float));
    if (!blob.empty()) std::memcpy(blob.data(), emb.data(), blob.size());
    return blob;
}

std::vector<float> SqliteStorage::deserialize_embedding(const void* data, int size) {
    std::vector<float> emb(size / sizeof(float));
    if (data && !emb.empty()) std::memcpy(emb.data(), data, emb.size() * sizeof(float));
    return emb;
}

// ==================== IDENTITIES ====================

std::optional<Identity> SqliteStorage::find_identity(const std::string& name) {
    std::lock_guard<std::mutex> lock(db_mutex);

    Statement stmt(db, "SELECT name, embedding, class, roll, code, registered_at "
                       "FROM identities WHERE name=?");
    stmt.bind(1, name);

    if (stmt.step() != SQLITE_ROW) return std::nullopt;

    Identity id;
    id.name = stmt.text(0);
    id.embedding = deserialize_embedding(stmt.blob(1), stmt.bytes(1));
    id.group = stmt.text(2);
    id.roll = stmt.text(3);
    id.access_code = stmt.text(4);
    id.registered_at = stmt.int64(5);
    return id;
}

std::vector<Identity> SqliteStorage::list_identities() {
    std::lock_guard<std::mutex> lock(db_mutex);

    Statement stmt(db, "SELECT name, embedding, class, roll, code, registered_at "
                       "FROM identities ORDER BY id");

    std::vector<Identity> out;
    while (stmt.step() == SQLITE_ROW) {
        Identity id;
        id.name = stmt.text(0);
        id.embedding = deserialize_embedding(stmt.blob(1), stmt.bytes(1));
        id.group = stmt.text(2);
        id.roll = stmt.text(3);
        id.access_code = stmt.text(4);
        id.registered_at = stmt.int64(5);
        out.push_back(std::move(id));
    }
    return out;
}

size_t SqliteStorage::count_identities() {
    std::lock_guard<std::mutex> lock(db_mutex);

    Statement stmt(db, "SELECT COUNT(*) FROM identities");
    if (stmt.step() != SQLITE_ROW) return 0;
    return static_cast<size_t>(stmt.int64(0));
}

EnrollOutcome SqliteStorage::commit_enrollment(const Identity& identity,
                                               const std::string& ticket_token,
                                               int64_t now) {
    std::lock_guard<std::mutex> lock(db_mutex);
    Transaction tx(db);

    {
        // Solo un registro puede consumir el ticket
        Statement del(db, "DELETE FROM capture_tickets WHERE session_token=? AND created_at > ?");
        del.bind(1, ticket_token);
        del.bind(2, now - ticket_ttl_ms());
        del.exec();
        if (sqlite3_changes(db) == 0) return EnrollOutcome::TicketMissing;
    }

    {
        Statement insert(db, "INSERT INTO identities (name, embedding, class, roll, code, registered_at) "
                             "VALUES (?, ?, ?, ?, ?, ?)");
        insert.bind(1, identity.name);
        insert.bind_blob(2, serialize_embedding(identity.embedding));
        insert.bind(3, identity.group);
        insert.bind(4, identity.roll);
        insert.bind(5, identity.access_code);
        insert.bind(6, identity.registered_at);

        // UNIQUE(name): el registro concurrente del mismo nombre pierde aqui
        // y el rollback devuelve el ticket
        if (is_constraint(insert.step())) return EnrollOutcome::NameTaken;
    }

    tx.commit();
    return EnrollOutcome::Committed;
}

UpdateOutcome SqliteStorage::update_identity(const std::string& old_name,
                                             const std::string& new_name,
                                             const std::string& group,
                                             const std::string& roll) {
    std::lock_guard<std::mutex> lock(db_mutex);
    Transaction tx(db);

    {
        Statement exists(db, "SELECT 1 FROM identities WHERE name=?");
        exists.bind(1, old_name);
        if (exists.step() != SQLITE_ROW) return UpdateOutcome::NotFound;
    }

    Statement update(db, "UPDATE identities SET name=?, class=?, roll=? WHERE name=?");
    update.bind(1, new_name);
    update.bind(2, group);
    update.bind(3, roll);
    update.bind(4, old_name);

    if (is_constraint(update.step())) return UpdateOutcome::NameTaken;

    tx.commit();
    return UpdateOutcome::Updated;
}

bool SqliteStorage::delete_identity(const std::string& name) {
    std::lock_guard<std::mutex> lock(db_mutex);

    Statement del(db, "DELETE FROM identities WHERE name=?");
    del.bind(1, name);
    del.exec();
    return sqlite3_changes(db) > 0;
}

// ==================== CAPTURE TICKETS ====================

size_t SqliteStorage::purge_expired_locked(int64_t now) {
    Statement del(db, "DELETE FROM capture_tickets WHERE created_at <= ?");
    del.bind(1, now - ticket_ttl_ms());
    del.exec();
    return static_cast<size_t>(sqlite3_changes(db));
}

void SqliteStorage::upsert_ticket(const CaptureTicket& ticket) {
    std::lock_guard<std::mutex> lock(db_mutex);
    Transaction tx(db);

    purge_expired_locked(ticket.created_at);

    Statement upsert(db, "INSERT OR REPLACE INTO capture_tickets "
                         "(session_token, preview, embedding, created_at) VALUES (?, ?, ?, ?)");
    upsert.bind(1, ticket.session_token);
    upsert.bind(2, ticket.preview);
    upsert.bind_blob(3, serialize_embedding(ticket.embedding));
    upsert.bind(4, ticket.created_at);
    upsert.exec();

    tx.commit();
}

std::optional<CaptureTicket> SqliteStorage::find_ticket(const std::string& token, int64_t now) {
    std::lock_guard<std::mutex> lock(db_mutex);

    Statement stmt(db, "SELECT session_token, preview, embedding, created_at "
                       "FROM capture_tickets WHERE session_token=? AND created_at > ?");
    stmt.bind(1, token);
    stmt.bind(2, now - ticket_ttl_ms());

    if (stmt.step() != SQLITE_ROW) return std::nullopt;

    CaptureTicket t;
    t.session_token = stmt.text(0);
    t.preview = stmt.text(1);
    t.embedding = deserialize_embedding(stmt.blob(2), stmt.bytes(2));
    t.created_at = stmt.int64(3);
    return t;
}

bool SqliteStorage::delete_ticket(const std::string& token) {
    std::lock_guard<std::mutex> lock(db_mutex);

    Statement del(db, "DELETE FROM capture_tickets WHERE session_token=?");
    del.bind(1, token);
    del.exec();
    return sqlite3_changes(db) > 0;
}

size_t SqliteStorage::purge_expired_tickets(int64_t now) {
    std::lock_guard<std::mutex> lock(db_mutex);
    return purge_expired_locked(now);
}

// ==================== SESSIONS ====================

size_t SqliteStorage::replace_session(const AccessSession& session) {
    std::lock_guard<std::mutex> lock(db_mutex);
    Transaction tx(db);

    size_t removed = 0;
    {
        Statement del(db, "DELETE FROM sessions WHERE name=?");
        del.bind(1, session.name);
        del.exec();
        removed = static_cast<size_t>(sqlite3_changes(db));
    }

    Statement insert(db, "INSERT INTO sessions (session_id, name, class, roll, code, start_time, match_confidence) "
                         "VALUES (?, ?, ?, ?, ?, ?, ?)");
    insert.bind(1, session.session_id);
    insert.bind(2, session.name);
    insert.bind(3, session.group);
    insert.bind(4, session.roll);
    insert.bind(5, session.access_code);
    insert.bind(6, session.started_at);
    insert.bind(7, session.confidence);

    if (is_constraint(insert.step())) {
        fail(db, "insert session");
    }

    tx.commit();
    return removed;
}

std::optional<AccessSession> SqliteStorage::find_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(db_mutex);

    Statement stmt(db, "SELECT session_id, name, class, roll, code, start_time, match_confidence "
                       "FROM sessions WHERE session_id=?");
    stmt.bind(1, session_id);

    if (stmt.step() != SQLITE_ROW) return std::nullopt;

    AccessSession s;
    s.session_id = stmt.text(0);
    s.name = stmt.text(1);
    s.group = stmt.text(2);
    s.roll = stmt.text(3);
    s.access_code = stmt.text(4);
    s.started_at = stmt.int64(5);
    s.confidence = stmt.real(6);
    return s;
}

bool SqliteStorage::delete_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(db_mutex);

    Statement del(db, "DELETE FROM sessions WHERE session_id=?");
    del.bind(1, session_id);
    del.exec();
    return sqlite3_changes(db) > 0;
}

std::vector<AccessSession> SqliteStorage::list_sessions() {
    std::lock_guard<std::mutex> lock(db_mutex);

    Statement stmt(db, "SELECT session_id, name, class, roll, code, start_time, match_confidence "
                       "FROM sessions ORDER BY start_time");

    std::vector<AccessSession> out;
    while (stmt.step() == SQLITE_ROW) {
        AccessSession s;
        s.session_id = stmt.text(0);
        s.name = stmt.text(1);
        s.group = stmt.text(2);
        s.roll = stmt.text(3);
        s.access_code = stmt.text(4);
        s.started_at = stmt.int64(5);
        s.confidence = stmt.real(6);
        out.push_back(std::move(s));
    }
    return out;
}

// ==================== LOGS ====================

void SqliteStorage::append_log(const LogEntry& entry, size_t retain) {
    std::lock_guard<std::mutex> lock(db_mutex);
    Transaction tx(db);

    {
        Statement insert(db, "INSERT INTO console_logs (timestamp, action, formatted) VALUES (?, ?, ?)");
        insert.bind(1, entry.timestamp);
        insert.bind(2, entry.action);
        insert.bind(3, entry.formatted);
        insert.exec();
    }

    // Elimina lo que quede fuera de las `retain` mas recientes (mas antiguas primero)
    Statement prune(db, "DELETE FROM console_logs WHERE id IN ("
                        "SELECT id FROM console_logs ORDER BY timestamp DESC, id DESC "
                        "LIMIT -1 OFFSET ?)");
    prune.bind(1, static_cast<int64_t>(retain));
    prune.exec();

    tx.commit();
}

std::vector<LogEntry> SqliteStorage::recent_logs(size_t limit) {
    std::lock_guard<std::mutex> lock(db_mutex);

    Statement stmt(db, "SELECT timestamp, action, formatted FROM console_logs "
                       "ORDER BY timestamp DESC, id DESC LIMIT ?");
    stmt.bind(1, static_cast<int64_t>(limit));

    std::vector<LogEntry> out;
    while (stmt.step() == SQLITE_ROW) {
        LogEntry e;
        e.timestamp = stmt.int64(0);
        e.action = stmt.text(1);
        e.formatted = stmt.text(2);
        out.push_back(std::move(e));
    }
    return out;
}

}  // namespace facegate
