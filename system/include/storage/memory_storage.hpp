// ============= include/storage/memory_storage.hpp =============
/*
 * Memory Storage - fallback sin persistencia
 *
 * - Un solo mutex protege las cuatro colecciones
 * - Unicidad de name / session_token / session_id verificada en codigo
 * - Thread de mantenimiento que purga tickets expirados cada
 *   sweep_interval segundos (0 = sin thread; la lectura igual filtra)
 *
 * Los datos se pierden al reiniciar el proceso.
 */

#pragma once
#include "storage/storage.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>

namespace facegate {

class MemoryStorage : public Storage {
public:
    MemoryStorage(int64_t ticket_ttl_ms, int sweep_interval_sec = 0);
    ~MemoryStorage() override;

    std::string backend_name() const override { return "in-memory"; }

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
    std::mutex data_mutex;

    std::vector<Identity> identities;                   // orden de registro
    std::map<std::string, CaptureTicket> tickets;       // por session_token
    std::map<std::string, AccessSession> sessions;      // por session_id
    std::deque<LogEntry> logs;                          // mas antiguo al frente

    // ===== SWEEP =====
    int sweep_interval_sec;
    std::atomic<bool> running{false};
    std::mutex sweep_mutex;
    std::condition_variable sweep_cv;
    std::thread sweep_thread;

    void sweep_loop();

    std::vector<Identity>::iterator find_identity_locked(const std::string& name);
};

}  // namespace facegate
