#include "storage/memory_storage.hpp"
#include "core/utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

namespace facegate {

MemoryStorage::MemoryStorage(int64_t ticket_ttl_ms, int sweep_interval_sec)
    : Storage(ticket_ttl_ms), sweep_interval_sec(sweep_interval_sec)
{
    spdlog::warn("Storage en memoria: los datos se pierden al reiniciar");

    if (sweep_interval_sec > 0) {
        running = true;
        sweep_thread = std::thread(&MemoryStorage::sweep_loop, this);
    }
}

MemoryStorage::~MemoryStorage() {
    if (running.load()) {
        {
            std::lock_guard<std::mutex> lock(sweep_mutex);
            running = false;
        }
        sweep_cv.notify_all();
    }
    if (sweep_thread.joinable()) sweep_thread.join();
}

void MemoryStorage::sweep_loop() {
    spdlog::info("🔧 Sweep de tickets iniciado (cada {}s)", sweep_interval_sec);

    std::unique_lock<std::mutex> lock(sweep_mutex);
    while (running.load()) {
        sweep_cv.wait_for(lock, std::chrono::seconds(sweep_interval_sec), [this] {
            return !running.load();
        });
        if (!running.load()) break;

        size_t purged = purge_expired_tickets(now_ms());
        if (purged > 0) {
            spdlog::debug("Sweep: {} tickets expirados eliminados", purged);
        }
    }

    spdlog::info("🔧 Sweep de tickets detenido");
}

// ==================== IDENTITIES ====================

std::vector<Identity>::iterator MemoryStorage::find_identity_locked(const std::string& name) {
    return std::find_if(identities.begin(), identities.end(),
                        [&name](const Identity& i) { return i.name == name; });
}

std::optional<Identity> MemoryStorage::find_identity(const std::string& name) {
    std::lock_guard<std::mutex> lock(data_mutex);
    auto it = find_identity_locked(name);
    if (it == identities.end()) return std::nullopt;
    return *it;
}

std::vector<Identity> MemoryStorage::list_identities() {
    std::lock_guard<std::mutex> lock(data_mutex);
    return identities;
}

size_t MemoryStorage::count_identities() {
    std::lock_guard<std::mutex> lock(data_mutex);
    return identities.size();
}

EnrollOutcome MemoryStorage::commit_enrollment(const Identity& identity,
                                               const std::string& ticket_token,
                                               int64_t now) {
    std::lock_guard<std::mutex> lock(data_mutex);

    auto ticket = tickets.find(ticket_token);
    if (ticket == tickets.end() || ticket_expired(ticket->second, now)) {
        return EnrollOutcome::TicketMissing;
    }

    if (find_identity_locked(identity.name) != identities.end()) {
        return EnrollOutcome::NameTaken;
    }

    identities.push_back(identity);
    tickets.erase(ticket);
    return EnrollOutcome::Committed;
}

UpdateOutcome MemoryStorage::update_identity(const std::string& old_name,
                                             const std::string& new_name,
                                             const std::string& group,
                                             const std::string& roll) {
    std::lock_guard<std::mutex> lock(data_mutex);

    auto it = find_identity_locked(old_name);
    if (it == identities.end()) return UpdateOutcome::NotFound;

    if (old_name != new_name && find_identity_locked(new_name) != identities.end()) {
        return UpdateOutcome::NameTaken;
    }

    it->name = new_name;
    it->group = group;
    it->roll = roll;
    return UpdateOutcome::Updated;
}

bool MemoryStorage::delete_identity(const std::string& name) {
    std::lock_guard<std::mutex> lock(data_mutex);

    auto it = find_identity_locked(name);
    if (it == identities.end()) return false;

    identities.erase(it);
    return true;
}

// ==================== CAPTURE TICKETS ====================

void MemoryStorage::upsert_ticket(const CaptureTicket& ticket) {
    std::lock_guard<std::mutex> lock(data_mutex);
    tickets[ticket.session_token] = ticket;
}

std::optional<CaptureTicket> MemoryStorage::find_ticket(const std::string& token, int64_t now) {
    std::lock_guard<std::mutex> lock(data_mutex);

    auto it = tickets.find(token);
    if (it == tickets.end()) return std::nullopt;

    if (ticket_expired(it->second, now)) {
        tickets.erase(it);
        return std::nullopt;
    }
    return it->second;
}

bool MemoryStorage::delete_ticket(const std::string& token) {
    std::lock_guard<std::mutex> lock(data_mutex);
    return tickets.erase(token) > 0;
}

size_t MemoryStorage::purge_expired_tickets(int64_t now) {
    std::lock_guard<std::mutex> lock(data_mutex);

    size_t purged = 0;
    auto it = tickets.begin();
    while (it != tickets.end()) {
        if (ticket_expired(it->second, now)) {
            it = tickets.erase(it);
            purged++;
        } else {
            ++it;
        }
    }
    return purged;
}

// ==================== SESSIONS ====================

size_t MemoryStorage::replace_session(const AccessSession& session) {
    std::lock_guard<std::mutex> lock(data_mutex);

    size_t removed = 0;
    auto it = sessions.begin();
    while (it != sessions.end()) {
        if (it->second.name == session.name) {
            it = sessions.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    sessions[session.session_id] = session;
    return removed;
}

std::optional<AccessSession> MemoryStorage::find_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(data_mutex);

    auto it = sessions.find(session_id);
    if (it == sessions.end()) return std::nullopt;
    return it->second;
}

bool MemoryStorage::delete_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(data_mutex);
    return sessions.erase(session_id) > 0;
}

std::vector<AccessSession> MemoryStorage::list_sessions() {
    std::lock_guard<std::mutex> lock(data_mutex);

    std::vector<AccessSession> out;
    out.reserve(sessions.size());
    for (const auto& kv : sessions) out.push_back(kv.second);
    return out;
}

// ==================== LOGS ====================

void MemoryStorage::append_log(const LogEntry& entry, size_t retain) {
    std::lock_guard<std::mutex> lock(data_mutex);

    logs.push_back(entry);
    while (logs.size() > retain) {
        logs.pop_front();
    }
}

std::vector<LogEntry> MemoryStorage::recent_logs(size_t limit) {
    std::lock_guard<std::mutex> lock(data_mutex);

    std::vector<LogEntry> out;
    out.reserve(std::min(limit, logs.size()));
    for (auto it = logs.rbegin(); it != logs.rend() && out.size() < limit; ++it) {
        out.push_back(*it);
    }
    return out;
}

}  // namespace facegate
