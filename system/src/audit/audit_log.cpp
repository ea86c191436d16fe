#include "audit/audit_log.hpp"
#include "core/utils.hpp"
#include <spdlog/spdlog.h>

namespace facegate {

AuditLog::AuditLog(Storage& storage, size_t max_entries)
    : storage(storage), max_entries_(max_entries) {}

void AuditLog::append(const std::string& action) {
    LogEntry entry;
    entry.timestamp = now_ms();
    entry.action = action;
    entry.formatted = "[" + format_timestamp(entry.timestamp) + "] " + action;

    try {
        storage.append_log(entry, max_entries_);
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Error guardando audit log: {}", e.what());
    }
}

std::vector<std::string> AuditLog::recent() {
    std::vector<std::string> out;
    for (const auto& entry : storage.recent_logs(max_entries_)) {
        out.push_back(entry.formatted);
    }
    return out;
}

}  // namespace facegate
