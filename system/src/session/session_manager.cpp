#include "session/session_manager.hpp"
#include "core/errors.hpp"
#include "core/utils.hpp"
#include <spdlog/spdlog.h>
#include <cstdio>

namespace facegate {

namespace {

std::string format_confidence(double confidence) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", confidence);
    return buf;
}

}  // namespace

SessionManager::SessionManager(Storage& storage, AuditLog& audit)
    : storage(storage), audit(audit) {}

AccessSession SessionManager::issue(const Identity& identity, double confidence) {
    AccessSession session;
    session.session_id = random_hex(16);
    session.name = identity.name;
    session.group = identity.group;
    session.roll = identity.roll;
    session.access_code = identity.access_code;
    session.started_at = now_ms();
    session.confidence = confidence;

    size_t replaced = storage.replace_session(session);
    if (replaced > 0) {
        spdlog::info("Sesion previa de {} reemplazada ({})", identity.name, replaced);
    }

    audit.append("APPROVAL SUCCESS: " + identity.name + " | Class: " + identity.group +
                 " | Roll: " + identity.roll + " | Confidence: " + format_confidence(confidence) + "%");
    return session;
}

AccessSession SessionManager::get(const std::string& session_id) {
    auto session = storage.find_session(session_id);
    if (!session) {
        throw FaceGateError(ErrorKind::NotFound, "Session not found");
    }
    return *session;
}

void SessionManager::end(const std::string& session_id) {
    if (!storage.delete_session(session_id)) {
        throw FaceGateError(ErrorKind::NotFound, "Session not found");
    }
    audit.append("SESSION ENDED: " + session_id.substr(0, 8) + "...");
}

}  // namespace facegate
