#include "admin/admin_service.hpp"
#include "core/errors.hpp"
#include "core/utils.hpp"
#include <spdlog/spdlog.h>

namespace facegate {

AdminService::AdminService(Storage& storage, AuditLog& audit, const AppConfig::Admin& credentials)
    : storage(storage), audit(audit), credentials(credentials) {
    if (credentials.password.empty()) {
        spdlog::warn("⚠️  admin.password vacio: login de administrador deshabilitado");
    }
}

void AdminService::login(const std::string& username, const std::string& password) {
    bool ok = !credentials.password.empty() &&
              username == credentials.username &&
              password == credentials.password;

    if (!ok) {
        spdlog::warn("Login de administrador rechazado (usuario '{}')", username);
        audit.append("ADMIN LOGIN FAILED: " + username);
        throw FaceGateError(ErrorKind::Unauthorized, "Invalid credentials");
    }

    audit.append("ADMIN LOGIN: " + username);
}

std::vector<UserSummary> AdminService::list_users() {
    std::vector<UserSummary> users;
    for (const auto& identity : storage.list_identities()) {
        UserSummary u;
        u.name = identity.name;
        u.group = identity.group;
        u.roll = identity.roll;
        u.access_code = identity.access_code;
        u.registered_at = format_iso8601(identity.registered_at);
        users.push_back(std::move(u));
    }
    return users;
}

void AdminService::delete_user(const std::string& name) {
    if (!storage.delete_identity(name)) {
        throw FaceGateError(ErrorKind::NotFound, "User not found");
    }
    spdlog::info("Usuario eliminado: {}", name);
    audit.append("USER DELETED: " + name);
}

void AdminService::edit_user(const std::string& old_name,
                             const std::string& raw_name,
                             const std::string& raw_group,
                             const std::string& raw_roll) {
    const std::string name = trim(raw_name);
    const std::string group = trim(raw_group);
    const std::string roll = trim(raw_roll);

    if (old_name.empty() || name.empty() || group.empty() || roll.empty()) {
        throw FaceGateError(ErrorKind::InvalidInput, "All fields are required");
    }

    switch (storage.update_identity(old_name, name, group, roll)) {
        case UpdateOutcome::NotFound:
            throw FaceGateError(ErrorKind::NotFound, "User not found");
        case UpdateOutcome::NameTaken:
            throw FaceGateError(ErrorKind::DuplicateIdentity, "User '" + name + "' already exists");
        case UpdateOutcome::Updated:
            break;
    }

    spdlog::info("Usuario editado: {} -> {}", old_name, name);
    audit.append("USER EDITED: " + old_name + " -> " + name + " | Class: " + group + " | Roll: " + roll);
}

std::vector<std::string> AdminService::logs() {
    return audit.recent();
}

}  // namespace facegate
