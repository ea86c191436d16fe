// ============= include/admin/admin_service.hpp =============
#pragma once
#include "audit/audit_log.hpp"
#include "core/config.hpp"
#include "storage/storage.hpp"
#include <string>
#include <vector>

namespace facegate {

struct UserSummary {
    std::string name;
    std::string group;
    std::string roll;
    std::string access_code;
    std::string registered_at;   // ISO 8601
};

class AdminService {
public:
    AdminService(Storage& storage, AuditLog& audit, const AppConfig::Admin& credentials);

    // Unauthorized si no coincide o si no hay password configurado
    void login(const std::string& username, const std::string& password);

    std::vector<UserSummary> list_users();

    // NotFound
    void delete_user(const std::string& name);

    // InvalidInput | NotFound | DuplicateIdentity
    void edit_user(const std::string& old_name,
                   const std::string& name,
                   const std::string& group,
                   const std::string& roll);

    std::vector<std::string> logs();

private:
    Storage& storage;
    AuditLog& audit;
    AppConfig::Admin credentials;
};

}  // namespace facegate
