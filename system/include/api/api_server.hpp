// ============= include/api/api_server.hpp =============
/*
 * API Server - transporte HTTP/JSON (cpp-httplib + nlohmann::json)
 *
 * ENDPOINTS:
 * ├── POST   /api/capture-face     face_image          -> cookie session_id
 * ├── POST   /api/clear-face       (cookie)
 * ├── POST   /api/register-entry   name, class, roll   (cookie)
 * ├── POST   /api/approve-face     face_image
 * ├── GET    /api/session/{id}
 * ├── POST   /api/end-session      session_id
 * ├── POST   /api/admin/login      username, password
 * ├── GET    /api/admin/users
 * ├── GET    /api/admin/logs
 * ├── DELETE /api/admin/user       name
 * ├── PUT    /api/admin/user       old_name, name, class, roll
 * └── GET    /health
 *
 * Errores: {"success": false, "error": "<kind>", "detail": "<mensaje>"}
 */

#pragma once
#include "access/access_controller.hpp"
#include "admin/admin_service.hpp"
#include "capture/capture_pipeline.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "enrollment/enrollment_manager.hpp"
#include "session/session_manager.hpp"
#include "storage/storage.hpp"
#include <httplib.h>
#include <string>

namespace facegate {

struct ApiComponents {
    Storage& storage;
    CapturePipeline& capture;
    EnrollmentManager& enrollment;
    AccessController& access;
    SessionManager& sessions;
    AdminService& admin;
};

class ApiServer {
public:
    ApiServer(const ApiComponents& components, const AppConfig::Server& config);

    // Bloquea hasta stop()
    bool run();
    void stop();

    static int http_status(ErrorKind kind);

    // Valor de una cookie del header "Cookie" ("" si no esta)
    static std::string cookie_value(const std::string& header, const std::string& name);

private:
    void register_routes();

    ApiComponents c;
    AppConfig::Server config;
    httplib::Server server;
};

}  // namespace facegate
