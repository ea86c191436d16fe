#include "api/api_server.hpp"
#include "core/utils.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace facegate {

namespace {

const char* kJson = "application/json";

void send_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), kJson);
}

void send_error(httplib::Response& res, int status, const std::string& kind, const std::string& detail) {
    send_json(res, status, {{"success", false}, {"error", kind}, {"detail", detail}});
}

json parse_body(const httplib::Request& req) {
    json body = json::parse(req.body.empty() ? "{}" : req.body);
    if (!body.is_object()) {
        throw FaceGateError(ErrorKind::InvalidInput, "Request body must be a JSON object");
    }
    return body;
}

std::string field(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) return "";
    if (!it->is_string()) {
        throw FaceGateError(ErrorKind::InvalidInput, std::string("Field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

// Ejecuta el handler y traduce las excepciones a la respuesta JSON de error
template <typename Handler>
void guarded(const char* route, httplib::Response& res, Handler&& handler) {
    try {
        handler();
    } catch (const FaceGateError& e) {
        int status = ApiServer::http_status(e.kind());
        if (status >= 500) {
            spdlog::error("❌ {}: {}", route, e.what());
        } else {
            spdlog::warn("{} -> {} {}", route, status, to_string(e.kind()));
        }
        send_error(res, status, to_string(e.kind()), e.what());
    } catch (const json::exception& e) {
        spdlog::warn("{} -> 400 JSON invalido: {}", route, e.what());
        send_error(res, 400, to_string(ErrorKind::InvalidInput), "Invalid JSON body");
    } catch (const std::exception& e) {
        spdlog::error("❌ {}: {}", route, e.what());
        send_error(res, 500, "InternalError", e.what());
    }
}

json session_json(const AccessSession& s) {
    return {
        {"session_id", s.session_id},
        {"name", s.name},
        {"class", s.group},
        {"roll", s.roll},
        {"code", s.access_code},
        {"start_time", format_iso8601(s.started_at)},
        {"match_confidence", s.confidence}
    };
}

}  // namespace

ApiServer::ApiServer(const ApiComponents& components, const AppConfig::Server& config)
    : c(components), config(config) {
    int threads = config.threads > 0 ? config.threads : 1;
    server.new_task_queue = [threads] { return new httplib::ThreadPool(static_cast<size_t>(threads)); };
    register_routes();
}

int ApiServer::http_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput:
        case ErrorKind::DecodeFailure:
        case ErrorKind::NoFaceDetected:
        case ErrorKind::MultipleFacesDetected:
        case ErrorKind::EncodingFailure:
        case ErrorKind::MissingCapture:
        case ErrorKind::DuplicateIdentity:
            return 400;
        case ErrorKind::NotFound:
        case ErrorKind::NoMatch:
            return 404;
        case ErrorKind::Unauthorized:
            return 401;
        case ErrorKind::StorageUnavailable:
            return 503;
    }
    return 500;
}

std::string ApiServer::cookie_value(const std::string& header, const std::string& name) {
    size_t pos = 0;
    while (pos < header.size()) {
        size_t end = header.find(';', pos);
        if (end == std::string::npos) end = header.size();

        std::string pair = trim(header.substr(pos, end - pos));
        size_t eq = pair.find('=');
        if (eq != std::string::npos && trim(pair.substr(0, eq)) == name) {
            return trim(pair.substr(eq + 1));
        }
        pos = end + 1;
    }
    return "";
}

void ApiServer::register_routes() {
    // ===== CAPTURE =====

    server.Post("/api/capture-face", [this](const httplib::Request& req, httplib::Response& res) {
        guarded("POST /api/capture-face", res, [&] {
            json body = parse_body(req);
            std::string token = cookie_value(req.get_header_value("Cookie"), "session_id");
            if (token.empty()) token = random_hex(16);

            c.capture.capture(token, field(body, "face_image"));

            res.set_header("Set-Cookie", "session_id=" + token + "; Path=/; HttpOnly; SameSite=Lax");
            send_json(res, 200, {{"success", true}, {"message", "Face captured and validated successfully"}});
        });
    });

    server.Post("/api/clear-face", [this](const httplib::Request& req, httplib::Response& res) {
        guarded("POST /api/clear-face", res, [&] {
            std::string token = cookie_value(req.get_header_value("Cookie"), "session_id");
            if (!token.empty()) c.capture.clear(token);
            send_json(res, 200, {{"success", true}, {"message", "Face data cleared"}});
        });
    });

    // ===== ENROLLMENT =====

    server.Post("/api/register-entry", [this](const httplib::Request& req, httplib::Response& res) {
        guarded("POST /api/register-entry", res, [&] {
            json body = parse_body(req);
            std::string token = cookie_value(req.get_header_value("Cookie"), "session_id");

            EnrollmentResult r = c.enrollment.enroll(token, field(body, "name"),
                                                     field(body, "class"), field(body, "roll"));
            send_json(res, 200, {
                {"success", true},
                {"code", r.access_code},
                {"name", r.name},
                {"message", "Registration successful!"}
            });
        });
    });

    // ===== ACCESS =====

    server.Post("/api/approve-face", [this](const httplib::Request& req, httplib::Response& res) {
        guarded("POST /api/approve-face", res, [&] {
            json body = parse_body(req);
            ApprovalResult r = c.access.approve(field(body, "face_image"));
            send_json(res, 200, {
                {"success", true},
                {"session_id", r.session.session_id},
                {"name", r.session.name},
                {"class", r.session.group},
                {"roll", r.session.roll},
                {"code", r.session.access_code},
                {"confidence", r.session.confidence}
            });
        });
    });

    server.Get(R"(/api/session/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        guarded("GET /api/session", res, [&] {
            send_json(res, 200, session_json(c.sessions.get(req.matches[1].str())));
        });
    });

    server.Post("/api/end-session", [this](const httplib::Request& req, httplib::Response& res) {
        guarded("POST /api/end-session", res, [&] {
            json body = parse_body(req);
            c.sessions.end(field(body, "session_id"));
            send_json(res, 200, {{"success", true}, {"message", "Session ended successfully"}});
        });
    });

    // ===== ADMIN =====

    server.Post("/api/admin/login", [this](const httplib::Request& req, httplib::Response& res) {
        guarded("POST /api/admin/login", res, [&] {
            json body = parse_body(req);
            c.admin.login(field(body, "username"), field(body, "password"));
            send_json(res, 200, {{"success", true}, {"message", "Login successful"}});
        });
    });

    server.Get("/api/admin/users", [this](const httplib::Request&, httplib::Response& res) {
        guarded("GET /api/admin/users", res, [&] {
            json users = json::array();
            for (const auto& u : c.admin.list_users()) {
                users.push_back({
                    {"name", u.name},
                    {"class", u.group},
                    {"roll", u.roll},
                    {"code", u.access_code},
                    {"registered_at", u.registered_at}
                });
            }
            send_json(res, 200, {{"users", users}});
        });
    });

    server.Get("/api/admin/logs", [this](const httplib::Request&, httplib::Response& res) {
        guarded("GET /api/admin/logs", res, [&] {
            send_json(res, 200, {{"logs", c.admin.logs()}});
        });
    });

    server.Delete("/api/admin/user", [this](const httplib::Request& req, httplib::Response& res) {
        guarded("DELETE /api/admin/user", res, [&] {
            json body = parse_body(req);
            std::string name = field(body, "name");
            c.admin.delete_user(name);
            send_json(res, 200, {{"success", true}, {"message", "User '" + name + "' deleted successfully"}});
        });
    });

    server.Put("/api/admin/user", [this](const httplib::Request& req, httplib::Response& res) {
        guarded("PUT /api/admin/user", res, [&] {
            json body = parse_body(req);
            c.admin.edit_user(field(body, "old_name"), field(body, "name"),
                              field(body, "class"), field(body, "roll"));
            send_json(res, 200, {{"success", true}, {"message", "User updated successfully"}});
        });
    });

    // ===== HEALTH =====

    server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, {
            {"status", "healthy"},
            {"storage", c.storage.backend_name()},
            {"timestamp", format_iso8601(now_ms())}
        });
    });
}

bool ApiServer::run() {
    spdlog::info("🌐 Escuchando en http://{}:{} ({} threads)", config.host, config.port, config.threads);
    if (!server.listen(config.host, config.port)) {
        spdlog::error("❌ No se pudo abrir {}:{}", config.host, config.port);
        return false;
    }
    return true;
}

void ApiServer::stop() {
    server.stop();
}

}  // namespace facegate
