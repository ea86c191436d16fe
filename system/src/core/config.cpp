#include "core/config.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace facegate {

// ==================== SIMPLE TOML ====================

std::string SimpleToml::trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool SimpleToml::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::stringstream ss;
    ss << file.rdbuf();
    load_string(ss.str());
    return true;
}

void SimpleToml::load_string(const std::string& content) {
    std::istringstream in(content);
    std::string line, section;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (val.size() >= 2 && val.front() == '"') {
            auto close = val.find('"', 1);
            if (close != std::string::npos) {
                val = val.substr(1, close - 1);
            }
        } else {
            // comentario al final de la linea
            auto hash = val.find('#');
            if (hash != std::string::npos) val = trim(val.substr(0, hash));
        }

        std::string full_key = section.empty() ? key : section + "." + key;
        values[full_key] = val;
    }
}

std::string SimpleToml::get(const std::string& key, const std::string& def) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : def;
}

int SimpleToml::get_int(const std::string& key, int def) const {
    if (!has(key)) return def;
    try { return std::stoi(get(key)); }
    catch (const std::exception&) {
        spdlog::warn("Config: valor invalido para {} ('{}'), usando {}", key, get(key), def);
        return def;
    }
}

float SimpleToml::get_float(const std::string& key, float def) const {
    if (!has(key)) return def;
    try { return std::stof(get(key)); }
    catch (const std::exception&) {
        spdlog::warn("Config: valor invalido para {} ('{}'), usando {}", key, get(key), def);
        return def;
    }
}

// ==================== APP CONFIG ====================

namespace {

// Valores fuera de rango vuelven al default
int int_at_least(const SimpleToml& toml, const std::string& key, int def, int min) {
    int v = toml.get_int(key, def);
    if (v < min) {
        spdlog::warn("Config: {} = {} fuera de rango (minimo {}), usando {}", key, v, min, def);
        return def;
    }
    return v;
}

float positive_float(const SimpleToml& toml, const std::string& key, float def) {
    float v = toml.get_float(key, def);
    if (!(v > 0.0f)) {
        spdlog::warn("Config: {} = {} debe ser positivo, usando {}", key, v, def);
        return def;
    }
    return v;
}

}  // namespace

AppConfig AppConfig::from_toml(const SimpleToml& toml) {
    AppConfig cfg;

    cfg.server.host = toml.get("server.host", cfg.server.host);
    cfg.server.port = int_at_least(toml, "server.port", cfg.server.port, 1);
    cfg.server.threads = int_at_least(toml, "server.threads", cfg.server.threads, 1);

    cfg.storage.backend = toml.get("storage.backend", cfg.storage.backend);
    cfg.storage.sqlite_path = toml.get("storage.sqlite_path", cfg.storage.sqlite_path);
    // 0 = sin thread de sweep
    cfg.storage.sweep_interval_sec = int_at_least(toml, "storage.sweep_interval_sec",
                                                  cfg.storage.sweep_interval_sec, 0);

    cfg.capture.ticket_ttl_sec = int_at_least(toml, "capture.ticket_ttl_sec",
                                              cfg.capture.ticket_ttl_sec, 1);
    cfg.capture.min_payload_chars = int_at_least(toml, "capture.min_payload_chars",
                                                 cfg.capture.min_payload_chars, 0);
    cfg.capture.preview_chars = int_at_least(toml, "capture.preview_chars",
                                             cfg.capture.preview_chars, 1);

    cfg.match_threshold = positive_float(toml, "matcher.threshold", cfg.match_threshold);
    cfg.audit_max_entries = int_at_least(toml, "audit.max_entries", cfg.audit_max_entries, 1);

    cfg.extractor.detector_model = toml.get("extractor.detector_model", cfg.extractor.detector_model);
    cfg.extractor.recognizer_model = toml.get("extractor.recognizer_model",
                                              cfg.extractor.recognizer_model);
    cfg.extractor.score_threshold = positive_float(toml, "extractor.score_threshold",
                                                   cfg.extractor.score_threshold);
    cfg.extractor.nms_threshold = positive_float(toml, "extractor.nms_threshold",
                                                 cfg.extractor.nms_threshold);

    cfg.admin.username = toml.get("admin.username", cfg.admin.username);
    cfg.admin.password = toml.get("admin.password", cfg.admin.password);

    cfg.log_level = toml.get("logging.level", cfg.log_level);

    return cfg;
}

void AppConfig::apply_env_overrides() {
    if (const char* v = std::getenv("FACEGATE_DB_PATH")) {
        storage.sqlite_path = v;
    }
    if (const char* v = std::getenv("FACEGATE_ADMIN_USER")) {
        admin.username = v;
    }
    if (const char* v = std::getenv("FACEGATE_ADMIN_PASSWORD")) {
        admin.password = v;
    }
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str devuelve off para cualquier nombre que no reconoce
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Config: logging.level '{}' desconocido, usando info", name);
        return spdlog::level::info;
    }
    return level;
}

}  // namespace facegate
