// ============= include/core/config.hpp =============
#pragma once
#include <spdlog/common.h>
#include <map>
#include <string>

namespace facegate {

namespace Config {

    // Server defaults
    constexpr const char* DEFAULT_HOST = "0.0.0.0";
    constexpr int DEFAULT_PORT = 8000;
    constexpr int DEFAULT_SERVER_THREADS = 8;

    // Storage defaults
    constexpr const char* DEFAULT_BACKEND = "auto";
    constexpr const char* DEFAULT_SQLITE_PATH = "database/facegate.db";
    constexpr int DEFAULT_SWEEP_INTERVAL_SEC = 60;

    // Capture defaults
    constexpr int DEFAULT_TICKET_TTL_SEC = 3600;
    constexpr int DEFAULT_MIN_PAYLOAD_CHARS = 100;
    constexpr int DEFAULT_PREVIEW_CHARS = 500;

    // Matching / audit
    constexpr float DEFAULT_MATCH_THRESHOLD = 0.6f;
    constexpr int DEFAULT_AUDIT_MAX_ENTRIES = 100;

    // Extractor models (OpenCV zoo)
    constexpr const char* DEFAULT_DETECTOR_MODEL = "models/face_detection_yunet_2023mar.onnx";
    constexpr const char* DEFAULT_RECOGNIZER_MODEL = "models/face_recognition_sface_2021dec.onnx";
    constexpr float DEFAULT_SCORE_THRESHOLD = 0.9f;
    constexpr float DEFAULT_NMS_THRESHOLD = 0.3f;

    constexpr const char* DEFAULT_ADMIN_USER = "admin";
}

// Lector TOML minimo: secciones, key = value, strings entre comillas y
// comentarios con '#'. Las claves quedan como "seccion.clave".
class SimpleToml {
private:
    std::map<std::string, std::string> values;

    static std::string trim(const std::string& s);

public:
    bool load(const std::string& filename);
    void load_string(const std::string& content);

    bool has(const std::string& key) const { return values.count(key) > 0; }
    std::string get(const std::string& key, const std::string& def = "") const;
    int get_int(const std::string& key, int def = 0) const;
    float get_float(const std::string& key, float def = 0.0f) const;
};

struct AppConfig {
    struct Server {
        std::string host = Config::DEFAULT_HOST;
        int port = Config::DEFAULT_PORT;
        int threads = Config::DEFAULT_SERVER_THREADS;
    } server;

    struct Storage {
        std::string backend = Config::DEFAULT_BACKEND;   // auto | sqlite | memory
        std::string sqlite_path = Config::DEFAULT_SQLITE_PATH;
        int sweep_interval_sec = Config::DEFAULT_SWEEP_INTERVAL_SEC;
    } storage;

    struct Capture {
        int ticket_ttl_sec = Config::DEFAULT_TICKET_TTL_SEC;
        int min_payload_chars = Config::DEFAULT_MIN_PAYLOAD_CHARS;
        int preview_chars = Config::DEFAULT_PREVIEW_CHARS;
    } capture;

    float match_threshold = Config::DEFAULT_MATCH_THRESHOLD;
    int audit_max_entries = Config::DEFAULT_AUDIT_MAX_ENTRIES;

    struct Extractor {
        std::string detector_model = Config::DEFAULT_DETECTOR_MODEL;
        std::string recognizer_model = Config::DEFAULT_RECOGNIZER_MODEL;
        float score_threshold = Config::DEFAULT_SCORE_THRESHOLD;
        float nms_threshold = Config::DEFAULT_NMS_THRESHOLD;
    } extractor;

    struct Admin {
        std::string username = Config::DEFAULT_ADMIN_USER;
        std::string password;   // vacio = login deshabilitado
    } admin;

    std::string log_level = "info";

    static AppConfig from_toml(const SimpleToml& toml);

    // FACEGATE_DB_PATH, FACEGATE_ADMIN_USER, FACEGATE_ADMIN_PASSWORD
    void apply_env_overrides();
};

// Nivel de spdlog para logging.level; un nombre desconocido queda en info
spdlog::level::level_enum parse_log_level(const std::string& name);

}  // namespace facegate
