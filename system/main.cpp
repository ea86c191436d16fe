// ============= main.cpp - FACEGATE SERVER =============
#include "access/access_controller.hpp"
#include "admin/admin_service.hpp"
#include "api/api_server.hpp"
#include "audit/audit_log.hpp"
#include "capture/capture_pipeline.hpp"
#include "core/config.hpp"
#include "enrollment/enrollment_manager.hpp"
#include "recognition/matcher.hpp"
#include "session/session_manager.hpp"
#include "storage/storage_factory.hpp"
#include "vision/sface_extractor.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

using namespace facegate;

std::atomic<bool> stop_signal(false);

void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        stop_signal = true;
    }
}

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::string config_file = argc >= 2 ? argv[1] : "config.toml";

    SimpleToml toml;
    if (!toml.load(config_file)) {
        spdlog::warn("⚠️  No se pudo cargar {}, usando valores por defecto", config_file);
    }

    AppConfig config = AppConfig::from_toml(toml);
    config.apply_env_overrides();
    spdlog::set_level(parse_log_level(config.log_level));

    std::unique_ptr<Storage> storage;
    std::unique_ptr<SFaceExtractor> extractor;

    try {
        storage = create_storage(config);
        spdlog::info("📦 Storage: {} ({} identidades)", storage->backend_name(), storage->count_identities());
        extractor = std::make_unique<SFaceExtractor>(config.extractor.detector_model,
                                                     config.extractor.recognizer_model,
                                                     config.extractor.score_threshold,
                                                     config.extractor.nms_threshold);
    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }

    AuditLog audit(*storage, static_cast<size_t>(config.audit_max_entries));
    CapturePipeline capture(*storage, *extractor, audit, config.capture);
    EnrollmentManager enrollment(*storage, audit);
    Matcher matcher(*storage, config.match_threshold);
    SessionManager sessions(*storage, audit);
    AccessController access(capture, matcher, sessions, audit);
    AdminService admin(*storage, audit, config.admin);

    audit.append(storage->backend_name() == "sqlite"
                     ? "=== SYSTEM STARTED WITH SQLITE STORAGE ==="
                     : "=== SYSTEM STARTED WITH IN-MEMORY STORAGE ===");

    ApiServer api({*storage, capture, enrollment, access, sessions, admin}, config.server);

    std::atomic<bool> server_failed(false);
    std::thread server_thread([&] {
        if (!api.run()) {
            server_failed = true;
            stop_signal = true;
        }
    });

    while (!stop_signal) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Deteniendo");
    api.stop();
    server_thread.join();

    audit.append("=== SYSTEM SHUTDOWN ===");
    return server_failed ? 1 : 0;
}
