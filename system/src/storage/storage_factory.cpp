#include "storage/storage_factory.hpp"
#include "storage/memory_storage.hpp"
#include "storage/sqlite_storage.hpp"
#include <spdlog/spdlog.h>

namespace facegate {

namespace {

std::unique_ptr<SqliteStorage> probe_sqlite(const AppConfig& config, int64_t ttl_ms) {
    auto storage = std::make_unique<SqliteStorage>(config.storage.sqlite_path, ttl_ms);
    if (!storage->ping()) {
        throw std::runtime_error("SQLite ping fallido: " + config.storage.sqlite_path);
    }
    return storage;
}

}  // namespace

std::unique_ptr<Storage> create_storage(const AppConfig& config) {
    const int64_t ttl_ms = static_cast<int64_t>(config.capture.ticket_ttl_sec) * 1000;
    const std::string& backend = config.storage.backend;

    if (backend == "memory") {
        spdlog::info("🗄️ Storage: memoria (forzado por config)");
        return std::make_unique<MemoryStorage>(ttl_ms, config.storage.sweep_interval_sec);
    }

    if (backend == "sqlite") {
        auto storage = probe_sqlite(config, ttl_ms);
        spdlog::info("🗄️ Storage: SQLite ({})", config.storage.sqlite_path);
        return storage;
    }

    if (backend != "auto") {
        throw std::runtime_error("storage.backend desconocido: " + backend);
    }

    try {
        auto storage = probe_sqlite(config, ttl_ms);
        spdlog::info("🗄️ Storage: SQLite ({})", config.storage.sqlite_path);
        return storage;
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ SQLite no disponible: {}", e.what());
        spdlog::warn("🗄️ Fallback: storage en memoria");
        return std::make_unique<MemoryStorage>(ttl_ms, config.storage.sweep_interval_sec);
    }
}

}  // namespace facegate
