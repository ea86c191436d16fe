// ============= include/storage/storage_factory.hpp =============
#pragma once
#include "core/config.hpp"
#include "storage/storage.hpp"
#include <memory>

namespace facegate {

// Elige el backend una sola vez al arrancar:
//   "sqlite" -> SqliteStorage o excepcion si el probe falla
//   "memory" -> MemoryStorage
//   "auto"   -> SqliteStorage si el probe pasa, si no MemoryStorage
std::unique_ptr<Storage> create_storage(const AppConfig& config);

}  // namespace facegate
