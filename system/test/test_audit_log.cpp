// ============= test/test_audit_log.cpp =============
#include "audit/audit_log.hpp"
#include "core/errors.hpp"
#include "storage/memory_storage.hpp"
#include "storage/sqlite_storage.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace facegate;
using namespace facegate::testing_support;

namespace {

// Storage cuyo append_log siempre falla
class BrokenLogStorage : public MemoryStorage {
public:
    BrokenLogStorage() : MemoryStorage(3600 * 1000) {}

    void append_log(const LogEntry&, size_t) override {
        throw FaceGateError(ErrorKind::StorageUnavailable, "disk full");
    }
};

}  // namespace

TEST(AuditLogTest, KeepsMostRecentHundredNewestFirst) {
    MemoryStorage storage(3600 * 1000);
    AuditLog audit(storage);

    for (int i = 0; i < 150; i++) {
        audit.append("event " + std::to_string(i));
    }

    auto logs = audit.recent();
    ASSERT_EQ(logs.size(), 100u);
    EXPECT_NE(logs.front().find("] event 149"), std::string::npos);
    EXPECT_NE(logs.back().find("] event 50"), std::string::npos);
}

TEST(AuditLogTest, SqliteKeepsMostRecentHundredNewestFirst) {
    TempDb db;
    SqliteStorage storage(db.path(), 3600 * 1000);
    AuditLog audit(storage);

    for (int i = 0; i < 150; i++) {
        audit.append("event " + std::to_string(i));
    }

    auto logs = audit.recent();
    ASSERT_EQ(logs.size(), 100u);
    EXPECT_NE(logs.front().find("] event 149"), std::string::npos);
    EXPECT_NE(logs.back().find("] event 50"), std::string::npos);
}

TEST(AuditLogTest, FormatsWithTimestampPrefix) {
    MemoryStorage storage(3600 * 1000);
    AuditLog audit(storage);
    audit.append("SESSION ENDED: abcdef12...");

    auto logs = audit.recent();
    ASSERT_EQ(logs.size(), 1u);
    // "[YYYY-MM-DD HH:MM:SS] accion"
    ASSERT_GT(logs[0].size(), 22u);
    EXPECT_EQ(logs[0][0], '[');
    EXPECT_EQ(logs[0].substr(20, 2), "] ");
    EXPECT_EQ(logs[0].substr(22), "SESSION ENDED: abcdef12...");
}

TEST(AuditLogTest, CustomRetention) {
    MemoryStorage storage(3600 * 1000);
    AuditLog audit(storage, 5);
    for (int i = 0; i < 12; i++) audit.append("e" + std::to_string(i));

    EXPECT_EQ(audit.recent().size(), 5u);
    EXPECT_EQ(audit.max_entries(), 5u);
}

TEST(AuditLogTest, StorageFailureDoesNotPropagate) {
    BrokenLogStorage storage;
    AuditLog audit(storage);
    EXPECT_NO_THROW(audit.append("anything"));
}
