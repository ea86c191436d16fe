// ============= test/test_session_manager.cpp =============
#include "audit/audit_log.hpp"
#include "core/errors.hpp"
#include "session/session_manager.hpp"
#include "storage/memory_storage.hpp"
#include "storage/sqlite_storage.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace facegate;
using namespace facegate::testing_support;

namespace {

Identity alice() {
    Identity i;
    i.name = "alice";
    i.group = "10A";
    i.roll = "07";
    i.access_code = "0A1B2C3D4E5F";
    i.embedding = person_embedding(1);
    return i;
}

}  // namespace

TEST(SessionManagerTest, IssueCopiesIdentityFields) {
    MemoryStorage storage(3600 * 1000);
    AuditLog audit(storage);
    SessionManager sessions(storage, audit);

    AccessSession s = sessions.issue(alice(), 96.4);
    EXPECT_EQ(s.session_id.size(), 32u);
    EXPECT_EQ(s.session_id.find_first_not_of("0123456789abcdef"), std::string::npos);

    AccessSession fetched = sessions.get(s.session_id);
    EXPECT_EQ(fetched.name, "alice");
    EXPECT_EQ(fetched.group, "10A");
    EXPECT_EQ(fetched.roll, "07");
    EXPECT_EQ(fetched.access_code, "0A1B2C3D4E5F");
    EXPECT_DOUBLE_EQ(fetched.confidence, 96.4);
    EXPECT_GT(fetched.started_at, 0);

    auto logs = audit.recent();
    ASSERT_FALSE(logs.empty());
    EXPECT_NE(logs.front().find("APPROVAL SUCCESS: alice | Class: 10A | Roll: 07 | Confidence: 96.40%"),
              std::string::npos);
}

TEST(SessionManagerTest, DoubleIssueKeepsOnlySecond) {
    TempDb db;
    SqliteStorage storage(db.path(), 3600 * 1000);
    AuditLog audit(storage);
    SessionManager sessions(storage, audit);

    AccessSession first = sessions.issue(alice(), 90.0);
    AccessSession second = sessions.issue(alice(), 95.0);

    EXPECT_NE(first.session_id, second.session_id);
    auto all = storage.list_sessions();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].session_id, second.session_id);
    EXPECT_THROW(sessions.get(first.session_id), FaceGateError);
}

TEST(SessionManagerTest, EndRemovesSession) {
    MemoryStorage storage(3600 * 1000);
    AuditLog audit(storage);
    SessionManager sessions(storage, audit);

    AccessSession s = sessions.issue(alice(), 99.0);
    sessions.end(s.session_id);

    try {
        sessions.get(s.session_id);
        FAIL() << "session still present";
    } catch (const FaceGateError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
    EXPECT_NE(audit.recent().front().find("SESSION ENDED: " + s.session_id.substr(0, 8) + "..."),
              std::string::npos);
}

TEST(SessionManagerTest, EndUnknownSessionIsNotFound) {
    MemoryStorage storage(3600 * 1000);
    AuditLog audit(storage);
    SessionManager sessions(storage, audit);

    try {
        sessions.end("does-not-exist");
        FAIL() << "expected NotFound";
    } catch (const FaceGateError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
}
