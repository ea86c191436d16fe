// ============= test/test_access_scenarios.cpp =============
/*
 * Flujos completos capture -> enroll -> approve -> session sobre ambos
 * backends, con el extractor scripted.
 */

#include "access/access_controller.hpp"
#include "audit/audit_log.hpp"
#include "capture/capture_pipeline.hpp"
#include "core/errors.hpp"
#include "enrollment/enrollment_manager.hpp"
#include "recognition/matcher.hpp"
#include "session/session_manager.hpp"
#include "storage/memory_storage.hpp"
#include "storage/sqlite_storage.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <memory>

using namespace facegate;
using namespace facegate::testing_support;

struct MemoryBackend {
    std::unique_ptr<Storage> create() { return std::make_unique<MemoryStorage>(3600 * 1000); }
};

struct SqliteBackend {
    TempDb db;
    std::unique_ptr<Storage> create() { return std::make_unique<SqliteStorage>(db.path(), 3600 * 1000); }
};

template <typename Backend>
class AccessScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage = backend.create();
        audit = std::make_unique<AuditLog>(*storage);
        pipeline = std::make_unique<CapturePipeline>(*storage, extractor, *audit);
        enrollment = std::make_unique<EnrollmentManager>(*storage, *audit);
        matcher = std::make_unique<Matcher>(*storage, 0.6f);
        sessions = std::make_unique<SessionManager>(*storage, *audit);
        access = std::make_unique<AccessController>(*pipeline, *matcher, *sessions, *audit);
    }

    ErrorKind approve_error(const std::string& payload) {
        try {
            access->approve(payload);
        } catch (const FaceGateError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "approve did not throw";
        return ErrorKind::InvalidInput;
    }

    Backend backend;
    ScriptedExtractor extractor;
    std::unique_ptr<Storage> storage;
    std::unique_ptr<AuditLog> audit;
    std::unique_ptr<CapturePipeline> pipeline;
    std::unique_ptr<EnrollmentManager> enrollment;
    std::unique_ptr<Matcher> matcher;
    std::unique_ptr<SessionManager> sessions;
    std::unique_ptr<AccessController> access;
};

using Backends = ::testing::Types<MemoryBackend, SqliteBackend>;
TYPED_TEST_SUITE(AccessScenarioTest, Backends);

TYPED_TEST(AccessScenarioTest, EnrollThenApprove) {
    // Persona 5 registrada desde la sesion del kiosco
    this->pipeline->capture("kiosk-1", make_payload(1, 5));
    EnrollmentResult reg = this->enrollment->enroll("kiosk-1", "alice", "10A", "07");
    EXPECT_EQ(this->storage->count_identities(), 1u);

    // Vuelve a capturar en otra sesion (sin registrar)
    this->pipeline->capture("kiosk-2", make_payload(1, 5, 4));

    // Aprobacion con una toma ligeramente distinta
    ApprovalResult r = this->access->approve(make_payload(1, 5, 5));
    EXPECT_EQ(r.session.name, "alice");
    EXPECT_EQ(r.session.group, "10A");
    EXPECT_EQ(r.session.roll, "07");
    EXPECT_EQ(r.session.access_code, reg.access_code);
    EXPECT_GE(r.session.confidence, 90.0);

    AccessSession stored = this->sessions->get(r.session.session_id);
    EXPECT_EQ(stored.name, "alice");
}

TYPED_TEST(AccessScenarioTest, EmptyRegistryIsNoMatch) {
    EXPECT_EQ(this->approve_error(make_payload(1, 5)), ErrorKind::NoMatch);
    EXPECT_TRUE(this->storage->list_sessions().empty());

    auto logs = this->audit->recent();
    ASSERT_FALSE(logs.empty());
    EXPECT_NE(logs.front().find("APPROVAL DENIED: Face not recognized"), std::string::npos);
}

TYPED_TEST(AccessScenarioTest, UnknownPersonIsNoMatch) {
    this->pipeline->capture("kiosk-1", make_payload(1, 5));
    this->enrollment->enroll("kiosk-1", "alice", "10A", "07");

    EXPECT_EQ(this->approve_error(make_payload(1, 6)), ErrorKind::NoMatch);
    EXPECT_TRUE(this->storage->list_sessions().empty());
}

TYPED_TEST(AccessScenarioTest, TwoFacesCreateNoSession) {
    this->pipeline->capture("kiosk-1", make_payload(1, 5));
    this->enrollment->enroll("kiosk-1", "alice", "10A", "07");

    EXPECT_EQ(this->approve_error(make_payload(2, 5)), ErrorKind::MultipleFacesDetected);
    EXPECT_TRUE(this->storage->list_sessions().empty());
}

TYPED_TEST(AccessScenarioTest, SecondApprovalSupersedesFirst) {
    this->pipeline->capture("kiosk-1", make_payload(1, 5));
    this->enrollment->enroll("kiosk-1", "alice", "10A", "07");

    ApprovalResult first = this->access->approve(make_payload(1, 5));
    ApprovalResult second = this->access->approve(make_payload(1, 5, 2));

    auto all = this->storage->list_sessions();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].session_id, second.session.session_id);
    EXPECT_NE(first.session.session_id, second.session.session_id);
}

TYPED_TEST(AccessScenarioTest, EndUnknownSessionIsNotFound) {
    try {
        this->sessions->end("0123456789abcdef0123456789abcdef");
        FAIL() << "expected NotFound";
    } catch (const FaceGateError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
}

TYPED_TEST(AccessScenarioTest, DeletedIdentityNoLongerMatches) {
    this->pipeline->capture("kiosk-1", make_payload(1, 5));
    this->enrollment->enroll("kiosk-1", "alice", "10A", "07");
    this->storage->delete_identity("alice");

    EXPECT_EQ(this->approve_error(make_payload(1, 5)), ErrorKind::NoMatch);
}
