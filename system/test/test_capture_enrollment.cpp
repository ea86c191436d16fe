// ============= test/test_capture_enrollment.cpp =============
#include "audit/audit_log.hpp"
#include "capture/capture_pipeline.hpp"
#include "core/errors.hpp"
#include "enrollment/enrollment_manager.hpp"
#include "storage/memory_storage.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace facegate;
using namespace facegate::testing_support;

class CaptureEnrollmentTest : public ::testing::Test {
protected:
    CaptureEnrollmentTest()
        : storage(3600 * 1000),
          audit(storage),
          pipeline(storage, extractor, audit),
          enrollment(storage, audit) {}

    ErrorKind capture_error(const std::string& token, const std::string& payload) {
        try {
            pipeline.capture(token, payload);
        } catch (const FaceGateError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "capture did not throw";
        return ErrorKind::InvalidInput;
    }

    ErrorKind enroll_error(const std::string& token, const std::string& name,
                           const std::string& group, const std::string& roll) {
        try {
            enrollment.enroll(token, name, group, roll);
        } catch (const FaceGateError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "enroll did not throw";
        return ErrorKind::InvalidInput;
    }

    bool audit_contains(const std::string& text) {
        for (const auto& line : audit.recent()) {
            if (line.find(text) != std::string::npos) return true;
        }
        return false;
    }

    MemoryStorage storage;
    ScriptedExtractor extractor;
    AuditLog audit;
    CapturePipeline pipeline;
    EnrollmentManager enrollment;
};

// ===== CAPTURE =====

TEST_F(CaptureEnrollmentTest, CaptureStoresTicketWithPreview) {
    std::string payload = make_payload(1, 3);
    pipeline.capture("tok", payload);

    auto ticket = storage.find_ticket("tok", now_ms());
    ASSERT_TRUE(ticket.has_value());
    EXPECT_EQ(ticket->embedding, person_embedding(3));
    EXPECT_EQ(ticket->preview, payload.substr(0, 500));
    EXPECT_TRUE(audit_contains("Face captured and validated for registration"));
}

TEST_F(CaptureEnrollmentTest, SecondCaptureReplacesFirst) {
    pipeline.capture("tok", make_payload(1, 3));
    pipeline.capture("tok", make_payload(1, 9));

    auto ticket = storage.find_ticket("tok", now_ms());
    ASSERT_TRUE(ticket.has_value());
    EXPECT_EQ(ticket->embedding, person_embedding(9));
}

TEST_F(CaptureEnrollmentTest, TooSmallPayloadIsInvalidInput) {
    EXPECT_EQ(capture_error("tok", ""), ErrorKind::InvalidInput);
    EXPECT_EQ(capture_error("tok", "data:image/png;base64,AAAA"), ErrorKind::InvalidInput);
    EXPECT_EQ(extractor.calls, 0);
    EXPECT_TRUE(audit_contains("image too small or empty"));
}

TEST_F(CaptureEnrollmentTest, UndecodablePayloadIsDecodeFailure) {
    std::string garbage = "data:image/png;base64," + std::string(200, '!');
    EXPECT_EQ(capture_error("tok", garbage), ErrorKind::DecodeFailure);
    EXPECT_TRUE(audit_contains("Image decode failed (registration)"));
}

TEST_F(CaptureEnrollmentTest, FaceCountIsEnforced) {
    EXPECT_EQ(capture_error("tok", make_payload(0, 1)), ErrorKind::NoFaceDetected);
    EXPECT_EQ(capture_error("tok", make_payload(2, 1)), ErrorKind::MultipleFacesDetected);
    EXPECT_FALSE(storage.find_ticket("tok", now_ms()).has_value());
    EXPECT_TRUE(audit_contains("Multiple faces detected (2) (registration)"));
}

TEST_F(CaptureEnrollmentTest, EncodingProblemsAreEncodingFailure) {
    EXPECT_EQ(capture_error("tok", make_payload(1, 255)), ErrorKind::EncodingFailure);
    EXPECT_EQ(capture_error("tok", make_payload(254, 1)), ErrorKind::EncodingFailure);
}

TEST_F(CaptureEnrollmentTest, FailedCaptureKeepsPreviousTicket) {
    pipeline.capture("tok", make_payload(1, 3));
    capture_error("tok", make_payload(2, 5));

    auto ticket = storage.find_ticket("tok", now_ms());
    ASSERT_TRUE(ticket.has_value());
    EXPECT_EQ(ticket->embedding, person_embedding(3));
}

TEST_F(CaptureEnrollmentTest, ClearIsIdempotent) {
    pipeline.capture("tok", make_payload(1, 3));
    pipeline.clear("tok");
    EXPECT_FALSE(storage.find_ticket("tok", now_ms()).has_value());
    EXPECT_NO_THROW(pipeline.clear("tok"));
    EXPECT_NO_THROW(pipeline.clear("never-seen"));
}

TEST_F(CaptureEnrollmentTest, LiveEmbeddingStoresNothing) {
    auto embedding = pipeline.live_embedding(make_payload(1, 4), "approval");
    EXPECT_EQ(embedding, person_embedding(4));
    EXPECT_FALSE(storage.find_ticket("", now_ms()).has_value());
}

// ===== ENROLLMENT =====

TEST_F(CaptureEnrollmentTest, EnrollConsumesTicket) {
    pipeline.capture("tok", make_payload(1, 3));

    EnrollmentResult r = enrollment.enroll("tok", "  alice ", "10A", "07");
    EXPECT_EQ(r.name, "alice");
    ASSERT_EQ(r.access_code.size(), 12u);

    auto alice = storage.find_identity("alice");
    ASSERT_TRUE(alice.has_value());
    EXPECT_EQ(alice->embedding, person_embedding(3));
    EXPECT_EQ(alice->access_code, r.access_code);
    EXPECT_EQ(alice->group, "10A");
    EXPECT_FALSE(storage.find_ticket("tok", now_ms()).has_value());
    EXPECT_TRUE(audit_contains("NEW REGISTRATION: alice | Class: 10A | Roll: 07 | Code: " + r.access_code));
}

TEST_F(CaptureEnrollmentTest, EnrollWithoutCaptureIsMissingCapture) {
    EXPECT_EQ(enroll_error("tok", "alice", "10A", "07"), ErrorKind::MissingCapture);
    EXPECT_EQ(storage.count_identities(), 0u);
}

TEST_F(CaptureEnrollmentTest, EnrollWithExpiredTicketIsMissingCapture) {
    CaptureTicket old;
    old.session_token = "tok";
    old.preview = "preview";
    old.embedding = person_embedding(3);
    old.created_at = now_ms() - 3600 * 1000 - 1;
    storage.upsert_ticket(old);

    EXPECT_EQ(enroll_error("tok", "alice", "10A", "07"), ErrorKind::MissingCapture);
}

TEST_F(CaptureEnrollmentTest, EnrollRequiresAllFields) {
    pipeline.capture("tok", make_payload(1, 3));

    EXPECT_EQ(enroll_error("tok", "   ", "10A", "07"), ErrorKind::InvalidInput);
    EXPECT_EQ(enroll_error("tok", "alice", "", "07"), ErrorKind::InvalidInput);
    EXPECT_EQ(enroll_error("tok", "alice", "10A", " "), ErrorKind::InvalidInput);
    EXPECT_TRUE(storage.find_ticket("tok", now_ms()).has_value());
}

TEST_F(CaptureEnrollmentTest, DuplicateNameKeepsOriginalEmbedding) {
    pipeline.capture("tok1", make_payload(1, 3));
    enrollment.enroll("tok1", "alice", "10A", "07");

    pipeline.capture("tok2", make_payload(1, 8));
    EXPECT_EQ(enroll_error("tok2", "alice", "11B", "02"), ErrorKind::DuplicateIdentity);

    auto alice = storage.find_identity("alice");
    ASSERT_TRUE(alice.has_value());
    EXPECT_EQ(alice->embedding, person_embedding(3));
    EXPECT_EQ(alice->group, "10A");
    EXPECT_EQ(storage.count_identities(), 1u);
}

TEST_F(CaptureEnrollmentTest, RacingEnrollmentsOnOneCaptureRegisterOnce) {
    pipeline.capture("tok", make_payload(1, 3));

    std::atomic<int> registered{0};
    std::atomic<int> missing{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 4; i++) {
        workers.emplace_back([this, &registered, &missing, i] {
            try {
                enrollment.enroll("tok", "user" + std::to_string(i), "10A", "07");
                registered++;
            } catch (const FaceGateError& e) {
                if (e.kind() == ErrorKind::MissingCapture) missing++;
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(registered.load(), 1);
    EXPECT_EQ(missing.load(), 3);
    EXPECT_EQ(storage.count_identities(), 1u);
}

TEST_F(CaptureEnrollmentTest, AccessCodesAreUppercaseHex) {
    std::string code = EnrollmentManager::generate_access_code();
    ASSERT_EQ(code.size(), 12u);
    EXPECT_EQ(code.find_first_not_of("0123456789ABCDEF"), std::string::npos);
}
