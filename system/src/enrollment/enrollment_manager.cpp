#include "enrollment/enrollment_manager.hpp"
#include "core/errors.hpp"
#include "core/utils.hpp"
#include <spdlog/spdlog.h>

namespace facegate {

namespace {

FaceGateError missing_capture() {
    return FaceGateError(ErrorKind::MissingCapture,
                         "No face captured. Please capture your face first using the camera.");
}

}  // namespace

EnrollmentManager::EnrollmentManager(Storage& storage, AuditLog& audit)
    : storage(storage), audit(audit) {}

std::string EnrollmentManager::generate_access_code() {
    return random_hex(6, true);
}

EnrollmentResult EnrollmentManager::enroll(const std::string& session_token,
                                           const std::string& raw_name,
                                           const std::string& raw_group,
                                           const std::string& raw_roll) {
    const std::string name = trim(raw_name);
    const std::string group = trim(raw_group);
    const std::string roll = trim(raw_roll);

    if (name.empty() || group.empty() || roll.empty()) {
        throw FaceGateError(ErrorKind::InvalidInput, "All fields are required (name, class, roll)");
    }

    auto ticket = storage.find_ticket(session_token, now_ms());
    if (!ticket || ticket->preview.empty() || ticket->embedding.empty()) {
        throw missing_capture();
    }

    // Chequeo temprano para un mensaje claro; la garantia real es commit_enrollment
    if (storage.find_identity(name)) {
        audit.append("REGISTRATION REJECTED: '" + name + "' is already registered");
        throw FaceGateError(ErrorKind::DuplicateIdentity, "User '" + name + "' is already registered.");
    }

    Identity identity;
    identity.name = name;
    identity.embedding = ticket->embedding;
    identity.group = group;
    identity.roll = roll;
    identity.access_code = generate_access_code();
    identity.registered_at = now_ms();

    switch (storage.commit_enrollment(identity, session_token, now_ms())) {
    case EnrollOutcome::Committed:
        break;
    case EnrollOutcome::NameTaken:
        audit.append("REGISTRATION REJECTED: '" + name + "' is already registered");
        throw FaceGateError(ErrorKind::DuplicateIdentity, "User '" + name + "' is already registered.");
    case EnrollOutcome::TicketMissing:
        // Otro registro consumio el ticket primero
        throw missing_capture();
    }

    spdlog::info("✓ Registrado: {} (class={}, roll={})", name, group, roll);
    audit.append("NEW REGISTRATION: " + name + " | Class: " + group +
                 " | Roll: " + roll + " | Code: " + identity.access_code);

    return {identity.access_code, identity.name};
}

}  // namespace facegate
