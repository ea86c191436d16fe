// ============= include/access/access_controller.hpp =============
/*
 * Access Controller - aprobacion por rostro
 *
 * payload -> live embedding -> Matcher -> SessionManager::issue
 * Sin match: NoMatch (y entrada "APPROVAL DENIED" en auditoria).
 */

#pragma once
#include "capture/capture_pipeline.hpp"
#include "recognition/matcher.hpp"
#include "session/session_manager.hpp"

namespace facegate {

struct ApprovalResult {
    AccessSession session;
    float distance = 0.0f;
};

class AccessController {
public:
    AccessController(CapturePipeline& pipeline, Matcher& matcher,
                     SessionManager& sessions, AuditLog& audit);

    ApprovalResult approve(const std::string& payload);

private:
    CapturePipeline& pipeline;
    Matcher& matcher;
    SessionManager& sessions;
    AuditLog& audit;
};

}  // namespace facegate
