#include "access/access_controller.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

namespace facegate {

AccessController::AccessController(CapturePipeline& pipeline, Matcher& matcher,
                                   SessionManager& sessions, AuditLog& audit)
    : pipeline(pipeline), matcher(matcher), sessions(sessions), audit(audit) {}

ApprovalResult AccessController::approve(const std::string& payload) {
    std::vector<float> probe = pipeline.live_embedding(payload, "approval");

    MatchResult match = matcher.match(probe);
    if (!match.matched) {
        spdlog::info("✗ Acceso denegado: rostro no reconocido");
        audit.append("APPROVAL DENIED: Face not recognized");
        throw FaceGateError(ErrorKind::NoMatch,
                            "Face not recognized. Please register first or try again.");
    }

    spdlog::info("✓ Acceso aprobado: {} ({:.2f}%)", match.identity.name, match.confidence);

    ApprovalResult result;
    result.session = sessions.issue(match.identity, match.confidence);
    result.distance = match.distance;
    return result;
}

}  // namespace facegate
