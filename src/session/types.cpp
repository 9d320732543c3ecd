#include "peerlink/session/types.hpp"

namespace peerlink::session {

const char* to_string(WizardStep step) noexcept {
    switch (step) {
        case WizardStep::Welcome: return "Welcome";
        case WizardStep::ChooseRole: return "ChooseRole";
        case WizardStep::GeneratingCode: return "GeneratingCode";
        case WizardStep::WaitingForConnection: return "WaitingForConnection";
        case WizardStep::SharingCode: return "SharingCode";
        case WizardStep::WaitingForAnswer: return "WaitingForAnswer";
        case WizardStep::Connected: return "Connected";
    }
    return "Unknown";
}

} // namespace peerlink::session
