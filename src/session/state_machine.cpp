#include "peerlink/session/state_machine.hpp"

namespace peerlink::session {

namespace {

// GeneratingCode and WaitingForConnection share a rank: they are the
// role-specific versions of the same point in the flow.
int rank(WizardStep step) {
    switch (step) {
        case WizardStep::Welcome: return 0;
        case WizardStep::ChooseRole: return 1;
        case WizardStep::GeneratingCode: return 2;
        case WizardStep::WaitingForConnection: return 2;
        case WizardStep::SharingCode: return 3;
        case WizardStep::WaitingForAnswer: return 4;
        case WizardStep::Connected: return 5;
    }
    return 0;
}

} // namespace

Result<void> ConnectionStateMachine::start() {
    if (step_ != WizardStep::Welcome) {
        return Err<void>(ErrorCode::InvalidState,
                         std::string("start() called on step ") + to_string(step_));
    }
    advance_to(WizardStep::ChooseRole);
    return Ok();
}

Result<void> ConnectionStateMachine::choose_role(transport::Role role) {
    if (step_ != WizardStep::ChooseRole) {
        return Err<void>(ErrorCode::InvalidState,
                         std::string("choose_role() called on step ") + to_string(step_));
    }
    role_ = role;
    advance_to(role == transport::Role::Host ? WizardStep::GeneratingCode
                                             : WizardStep::WaitingForConnection);
    return Ok();
}

Result<void> ConnectionStateMachine::confirm_code_shared() {
    if (step_ != WizardStep::SharingCode || role_ != transport::Role::Host) {
        return Err<void>(ErrorCode::InvalidState,
                         std::string("confirm_code_shared() called on step ") + to_string(step_));
    }
    advance_to(WizardStep::WaitingForAnswer);
    return Ok();
}

bool ConnectionStateMachine::on_transport_update(const transport::ConnectionState& state) {
    if (state.is_channel_open()) {
        return advance_to(WizardStep::Connected);
    }

    if (state.candidate_gathering_status == transport::GatheringStatus::Complete &&
        (step_ == WizardStep::GeneratingCode || step_ == WizardStep::WaitingForConnection)) {
        return advance_to(WizardStep::SharingCode);
    }
    return false;
}

void ConnectionStateMachine::reset() {
    step_ = WizardStep::Welcome;
    role_.reset();
}

bool ConnectionStateMachine::advance_to(WizardStep next) {
    if (rank(next) <= rank(step_)) {
        return false;
    }
    step_ = next;
    return true;
}

} // namespace peerlink::session
