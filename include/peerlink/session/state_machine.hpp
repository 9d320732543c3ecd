#pragma once

#include "peerlink/core/result.hpp"
#include "peerlink/session/types.hpp"
#include "peerlink/transport/types.hpp"

#include <optional>

namespace peerlink::session {

/**
 * @brief Connection-setup wizard
 *
 * WHY THIS FILE EXISTS:
 * The transport has its own states (gathering, connectivity, channel) that
 * mean little to a person copying codes between two screens. The wizard turns
 * them into a short linear sequence of steps. User actions move it forward
 * explicitly; two transitions fire from transport snapshots:
 * - gathering Complete: GeneratingCode (host) or WaitingForConnection (joiner)
 *   moves to SharingCode
 * - channel Open: any step moves to Connected
 *
 * The wizard only moves forward. reset() is the single way back to Welcome.
 *
 * EXAMPLE:
 * ConnectionStateMachine wizard;
 * wizard.start();
 * wizard.choose_role(Role::Host);          // GeneratingCode
 * wizard.on_transport_update(snapshot);    // SharingCode once gathering completes
 * wizard.confirm_code_shared();            // WaitingForAnswer
 * wizard.on_transport_update(snapshot);    // Connected once the channel opens
 */
class ConnectionStateMachine {
public:
    [[nodiscard]] WizardStep step() const noexcept { return step_; }
    [[nodiscard]] std::optional<transport::Role> role() const noexcept { return role_; }

    /// Welcome -> ChooseRole.
    Result<void> start();

    /// ChooseRole -> GeneratingCode (host) or WaitingForConnection (joiner).
    Result<void> choose_role(transport::Role role);

    /// Host only: SharingCode -> WaitingForAnswer.
    Result<void> confirm_code_shared();

    /**
     * @brief Re-evaluate after a transport snapshot
     *
     * Checked on every snapshot, whatever the current step, so a transport
     * that races ahead of the UI still lands the wizard on Connected.
     *
     * RETURNS:
     * true if the step changed
     */
    bool on_transport_update(const transport::ConnectionState& state);

    void reset();

private:
    bool advance_to(WizardStep next);

    WizardStep step_ = WizardStep::Welcome;
    std::optional<transport::Role> role_;
};

} // namespace peerlink::session
