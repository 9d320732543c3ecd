#pragma once

#include "peerlink/core/config.hpp"
#include "peerlink/core/result.hpp"
#include "peerlink/events/event_bus.hpp"
#include "peerlink/qr/qr_renderer.hpp"
#include "peerlink/session/chat.hpp"
#include "peerlink/session/file_chunker.hpp"
#include "peerlink/session/file_info.hpp"
#include "peerlink/session/state_machine.hpp"
#include "peerlink/transport/network_manager.hpp"
#include "peerlink/transport/transport.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace peerlink::session {

/// Produces a fresh, non-null transport for each NetworkManager the session builds.
using TransportFactory = std::function<std::unique_ptr<transport::Transport>()>;

/**
 * @brief One user's side of a peer connection, start to finish
 *
 * WHY THIS FILE EXISTS:
 * This is what a UI talks to. The session owns the single live
 * NetworkManager, the wizard, the chat log and the file transfers, and keeps
 * them consistent with each other:
 * - every ConnectionStateChangedEvent re-evaluates the wizard
 * - every channel message is decoded into a chat line or a file chunk
 * - reset() replaces all of it at once
 *
 * The UI reads snapshots through the accessors and observes changes by
 * subscribing to bus(). Nothing here hands out mutable internals.
 *
 * THREADING:
 * Owner thread only. Transport callbacks are applied (and events emitted)
 * inside process_events(); do not call reset() from an event handler.
 *
 * EXAMPLE:
 * auto session = PeerSession::create(factory, config).value();
 * session->start();
 * session->choose_host();
 * session->process_events_for(100ms);       // until SharingCode
 * show(session->local_artifact().value());
 * session->confirm_code_shared();
 * session->accept_answer(pasted_answer);
 * session->process_events_for(100ms);       // until Connected
 * session->send_text("hi");
 */
class PeerSession {
public:
    /// InvalidArgument for an empty factory or a chunk size outside (0, kMaxChunkSize].
    static Result<std::unique_ptr<PeerSession>> create(TransportFactory factory, PeerConfig config);

    ~PeerSession();

    PeerSession(const PeerSession&) = delete;
    PeerSession& operator=(const PeerSession&) = delete;

    // ─── Wizard ───────────────────────────────────────────

    /// Welcome -> ChooseRole.
    Result<void> start();

    /// ChooseRole -> GeneratingCode; starts the offer and candidate harvesting.
    Result<void> choose_host();

    /// ChooseRole -> WaitingForConnection; the transport stays idle until an offer is pasted.
    Result<void> choose_joiner();

    /// Joiner, WaitingForConnection only. Failures (InvalidOffer) keep the step so the code can be re-pasted.
    Result<void> accept_offer(std::string_view artifact);

    /// Host only. InvalidState before choose_host(), InvalidAnswer for a bad paste.
    Result<void> accept_answer(std::string_view artifact);

    /// Host, SharingCode -> WaitingForAnswer.
    Result<void> confirm_code_shared();

    /// This side's connection code, once the local description exists.
    Result<std::string> local_artifact() const;

    Result<qr::RasterImage> render_artifact_qr(const qr::QrRenderer& renderer) const;

    // ─── Chat & files ─────────────────────────────────────

    [[nodiscard]] bool is_chat_enabled() const;

    Result<Message> send_text(const std::string& text);

    /**
     * @brief Send a file as a sequence of chunk frames
     *
     * RETURNS:
     * The transfer id. InvalidState while the channel is closed,
     * InvalidArgument when the file fails validate_file().
     */
    Result<std::uint32_t> send_file(const FileInfo& file);
    Result<std::uint32_t> send_file(const std::filesystem::path& path);

    [[nodiscard]] std::optional<TransferProgress> incoming_progress(std::uint32_t transfer_id) const;

    /// Drops incoming transfers idle for longer than `max_age`. Returns how many.
    std::size_t prune_stale_transfers(std::chrono::steady_clock::duration max_age);

    // ─── Event pump ───────────────────────────────────────

    std::size_t process_events();
    std::size_t process_events_for(std::chrono::milliseconds timeout);

    /**
     * @brief Disconnect and start over from Welcome
     *
     * The current NetworkManager is closed and destroyed before its
     * replacement is built. Chat log, received files and incomplete
     * transfers are discarded.
     */
    void reset();

    // ─── Snapshots ────────────────────────────────────────

    [[nodiscard]] WizardStep step() const noexcept { return wizard_.step(); }
    [[nodiscard]] std::optional<transport::Role> role() const noexcept { return wizard_.role(); }
    [[nodiscard]] transport::ConnectionState connection_state() const;
    [[nodiscard]] transport::NegotiationState negotiation_state() const;
    [[nodiscard]] const std::vector<Message>& messages() const;
    [[nodiscard]] const std::vector<FileInfo>& received_files() const noexcept { return received_files_; }
    [[nodiscard]] const PeerConfig& config() const noexcept { return config_; }

    /// Subscribe here to observe the session.
    [[nodiscard]] events::EventBus& bus() noexcept { return bus_; }

private:
    PeerSession(TransportFactory factory, PeerConfig config);

    void build_manager();
    void subscribe_to_manager_events();
    void on_channel_message(const Bytes& data);
    void on_file_chunk(const FileChunk& chunk);

    /// Emits WizardStepChangedEvent if the wizard moved away from `previous`.
    void publish_step_change(WizardStep previous);

    TransportFactory factory_;
    PeerConfig config_;

    // Declared first: the manager and chat keep references to it.
    events::EventBus bus_;
    std::unique_ptr<transport::NetworkManager> manager_;
    std::unique_ptr<ChatSession> chat_;

    ConnectionStateMachine wizard_;
    FileChunker outgoing_;
    FileChunker incoming_;
    std::vector<FileInfo> received_files_;

    std::size_t state_subscription_ = 0;
    std::size_t message_subscription_ = 0;
};

} // namespace peerlink::session
