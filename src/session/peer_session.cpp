#include "peerlink/session/peer_session.hpp"

#include "peerlink/events/events.hpp"
#include "peerlink/session/frame.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <type_traits>
#include <variant>

namespace peerlink::session {

Result<std::unique_ptr<PeerSession>> PeerSession::create(TransportFactory factory, PeerConfig config) {
    using SessionPtr = std::unique_ptr<PeerSession>;

    if (!factory) {
        return Err<SessionPtr>(ErrorCode::InvalidArgument, "PeerSession needs a transport factory");
    }
    if (config.max_chunk_size == 0 || config.max_chunk_size > PeerConfig::kMaxChunkSize) {
        return Err<SessionPtr>(ErrorCode::InvalidArgument,
                               "max_chunk_size must be in (0, " +
                                   std::to_string(PeerConfig::kMaxChunkSize) + "]");
    }
    return Ok(SessionPtr(new PeerSession(std::move(factory), std::move(config))));
}

PeerSession::PeerSession(TransportFactory factory, PeerConfig config)
    : factory_(std::move(factory)),
      config_(std::move(config)),
      outgoing_(config_.max_chunk_size),
      incoming_(config_.max_chunk_size) {
    subscribe_to_manager_events();
    build_manager();
}

PeerSession::~PeerSession() {
    bus_.unsubscribe<events::ConnectionStateChangedEvent>(state_subscription_);
    bus_.unsubscribe<events::ChannelMessageReceivedEvent>(message_subscription_);
    chat_.reset();
    manager_.reset();
}

void PeerSession::build_manager() {
    manager_ = std::make_unique<transport::NetworkManager>(factory_(), bus_);
    chat_ = std::make_unique<ChatSession>(*manager_, bus_);
}

void PeerSession::subscribe_to_manager_events() {
    state_subscription_ = bus_.subscribe<events::ConnectionStateChangedEvent>(
        [this](const events::ConnectionStateChangedEvent& event) {
            const auto previous = wizard_.step();
            if (wizard_.on_transport_update(event.state)) {
                publish_step_change(previous);
            }
        });

    message_subscription_ = bus_.subscribe<events::ChannelMessageReceivedEvent>(
        [this](const events::ChannelMessageReceivedEvent& event) {
            on_channel_message(event.data);
        });
}

void PeerSession::publish_step_change(WizardStep previous) {
    const auto current = wizard_.step();
    if (current == previous) {
        return;
    }
    spdlog::info("[PeerSession] step {} -> {}", to_string(previous), to_string(current));
    bus_.emit(events::WizardStepChangedEvent{previous, current});
}

Result<void> PeerSession::start() {
    const auto previous = wizard_.step();
    auto result = wizard_.start();
    publish_step_change(previous);
    return result;
}

Result<void> PeerSession::choose_host() {
    if (wizard_.step() != WizardStep::ChooseRole) {
        return Err<void>(ErrorCode::InvalidState,
                         std::string("Cannot choose a role on step ") + to_string(wizard_.step()));
    }

    auto begun = manager_->begin_as_host();
    if (begun.is_error()) {
        return begun;
    }

    const auto previous = wizard_.step();
    auto result = wizard_.choose_role(transport::Role::Host);
    publish_step_change(previous);
    return result;
}

Result<void> PeerSession::choose_joiner() {
    const auto previous = wizard_.step();
    auto result = wizard_.choose_role(transport::Role::Joiner);
    publish_step_change(previous);
    return result;
}

Result<void> PeerSession::accept_offer(std::string_view artifact) {
    if (wizard_.step() != WizardStep::WaitingForConnection) {
        return Err<void>(ErrorCode::InvalidState,
                         std::string("Cannot accept an offer on step ") + to_string(wizard_.step()));
    }

    auto result = manager_->accept_offer(artifact);
    if (result.is_error()) {
        spdlog::warn("[PeerSession] offer rejected: {}", result.error().describe());
    }
    return result;
}

Result<void> PeerSession::accept_answer(std::string_view artifact) {
    auto result = manager_->accept_answer(artifact);
    if (result.is_error()) {
        spdlog::warn("[PeerSession] answer rejected: {}", result.error().describe());
    }
    return result;
}

Result<void> PeerSession::confirm_code_shared() {
    const auto previous = wizard_.step();
    auto result = wizard_.confirm_code_shared();
    publish_step_change(previous);
    return result;
}

Result<std::string> PeerSession::local_artifact() const {
    return manager_->local_artifact();
}

Result<qr::RasterImage> PeerSession::render_artifact_qr(const qr::QrRenderer& renderer) const {
    auto artifact = manager_->local_artifact();
    if (artifact.is_error()) {
        return Err<qr::RasterImage>(artifact.error());
    }
    return renderer.render(artifact.value());
}

bool PeerSession::is_chat_enabled() const {
    return chat_->is_chat_enabled();
}

Result<Message> PeerSession::send_text(const std::string& text) {
    return chat_->send(text);
}

Result<std::uint32_t> PeerSession::send_file(const FileInfo& file) {
    if (!manager_->current_state().is_channel_open()) {
        return Err<std::uint32_t>(ErrorCode::InvalidState, "Cannot send files until the channel is open");
    }

    auto valid = validate_file(file, config_.max_file_size_mb);
    if (valid.is_error()) {
        return Err<std::uint32_t>(valid.error());
    }

    // Header is at most 17 + 2 * 65535 bytes, always below kMaxMessageSize.
    const auto room = PeerConfig::kMaxMessageSize - FrameCodec::chunk_header_size(file.name, file.mime_type);
    auto chunks = outgoing_.split(file, std::min(config_.max_chunk_size, room));
    if (chunks.is_error()) {
        return Err<std::uint32_t>(chunks.error());
    }

    const auto& pieces = chunks.value();
    const auto transfer_id = pieces.front().transfer_id;
    const auto total = pieces.front().total_chunks;
    spdlog::info("[PeerSession] sending file={} size={} chunks={} transfer={}",
                 file.name, file.format_size(), total, transfer_id);

    std::uint32_t sent = 0;
    for (const auto& chunk : pieces) {
        auto result = manager_->send(FrameCodec::encode_chunk(chunk));
        if (result.is_error()) {
            spdlog::warn("[PeerSession] transfer={} stopped after {}/{} chunks: {}",
                         transfer_id, sent, total, result.error().describe());
            return Err<std::uint32_t>(result.error());
        }
        ++sent;
        bus_.emit(events::FileTransferProgressEvent{transfer_id, file.name, sent, total, true});
    }
    return Ok(transfer_id);
}

Result<std::uint32_t> PeerSession::send_file(const std::filesystem::path& path) {
    auto file = read_file(path);
    if (file.is_error()) {
        return Err<std::uint32_t>(file.error());
    }
    return send_file(file.value());
}

std::optional<TransferProgress> PeerSession::incoming_progress(std::uint32_t transfer_id) const {
    return incoming_.progress(transfer_id);
}

std::size_t PeerSession::prune_stale_transfers(std::chrono::steady_clock::duration max_age) {
    const auto pruned = incoming_.prune_stale(max_age);
    if (pruned > 0) {
        spdlog::info("[PeerSession] pruned {} stale incoming transfers", pruned);
    }
    return pruned;
}

void PeerSession::on_channel_message(const Bytes& data) {
    auto frame = FrameCodec::decode(data);
    if (frame.is_error()) {
        spdlog::warn("[PeerSession] dropping undecodable frame ({} bytes): {}",
                     data.size(), frame.error().describe());
        return;
    }

    std::visit([this](auto&& decoded) {
        using T = std::decay_t<decltype(decoded)>;
        if constexpr (std::is_same_v<T, TextFrame>) {
            chat_->on_receive(decoded.text);
        } else {
            on_file_chunk(decoded);
        }
    }, frame.value());
}

void PeerSession::on_file_chunk(const FileChunk& chunk) {
    auto ingested = incoming_.ingest(chunk);
    if (ingested.is_error()) {
        spdlog::warn("[PeerSession] dropping chunk {} of transfer={}: {}",
                     chunk.index, chunk.transfer_id, ingested.error().describe());
        return;
    }

    auto& completed = ingested.value();
    if (!completed) {
        if (auto progress = incoming_.progress(chunk.transfer_id)) {
            bus_.emit(events::FileTransferProgressEvent{
                chunk.transfer_id, progress->name, progress->received_chunks, progress->total_chunks, false});
        }
        return;
    }

    bus_.emit(events::FileTransferProgressEvent{
        chunk.transfer_id, completed->name, chunk.total_chunks, chunk.total_chunks, false});
    received_files_.push_back(*completed);
    bus_.emit(events::FileReceivedEvent{chunk.transfer_id, std::move(*completed)});
}

std::size_t PeerSession::process_events() {
    return manager_->process_events();
}

std::size_t PeerSession::process_events_for(std::chrono::milliseconds timeout) {
    return manager_->process_events_for(timeout);
}

void PeerSession::reset() {
    const auto previous = wizard_.step();
    const auto discarded_messages = chat_->messages().size();

    // The old transport must be released before its replacement exists.
    chat_.reset();
    manager_->close();
    manager_.reset();

    const auto abandoned = incoming_.clear();
    received_files_.clear();
    wizard_.reset();

    build_manager();

    spdlog::info("[PeerSession] reset: discarded messages={} abandoned transfers={}",
                 discarded_messages, abandoned);
    bus_.emit(events::SessionResetEvent{discarded_messages, abandoned});
    publish_step_change(previous);
}

transport::ConnectionState PeerSession::connection_state() const {
    return manager_->current_state();
}

transport::NegotiationState PeerSession::negotiation_state() const {
    return manager_->negotiation_state();
}

const std::vector<Message>& PeerSession::messages() const {
    return chat_->messages();
}

} // namespace peerlink::session
