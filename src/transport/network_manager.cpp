#include "peerlink/transport/network_manager.hpp"

#include "peerlink/events/events.hpp"
#include "peerlink/signaling/codec.hpp"

#include <spdlog/spdlog.h>

#include <type_traits>
#include <variant>

namespace peerlink::transport {
namespace {

template<typename... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

NetworkManager::NetworkManager(std::unique_ptr<Transport> transport, events::EventBus& bus)
    : transport_(std::move(transport)),
      bus_(bus),
      inbox_(std::make_shared<events::ThreadSafeQueue<TransportEvent>>()) {
    std::weak_ptr<events::ThreadSafeQueue<TransportEvent>> weak_inbox = inbox_;
    transport_->set_event_sink([weak_inbox](TransportEvent event) {
        if (auto inbox = weak_inbox.lock()) {
            inbox->push(std::move(event));
        }
    });
}

NetworkManager::~NetworkManager() {
    close();
}

Result<void> NetworkManager::begin_as_host() {
    if (negotiation_ != NegotiationState::Uninitialized || closed_) {
        return Err<void>(ErrorCode::AlreadyStarted,
                         std::string("Negotiation already started as ") +
                             (role_ ? to_string(*role_) : "closed manager"));
    }

    auto result = transport_->create_offer();
    if (result.is_error()) {
        spdlog::warn("[NetworkManager] create_offer failed: {}", result.error().describe());
        return result;
    }

    role_ = Role::Host;
    negotiation_ = NegotiationState::NegotiationStarted;
    spdlog::debug("[NetworkManager] host negotiation started");
    return Ok();
}

Result<void> NetworkManager::accept_answer(std::string_view artifact) {
    if (role_ != Role::Host ||
        (negotiation_ != NegotiationState::NegotiationStarted &&
         negotiation_ != NegotiationState::OfferReady)) {
        return Err<void>(ErrorCode::InvalidState,
                         std::string("Cannot accept an answer in state ") + to_string(negotiation_));
    }

    auto decoded = signaling::SignalingCodec::decode(artifact);
    if (decoded.is_error()) {
        return Err<void>(wrap_error(ErrorCode::InvalidAnswer, decoded.error()));
    }
    const auto& answer = decoded.value();

    auto applied = transport_->set_remote_description(answer.local_description, SdpType::Answer);
    if (applied.is_error()) {
        return Err<void>(wrap_error(ErrorCode::InvalidAnswer, applied.error()));
    }
    apply_remote_candidates(answer.candidates);

    negotiation_ = NegotiationState::Negotiating;
    spdlog::debug("[NetworkManager] answer applied with {} remote candidates", answer.candidates.size());
    return Ok();
}

Result<void> NetworkManager::accept_offer(std::string_view artifact) {
    if (role_ == Role::Host) {
        return Err<void>(ErrorCode::InvalidState, "A host cannot accept an offer");
    }
    if (negotiation_ != NegotiationState::Uninitialized || closed_) {
        return Err<void>(ErrorCode::AlreadyStarted, "An offer was already accepted");
    }

    auto decoded = signaling::SignalingCodec::decode(artifact);
    if (decoded.is_error()) {
        return Err<void>(wrap_error(ErrorCode::InvalidOffer, decoded.error()));
    }
    const auto& offer = decoded.value();

    auto applied = transport_->set_remote_description(offer.local_description, SdpType::Offer);
    if (applied.is_error()) {
        return Err<void>(wrap_error(ErrorCode::InvalidOffer, applied.error()));
    }

    role_ = Role::Joiner;
    negotiation_ = NegotiationState::NegotiationStarted;
    apply_remote_candidates(offer.candidates);

    spdlog::debug("[NetworkManager] offer applied with {} remote candidates", offer.candidates.size());
    return Ok();
}

Result<std::string> NetworkManager::local_artifact() const {
    if (!local_description_.has_value()) {
        return Err<std::string>(ErrorCode::InvalidState, "No local description yet");
    }
    if (state_.candidate_gathering_status != GatheringStatus::Complete) {
        spdlog::warn("[NetworkManager] connection code produced before gathering completed ({} candidates)",
                     state_.candidates.size());
    }

    signaling::NegotiationArtifact artifact;
    artifact.local_description = *local_description_;
    artifact.candidates = state_.candidates;
    return Ok(signaling::SignalingCodec::encode(artifact));
}

Result<void> NetworkManager::send(const Bytes& data) {
    if (!state_.is_channel_open()) {
        return Err<void>(ErrorCode::InvalidState,
                         std::string("Channel is ") + to_string(state_.channel_status));
    }
    return transport_->send(data);
}

std::size_t NetworkManager::process_events() {
    std::size_t applied = 0;
    // Applying an event can make the transport raise more; keep going until quiet.
    for (auto batch = inbox_->drain(); !batch.empty(); batch = inbox_->drain()) {
        for (const auto& event : batch) {
            apply(event);
        }
        applied += batch.size();
    }
    return applied;
}

std::size_t NetworkManager::process_events_for(std::chrono::milliseconds timeout) {
    auto first = inbox_->pop_for(timeout);
    if (!first.has_value()) {
        return 0;
    }
    apply(*first);
    return 1 + process_events();
}

void NetworkManager::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    transport_->close();
    inbox_->clear();

    if (negotiation_ != NegotiationState::Uninitialized) {
        negotiation_ = NegotiationState::Closed;
    }
    if (state_.channel_status != ChannelStatus::Connecting) {
        state_.channel_status = ChannelStatus::Closed;
    }
}

void NetworkManager::apply(const TransportEvent& event) {
    if (closed_) {
        return;
    }
    std::visit(overloaded{
        [this](const transport_event::LocalDescription& e) { on_local_description(e); },
        [this](const transport_event::LocalCandidate& e) { on_local_candidate(e); },
        [this](const transport_event::GatheringChanged& e) { on_gathering_changed(e); },
        [this](const transport_event::ConnectivityChanged& e) { on_connectivity_changed(e); },
        [this](const transport_event::ChannelOpened&) { on_channel_opened(); },
        [this](const transport_event::ChannelMessage& e) { on_channel_message(e); },
        [this](const transport_event::ChannelClosed&) { on_channel_closed(); },
    }, event);
}

void NetworkManager::on_local_description(const transport_event::LocalDescription& event) {
    local_description_ = event.sdp;
    bus_.emit(events::LocalDescriptionCreatedEvent{role_.value_or(Role::Host), event.type});
    publish_state();
}

void NetworkManager::on_local_candidate(const transport_event::LocalCandidate& event) {
    // A candidate found after the code was shared is kept but never resent.
    if (!state_.add_candidate(event.candidate)) {
        return;
    }
    bus_.emit(events::CandidateDiscoveredEvent{event.candidate, state_.candidates.size()});
    publish_state();
}

void NetworkManager::on_gathering_changed(const transport_event::GatheringChanged& event) {
    if (state_.candidate_gathering_status == event.status) {
        return;
    }
    state_.candidate_gathering_status = event.status;

    if (event.status == GatheringStatus::Complete &&
        negotiation_ == NegotiationState::NegotiationStarted) {
        negotiation_ = role_ == Role::Host ? NegotiationState::OfferReady : NegotiationState::AnswerReady;
    }

    bus_.emit(events::GatheringStatusChangedEvent{event.status});
    publish_state();
}

void NetworkManager::on_connectivity_changed(const transport_event::ConnectivityChanged& event) {
    if (state_.connectivity_status == event.status) {
        return;
    }
    state_.connectivity_status = event.status;
    if (event.status == ConnectivityStatus::Failed) {
        spdlog::warn("[NetworkManager] connectivity checks failed");
    }
    bus_.emit(events::ConnectivityStatusChangedEvent{event.status});
    publish_state();
}

void NetworkManager::on_channel_opened() {
    if (state_.channel_status == ChannelStatus::Open) {
        return;
    }
    state_.channel_status = ChannelStatus::Open;
    negotiation_ = NegotiationState::ChannelOpen;
    bus_.emit(events::ChannelStatusChangedEvent{ChannelStatus::Open});
    publish_state();
}

void NetworkManager::on_channel_message(const transport_event::ChannelMessage& event) {
    if (!state_.is_channel_open()) {
        spdlog::warn("[NetworkManager] dropping {} bytes received while channel is {}",
                     event.data.size(), to_string(state_.channel_status));
        return;
    }
    bus_.emit(events::ChannelMessageReceivedEvent{event.data});
}

void NetworkManager::on_channel_closed() {
    if (state_.channel_status == ChannelStatus::Closed) {
        return;
    }
    state_.channel_status = ChannelStatus::Closed;
    negotiation_ = NegotiationState::Closed;
    bus_.emit(events::ChannelStatusChangedEvent{ChannelStatus::Closed});
    publish_state();
}

void NetworkManager::apply_remote_candidates(const std::vector<signaling::Candidate>& candidates) {
    for (const auto& candidate : candidates) {
        auto result = transport_->add_remote_candidate(candidate);
        if (result.is_error()) {
            spdlog::warn("[NetworkManager] skipping remote candidate '{}': {}",
                         candidate.candidate, result.error().describe());
        }
    }
}

void NetworkManager::publish_state() {
    bus_.emit(events::ConnectionStateChangedEvent{state_, negotiation_});
}

} // namespace peerlink::transport
