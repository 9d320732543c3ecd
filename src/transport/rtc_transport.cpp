#include "peerlink/transport/rtc_transport.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <variant>

namespace peerlink::transport {
namespace {

GatheringStatus map_gathering(rtc::PeerConnection::GatheringState state) {
    switch (state) {
        case rtc::PeerConnection::GatheringState::New: return GatheringStatus::NotStarted;
        case rtc::PeerConnection::GatheringState::InProgress: return GatheringStatus::InProgress;
        case rtc::PeerConnection::GatheringState::Complete: return GatheringStatus::Complete;
    }
    return GatheringStatus::NotStarted;
}

ConnectivityStatus map_ice(rtc::PeerConnection::IceState state) {
    switch (state) {
        case rtc::PeerConnection::IceState::New: return ConnectivityStatus::New;
        case rtc::PeerConnection::IceState::Checking: return ConnectivityStatus::Checking;
        case rtc::PeerConnection::IceState::Connected:
        case rtc::PeerConnection::IceState::Completed: return ConnectivityStatus::Connected;
        case rtc::PeerConnection::IceState::Failed: return ConnectivityStatus::Failed;
        case rtc::PeerConnection::IceState::Disconnected: return ConnectivityStatus::Disconnected;
        case rtc::PeerConnection::IceState::Closed: return ConnectivityStatus::Closed;
    }
    return ConnectivityStatus::New;
}

Result<void> library_failure(const char* operation, const std::exception& e) {
    spdlog::warn("[RtcTransport] {} failed: {}", operation, e.what());
    return Err<void>(ErrorCode::TransportFailure, std::string(operation) + ": " + e.what());
}

} // namespace

RtcTransport::RtcTransport(const PeerConfig& config)
    : channel_label_(config.channel_label) {
    for (const auto& server : config.ice_servers) {
        rtc_config_.iceServers.emplace_back(server);
    }
}

RtcTransport::~RtcTransport() {
    close();
}

void RtcTransport::set_event_sink(EventSink sink) {
    std::lock_guard lock(sink_mutex_);
    sink_ = std::move(sink);
}

Result<void> RtcTransport::create_offer() {
    if (auto ready = ensure_peer(); ready.is_error()) {
        return ready;
    }
    if (current_channel()) {
        return Err<void>(ErrorCode::TransportFailure, "Data channel already created");
    }
    try {
        // Creating the first channel triggers the local offer and gathering.
        auto channel = peer_->createDataChannel(channel_label_);
        attach_channel(std::move(channel));
    } catch (const std::exception& e) {
        return library_failure("createDataChannel", e);
    }
    return Ok();
}

Result<void> RtcTransport::set_remote_description(const std::string& sdp, SdpType type) {
    if (auto ready = ensure_peer(); ready.is_error()) {
        return ready;
    }
    try {
        peer_->setRemoteDescription(rtc::Description(sdp, to_string(type)));
    } catch (const std::exception& e) {
        return library_failure("setRemoteDescription", e);
    }
    return Ok();
}

Result<void> RtcTransport::add_remote_candidate(const signaling::Candidate& candidate) {
    if (!peer_) {
        return Err<void>(ErrorCode::TransportFailure, "No peer connection");
    }
    try {
        peer_->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.sdp_mid));
    } catch (const std::exception& e) {
        return library_failure("addRemoteCandidate", e);
    }
    return Ok();
}

Result<void> RtcTransport::send(const Bytes& data) {
    const auto channel = current_channel();
    if (!channel || !channel->isOpen()) {
        return Err<void>(ErrorCode::TransportFailure, "Data channel is not open");
    }
    if (data.size() > channel->maxMessageSize()) {
        return Err<void>(ErrorCode::InvalidArgument,
                         "Message of " + std::to_string(data.size()) + " bytes exceeds channel limit of " +
                             std::to_string(channel->maxMessageSize()));
    }
    try {
        rtc::binary payload(data.size());
        for (std::size_t i = 0; i < data.size(); ++i) {
            payload[i] = static_cast<std::byte>(data[i]);
        }
        channel->send(std::move(payload));
    } catch (const std::exception& e) {
        return library_failure("send", e);
    }
    return Ok();
}

void RtcTransport::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    {
        std::lock_guard lock(sink_mutex_);
        sink_ = nullptr;
    }
    std::shared_ptr<rtc::DataChannel> channel;
    {
        std::lock_guard lock(channel_mutex_);
        channel = std::move(channel_);
    }
    try {
        if (channel) {
            channel->resetCallbacks();
            channel->close();
        }
        if (peer_) {
            peer_->resetCallbacks();
            peer_->close();
        }
    } catch (const std::exception& e) {
        spdlog::warn("[RtcTransport] error while closing: {}", e.what());
    }
    peer_.reset();
}

Result<void> RtcTransport::ensure_peer() {
    if (closed_) {
        return Err<void>(ErrorCode::TransportFailure, "Transport is closed");
    }
    if (peer_) {
        return Ok();
    }
    try {
        peer_ = std::make_shared<rtc::PeerConnection>(rtc_config_);
    } catch (const std::exception& e) {
        return library_failure("PeerConnection", e);
    }

    peer_->onLocalDescription([this](rtc::Description description) {
        const auto type = description.type() == rtc::Description::Type::Answer ? SdpType::Answer : SdpType::Offer;
        raise(transport_event::LocalDescription{std::string(description), type});
    });

    peer_->onLocalCandidate([this](rtc::Candidate candidate) {
        raise(transport_event::LocalCandidate{signaling::Candidate{candidate.candidate(), candidate.mid()}});
    });

    peer_->onGatheringStateChange([this](rtc::PeerConnection::GatheringState state) {
        raise(transport_event::GatheringChanged{map_gathering(state)});
    });

    peer_->onIceStateChange([this](rtc::PeerConnection::IceState state) {
        raise(transport_event::ConnectivityChanged{map_ice(state)});
    });

    // Joiner side: the host's channel arrives with the connection.
    peer_->onDataChannel([this](std::shared_ptr<rtc::DataChannel> channel) {
        attach_channel(std::move(channel));
    });

    return Ok();
}

void RtcTransport::attach_channel(std::shared_ptr<rtc::DataChannel> channel) {
    {
        std::lock_guard lock(channel_mutex_);
        channel_ = channel;
    }

    channel->onOpen([this]() {
        raise(transport_event::ChannelOpened{});
    });

    channel->onClosed([this]() {
        raise(transport_event::ChannelClosed{});
    });

    channel->onError([](std::string error) {
        spdlog::warn("[RtcTransport] data channel error: {}", error);
    });

    channel->onMessage([this](rtc::message_variant message) {
        Bytes data;
        if (const auto* binary = std::get_if<rtc::binary>(&message)) {
            data.reserve(binary->size());
            for (std::byte b : *binary) {
                data.push_back(static_cast<std::uint8_t>(b));
            }
        } else if (const auto* text = std::get_if<std::string>(&message)) {
            data.assign(text->begin(), text->end());
        }
        raise(transport_event::ChannelMessage{std::move(data)});
    });

    // The channel may already be open when handed over by onDataChannel.
    if (channel->isOpen()) {
        raise(transport_event::ChannelOpened{});
    }
}

std::shared_ptr<rtc::DataChannel> RtcTransport::current_channel() const {
    std::lock_guard lock(channel_mutex_);
    return channel_;
}

void RtcTransport::raise(TransportEvent event) {
    std::lock_guard lock(sink_mutex_);
    if (sink_) {
        sink_(std::move(event));
    }
}

} // namespace peerlink::transport
