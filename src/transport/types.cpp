#include "peerlink/transport/types.hpp"

#include <algorithm>

namespace peerlink::transport {

bool ConnectionState::add_candidate(const signaling::Candidate& candidate) {
    if (std::find(candidates.begin(), candidates.end(), candidate) != candidates.end()) {
        return false;
    }
    candidates.push_back(candidate);
    return true;
}

const char* to_string(Role role) noexcept {
    switch (role) {
        case Role::Host: return "Host";
        case Role::Joiner: return "Joiner";
    }
    return "Unknown";
}

const char* to_string(GatheringStatus status) noexcept {
    switch (status) {
        case GatheringStatus::NotStarted: return "NotStarted";
        case GatheringStatus::InProgress: return "InProgress";
        case GatheringStatus::Complete: return "Complete";
    }
    return "Unknown";
}

const char* to_string(ConnectivityStatus status) noexcept {
    switch (status) {
        case ConnectivityStatus::New: return "New";
        case ConnectivityStatus::Checking: return "Checking";
        case ConnectivityStatus::Connected: return "Connected";
        case ConnectivityStatus::Failed: return "Failed";
        case ConnectivityStatus::Disconnected: return "Disconnected";
        case ConnectivityStatus::Closed: return "Closed";
    }
    return "Unknown";
}

const char* to_string(ChannelStatus status) noexcept {
    switch (status) {
        case ChannelStatus::Connecting: return "Connecting";
        case ChannelStatus::Open: return "Open";
        case ChannelStatus::Closing: return "Closing";
        case ChannelStatus::Closed: return "Closed";
    }
    return "Unknown";
}

const char* to_string(SdpType type) noexcept {
    switch (type) {
        case SdpType::Offer: return "offer";
        case SdpType::Answer: return "answer";
    }
    return "unknown";
}

const char* to_string(NegotiationState state) noexcept {
    switch (state) {
        case NegotiationState::Uninitialized: return "Uninitialized";
        case NegotiationState::NegotiationStarted: return "NegotiationStarted";
        case NegotiationState::OfferReady: return "OfferReady";
        case NegotiationState::AnswerReady: return "AnswerReady";
        case NegotiationState::Negotiating: return "Negotiating";
        case NegotiationState::ChannelOpen: return "ChannelOpen";
        case NegotiationState::Closed: return "Closed";
    }
    return "Unknown";
}

} // namespace peerlink::transport
