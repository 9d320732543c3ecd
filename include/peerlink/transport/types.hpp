#pragma once

#include "peerlink/signaling/types.hpp"

#include <vector>

namespace peerlink::transport {

enum class Role {
    Host,   ///< Originates the offer
    Joiner  ///< Originates the answer
};

enum class GatheringStatus {
    NotStarted,
    InProgress,
    Complete
};

enum class ConnectivityStatus {
    New,
    Checking,
    Connected,
    Failed,
    Disconnected,
    Closed
};

enum class ChannelStatus {
    Connecting,
    Open,
    Closing,
    Closed
};

enum class SdpType {
    Offer,
    Answer
};

/**
 * @brief Negotiation progress of one NetworkManager
 *
 * Host:   Uninitialized -> NegotiationStarted -> OfferReady -> Negotiating -> ChannelOpen
 * Joiner: Uninitialized -> NegotiationStarted -> AnswerReady -> ChannelOpen
 * Either role ends in Closed once the channel closes or the manager is closed.
 */
enum class NegotiationState {
    Uninitialized,
    NegotiationStarted,
    OfferReady,
    AnswerReady,
    Negotiating,
    ChannelOpen,
    Closed
};

/**
 * @brief Point-in-time view of the transport, owned by the NetworkManager
 */
struct ConnectionState {
    GatheringStatus candidate_gathering_status = GatheringStatus::NotStarted;
    ConnectivityStatus connectivity_status = ConnectivityStatus::New;
    ChannelStatus channel_status = ChannelStatus::Connecting;
    std::vector<signaling::Candidate> candidates; ///< Local candidates, no duplicates

    /// Returns false when the candidate was already known.
    bool add_candidate(const signaling::Candidate& candidate);

    [[nodiscard]] bool is_channel_open() const noexcept {
        return channel_status == ChannelStatus::Open;
    }

    bool operator==(const ConnectionState& other) const {
        return candidate_gathering_status == other.candidate_gathering_status &&
               connectivity_status == other.connectivity_status &&
               channel_status == other.channel_status &&
               candidates == other.candidates;
    }
    bool operator!=(const ConnectionState& other) const { return !(*this == other); }
};

const char* to_string(Role role) noexcept;
const char* to_string(GatheringStatus status) noexcept;
const char* to_string(ConnectivityStatus status) noexcept;
const char* to_string(ChannelStatus status) noexcept;
const char* to_string(SdpType type) noexcept;
const char* to_string(NegotiationState state) noexcept;

} // namespace peerlink::transport
