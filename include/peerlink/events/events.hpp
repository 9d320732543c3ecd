/**
 * @file events.hpp
 * @brief Event types emitted by the peer core
 *
 * NAMING CONVENTION:
 * Events are past tense and carry plain values. None of them reference the
 * NetworkManager or the session, so a subscriber cannot mutate either.
 */

#pragma once

#include "peerlink/core/types.hpp"
#include "peerlink/session/file_info.hpp"
#include "peerlink/session/types.hpp"
#include "peerlink/signaling/types.hpp"
#include "peerlink/transport/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace peerlink::events {

// ════════════════════════════════════════════════════════
// Transport Events (emitted by NetworkManager)
// ════════════════════════════════════════════════════════

/**
 * @brief The local offer (host) or answer (joiner) exists
 *
 * WHO SUBSCRIBES: logger
 */
struct LocalDescriptionCreatedEvent {
    transport::Role role;
    transport::SdpType type;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A new local candidate was harvested
 *
 * Emitted once per distinct candidate; repeats from the backend are dropped.
 */
struct CandidateDiscoveredEvent {
    signaling::Candidate candidate;
    std::size_t total_candidates;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct GatheringStatusChangedEvent {
    transport::GatheringStatus status;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Connectivity checks progressed
 *
 * Failed and Disconnected are how transport failures are reported; there is
 * no synchronous error for them.
 */
struct ConnectivityStatusChangedEvent {
    transport::ConnectivityStatus status;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ChannelStatusChangedEvent {
    transport::ChannelStatus status;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Raw bytes arrived on the data channel
 *
 * WHO SUBSCRIBES: PeerSession (decodes frames into chat lines and file chunks)
 */
struct ChannelMessageReceivedEvent {
    Bytes data;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Snapshot after every applied transport event
 *
 * The wizard re-evaluates on each of these, whatever step it is on.
 */
struct ConnectionStateChangedEvent {
    transport::ConnectionState state;
    transport::NegotiationState negotiation;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Session Events (emitted by PeerSession)
// ════════════════════════════════════════════════════════

struct WizardStepChangedEvent {
    session::WizardStep previous;
    session::WizardStep current;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct MessageAppendedEvent {
    session::Message message;
};

struct FileTransferProgressEvent {
    std::uint32_t transfer_id;
    std::string file_name;
    std::uint32_t chunks_done;
    std::uint32_t total_chunks;
    bool outgoing;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileReceivedEvent {
    std::uint32_t transfer_id;
    session::FileInfo file;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Session was discarded and a fresh NetworkManager created
 */
struct SessionResetEvent {
    std::size_t discarded_messages;
    std::size_t abandoned_transfers;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace peerlink::events
