#pragma once

#include "peerlink/core/result.hpp"
#include "peerlink/core/types.hpp"
#include "peerlink/signaling/types.hpp"
#include "peerlink/transport/types.hpp"

#include <functional>
#include <string>
#include <variant>

namespace peerlink::transport {

/**
 * @brief Things a backend reports about its peer connection
 *
 * Backends raise these from whatever thread their library uses; the
 * NetworkManager queues them and applies them on its owner's thread.
 */
namespace transport_event {

struct LocalDescription {
    std::string sdp;
    SdpType type = SdpType::Offer;
};

struct LocalCandidate {
    signaling::Candidate candidate;
};

struct GatheringChanged {
    GatheringStatus status = GatheringStatus::NotStarted;
};

struct ConnectivityChanged {
    ConnectivityStatus status = ConnectivityStatus::New;
};

struct ChannelOpened {};

struct ChannelMessage {
    Bytes data;
};

struct ChannelClosed {};

} // namespace transport_event

using TransportEvent = std::variant<
    transport_event::LocalDescription,
    transport_event::LocalCandidate,
    transport_event::GatheringChanged,
    transport_event::ConnectivityChanged,
    transport_event::ChannelOpened,
    transport_event::ChannelMessage,
    transport_event::ChannelClosed>;

/**
 * @brief One peer connection plus its single data channel
 *
 * Implementations: RtcTransport (libdatachannel) and LoopbackTransport
 * (deterministic in-process fake used by the tests and the demo).
 *
 * None of the operations block. Their asynchronous outcome (the local
 * description, candidates, connectivity, channel state) arrives through the
 * event sink. Synchronous failures are returned as TransportFailure.
 */
class Transport {
public:
    using EventSink = std::function<void(TransportEvent)>;

    virtual ~Transport() = default;

    /// Must be set before any other call. May be invoked from any thread.
    virtual void set_event_sink(EventSink sink) = 0;

    /// Host side: open the data channel, create the offer, start gathering.
    virtual Result<void> create_offer() = 0;

    /// Applying a remote offer makes the backend answer and start gathering.
    virtual Result<void> set_remote_description(const std::string& sdp, SdpType type) = 0;

    virtual Result<void> add_remote_candidate(const signaling::Candidate& candidate) = 0;

    virtual Result<void> send(const Bytes& data) = 0;

    /// Releases the connection. No events are raised after close() returns.
    virtual void close() = 0;
};

} // namespace peerlink::transport
