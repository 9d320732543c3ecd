#pragma once

#include "peerlink/core/result.hpp"
#include "peerlink/events/event_bus.hpp"
#include "peerlink/events/event_queue.hpp"
#include "peerlink/transport/transport.hpp"
#include "peerlink/transport/types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace peerlink::transport {

/**
 * @brief Drives one serverless offer/answer negotiation and its data channel
 *
 * The manager exclusively owns the Transport and the ConnectionState. Every
 * backend callback is queued and applied on the owner's thread by
 * process_events(); each applied callback updates the state and is re-emitted
 * on the event bus as a discrete event followed by a
 * ConnectionStateChangedEvent snapshot.
 *
 * Negotiation calls return immediately. Harvesting has no fixed duration, so
 * callers react to events or poll current_state() rather than wait.
 */
class NetworkManager {
public:
    NetworkManager(std::unique_ptr<Transport> transport, events::EventBus& bus);
    ~NetworkManager();

    NetworkManager(const NetworkManager&) = delete;
    NetworkManager& operator=(const NetworkManager&) = delete;

    [[nodiscard]] ConnectionState current_state() const { return state_; }
    [[nodiscard]] NegotiationState negotiation_state() const noexcept { return negotiation_; }
    [[nodiscard]] std::optional<Role> role() const noexcept { return role_; }

    /// Uninitialized -> NegotiationStarted. AlreadyStarted on any later call.
    Result<void> begin_as_host();

    /**
     * @brief Host only: apply the joiner's connection code
     *
     * InvalidState unless this manager is a host in NegotiationStarted or
     * OfferReady. InvalidAnswer (cause Malformed/Incomplete) when the code
     * does not decode. Either failure leaves the state untouched.
     */
    Result<void> accept_answer(std::string_view artifact);

    /**
     * @brief Joiner: apply the host's connection code and start answering
     *
     * InvalidOffer (cause Malformed/Incomplete/TransportFailure) leaves the
     * manager Uninitialized so the code can be pasted again.
     */
    Result<void> accept_offer(std::string_view artifact);

    /**
     * @brief This side's connection code for the human to relay
     *
     * Available once the local description exists. Producing it before
     * gathering completes is allowed; the peer only misses late candidates.
     */
    Result<std::string> local_artifact() const;

    /// InvalidState unless the channel is open.
    Result<void> send(const Bytes& data);

    /// Applies every queued transport callback. Returns how many were applied.
    std::size_t process_events();

    /// Waits up to `timeout` for the first callback, then drains the queue.
    std::size_t process_events_for(std::chrono::milliseconds timeout);

    /// Releases the transport. Pending callbacks are discarded.
    void close();

private:
    void apply(const TransportEvent& event);
    void on_local_description(const transport_event::LocalDescription& event);
    void on_local_candidate(const transport_event::LocalCandidate& event);
    void on_gathering_changed(const transport_event::GatheringChanged& event);
    void on_connectivity_changed(const transport_event::ConnectivityChanged& event);
    void on_channel_opened();
    void on_channel_message(const transport_event::ChannelMessage& event);
    void on_channel_closed();

    void apply_remote_candidates(const std::vector<signaling::Candidate>& candidates);
    void publish_state();

    std::unique_ptr<Transport> transport_;
    events::EventBus& bus_;
    // The transport's sink holds this weakly; a late callback finds nothing to push to.
    std::shared_ptr<events::ThreadSafeQueue<TransportEvent>> inbox_;

    ConnectionState state_;
    NegotiationState negotiation_ = NegotiationState::Uninitialized;
    std::optional<Role> role_;
    std::optional<std::string> local_description_;
    bool closed_ = false;
};

} // namespace peerlink::transport
