#pragma once

#include "peerlink/core/config.hpp"
#include "peerlink/transport/transport.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace peerlink::transport {

class LoopbackTransport;

struct LoopbackOptions {
    std::size_t candidate_count = 2;
    /// When false, gathering stays InProgress until finish_gathering().
    bool complete_gathering = true;
    /// send() rejects larger messages, as a real data channel does.
    std::size_t max_message_size = PeerConfig::kMaxMessageSize;
};

/**
 * @brief In-process "network" that connects LoopbackTransports
 *
 * Descriptions name the endpoint that produced them, so an answer applied on
 * the host links it to the joiner that generated it. Nothing is timed: every
 * event is raised synchronously into the endpoint's sink, which makes
 * negotiation fully deterministic for tests.
 */
class LoopbackNetwork : public std::enable_shared_from_this<LoopbackNetwork> {
public:
    static std::shared_ptr<LoopbackNetwork> create();

    std::unique_ptr<LoopbackTransport> make_transport(LoopbackOptions options = {});

    /// Unreachable networks fail connectivity checks instead of opening the channel.
    void set_reachable(bool reachable);
    [[nodiscard]] bool reachable() const;

    [[nodiscard]] std::size_t endpoint_count() const;

private:
    friend class LoopbackTransport;

    LoopbackNetwork() = default;

    std::uint64_t register_endpoint(LoopbackTransport* endpoint);
    void unregister_endpoint(std::uint64_t id);
    LoopbackTransport* find(std::uint64_t id) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::uint64_t, LoopbackTransport*> endpoints_;
    std::uint64_t next_id_ = 1;
    bool reachable_ = true;
};

class LoopbackTransport : public Transport {
public:
    LoopbackTransport(std::shared_ptr<LoopbackNetwork> network, LoopbackOptions options);
    ~LoopbackTransport() override;

    LoopbackTransport(const LoopbackTransport&) = delete;
    LoopbackTransport& operator=(const LoopbackTransport&) = delete;

    void set_event_sink(EventSink sink) override;
    Result<void> create_offer() override;
    Result<void> set_remote_description(const std::string& sdp, SdpType type) override;
    Result<void> add_remote_candidate(const signaling::Candidate& candidate) override;
    Result<void> send(const Bytes& data) override;
    void close() override;

    /// Completes a gathering held open by LoopbackOptions::complete_gathering.
    void finish_gathering();

    /// Raises one more local candidate, as a late STUN reply would.
    void discover_candidate(const std::string& line);

    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
    [[nodiscard]] std::size_t remote_candidate_count() const noexcept { return remote_candidates_; }

private:
    void raise(TransportEvent event);
    void start_gathering(SdpType type);
    void connect_to(LoopbackTransport& peer);
    void on_peer_closed();
    std::string make_description(SdpType type) const;
    std::string make_candidate(std::size_t index) const;

    std::shared_ptr<LoopbackNetwork> network_;
    LoopbackOptions options_;
    std::uint64_t id_ = 0;
    EventSink sink_;

    bool described_ = false;
    bool gathering_done_ = false;
    bool open_ = false;
    bool closed_ = false;
    std::uint64_t peer_id_ = 0;
    std::size_t local_candidates_ = 0;
    std::size_t remote_candidates_ = 0;
};

} // namespace peerlink::transport
