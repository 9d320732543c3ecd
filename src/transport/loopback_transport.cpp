#include "peerlink/transport/loopback_transport.hpp"

#include <charconv>
#include <optional>
#include <sstream>

namespace peerlink::transport {
namespace {

constexpr std::string_view kOriginPrefix = "o=peerlink-loopback ";

std::optional<std::uint64_t> parse_endpoint_id(const std::string& sdp) {
    const auto pos = sdp.find(kOriginPrefix);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    const char* begin = sdp.data() + pos + kOriginPrefix.size();
    const char* end = sdp.data() + sdp.size();
    std::uint64_t id = 0;
    const auto [ptr, ec] = std::from_chars(begin, end, id);
    if (ec != std::errc() || ptr == begin || id == 0) {
        return std::nullopt;
    }
    return id;
}

} // namespace

// ════════════════════════════════════════════════════════
// LoopbackNetwork
// ════════════════════════════════════════════════════════

std::shared_ptr<LoopbackNetwork> LoopbackNetwork::create() {
    return std::shared_ptr<LoopbackNetwork>(new LoopbackNetwork());
}

std::unique_ptr<LoopbackTransport> LoopbackNetwork::make_transport(LoopbackOptions options) {
    return std::make_unique<LoopbackTransport>(shared_from_this(), options);
}

void LoopbackNetwork::set_reachable(bool reachable) {
    std::lock_guard lock(mutex_);
    reachable_ = reachable;
}

bool LoopbackNetwork::reachable() const {
    std::lock_guard lock(mutex_);
    return reachable_;
}

std::size_t LoopbackNetwork::endpoint_count() const {
    std::lock_guard lock(mutex_);
    return endpoints_.size();
}

std::uint64_t LoopbackNetwork::register_endpoint(LoopbackTransport* endpoint) {
    std::lock_guard lock(mutex_);
    const auto id = next_id_++;
    endpoints_[id] = endpoint;
    return id;
}

void LoopbackNetwork::unregister_endpoint(std::uint64_t id) {
    std::lock_guard lock(mutex_);
    endpoints_.erase(id);
}

LoopbackTransport* LoopbackNetwork::find(std::uint64_t id) const {
    std::lock_guard lock(mutex_);
    auto it = endpoints_.find(id);
    return it == endpoints_.end() ? nullptr : it->second;
}

// ════════════════════════════════════════════════════════
// LoopbackTransport
// ════════════════════════════════════════════════════════

LoopbackTransport::LoopbackTransport(std::shared_ptr<LoopbackNetwork> network, LoopbackOptions options)
    : network_(std::move(network)),
      options_(options) {
    id_ = network_->register_endpoint(this);
}

LoopbackTransport::~LoopbackTransport() {
    close();
}

void LoopbackTransport::set_event_sink(EventSink sink) {
    sink_ = std::move(sink);
}

Result<void> LoopbackTransport::create_offer() {
    if (closed_ || described_) {
        return Err<void>(ErrorCode::TransportFailure, "Loopback endpoint already negotiating");
    }
    start_gathering(SdpType::Offer);
    return Ok();
}

Result<void> LoopbackTransport::set_remote_description(const std::string& sdp, SdpType type) {
    if (closed_) {
        return Err<void>(ErrorCode::TransportFailure, "Loopback endpoint is closed");
    }

    const auto remote_id = parse_endpoint_id(sdp);
    if (!remote_id.has_value() || *remote_id == id_) {
        return Err<void>(ErrorCode::TransportFailure, "Not a loopback session description");
    }
    const bool remote_is_offer = sdp.find("a=peerlink-type:offer") != std::string::npos;
    if (remote_is_offer != (type == SdpType::Offer)) {
        return Err<void>(ErrorCode::TransportFailure,
                         std::string("Description is not an ") + to_string(type));
    }

    if (type == SdpType::Offer) {
        if (described_) {
            return Err<void>(ErrorCode::TransportFailure, "Loopback endpoint already negotiating");
        }
        peer_id_ = *remote_id;
        start_gathering(SdpType::Answer);
        return Ok();
    }

    if (!described_ || peer_id_ != 0) {
        return Err<void>(ErrorCode::TransportFailure, "No local offer awaiting an answer");
    }
    LoopbackTransport* peer = network_->find(*remote_id);
    if (peer == nullptr || peer->peer_id_ != id_) {
        return Err<void>(ErrorCode::TransportFailure, "Answer does not belong to this offer");
    }
    peer_id_ = *remote_id;
    connect_to(*peer);
    return Ok();
}

Result<void> LoopbackTransport::add_remote_candidate(const signaling::Candidate& candidate) {
    if (candidate.candidate.rfind("candidate:", 0) != 0) {
        return Err<void>(ErrorCode::TransportFailure, "Unparseable candidate line");
    }
    ++remote_candidates_;
    return Ok();
}

Result<void> LoopbackTransport::send(const Bytes& data) {
    if (!open_) {
        return Err<void>(ErrorCode::TransportFailure, "Loopback channel is not open");
    }
    if (data.size() > options_.max_message_size) {
        return Err<void>(ErrorCode::InvalidArgument,
                         "Message of " + std::to_string(data.size()) + " bytes exceeds channel limit of " +
                             std::to_string(options_.max_message_size));
    }
    LoopbackTransport* peer = network_->find(peer_id_);
    if (peer == nullptr) {
        return Err<void>(ErrorCode::TransportFailure, "Loopback peer is gone");
    }
    peer->raise(transport_event::ChannelMessage{data});
    return Ok();
}

void LoopbackTransport::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    if (open_) {
        open_ = false;
        if (LoopbackTransport* peer = network_->find(peer_id_)) {
            peer->on_peer_closed();
        }
    }
    network_->unregister_endpoint(id_);
    sink_ = nullptr;
}

void LoopbackTransport::finish_gathering() {
    if (closed_ || !described_ || gathering_done_) {
        return;
    }
    gathering_done_ = true;
    raise(transport_event::GatheringChanged{GatheringStatus::Complete});
}

void LoopbackTransport::discover_candidate(const std::string& line) {
    if (closed_) {
        return;
    }
    raise(transport_event::LocalCandidate{signaling::Candidate{line, "0"}});
}

void LoopbackTransport::raise(TransportEvent event) {
    if (sink_) {
        sink_(std::move(event));
    }
}

void LoopbackTransport::start_gathering(SdpType type) {
    described_ = true;
    raise(transport_event::LocalDescription{make_description(type), type});
    raise(transport_event::GatheringChanged{GatheringStatus::InProgress});
    for (std::size_t i = 0; i < options_.candidate_count; ++i) {
        raise(transport_event::LocalCandidate{signaling::Candidate{make_candidate(i), "0"}});
    }
    if (options_.complete_gathering) {
        finish_gathering();
    }
}

void LoopbackTransport::connect_to(LoopbackTransport& peer) {
    raise(transport_event::ConnectivityChanged{ConnectivityStatus::Checking});
    peer.raise(transport_event::ConnectivityChanged{ConnectivityStatus::Checking});

    if (!network_->reachable()) {
        raise(transport_event::ConnectivityChanged{ConnectivityStatus::Failed});
        peer.raise(transport_event::ConnectivityChanged{ConnectivityStatus::Failed});
        return;
    }

    open_ = true;
    peer.open_ = true;
    raise(transport_event::ConnectivityChanged{ConnectivityStatus::Connected});
    peer.raise(transport_event::ConnectivityChanged{ConnectivityStatus::Connected});
    raise(transport_event::ChannelOpened{});
    peer.raise(transport_event::ChannelOpened{});
}

void LoopbackTransport::on_peer_closed() {
    if (!open_) {
        return;
    }
    open_ = false;
    raise(transport_event::ConnectivityChanged{ConnectivityStatus::Disconnected});
    raise(transport_event::ChannelClosed{});
}

std::string LoopbackTransport::make_description(SdpType type) const {
    std::ostringstream sdp;
    sdp << "v=0\r\n"
        << kOriginPrefix << id_ << " 0 IN IP4 127.0.0.1\r\n"
        << "s=-\r\n"
        << "t=0 0\r\n"
        << "m=application 9 UDP/DTLS/SCTP webrtc-datachannel\r\n"
        << "a=mid:0\r\n"
        << "a=peerlink-type:" << to_string(type) << "\r\n";
    return sdp.str();
}

std::string LoopbackTransport::make_candidate(std::size_t index) const {
    std::ostringstream line;
    line << "candidate:" << (index + 1) << " 1 UDP " << (2122252543 - index) << " 127.0.0.1 "
         << (40000 + id_ * 10 + index) << " typ host";
    return line.str();
}

} // namespace peerlink::transport
