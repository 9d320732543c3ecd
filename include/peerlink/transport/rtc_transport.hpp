#pragma once

#include "peerlink/core/config.hpp"
#include "peerlink/transport/transport.hpp"

#include <rtc/rtc.hpp>

#include <memory>
#include <mutex>
#include <string>

namespace peerlink::transport {

/**
 * @brief libdatachannel backend: one rtc::PeerConnection, one rtc::DataChannel
 *
 * libdatachannel raises its callbacks on internal threads; they only forward
 * into the event sink, which the NetworkManager turns into a queue drained on
 * its own thread. Exceptions from the library are converted to
 * TransportFailure at this boundary.
 */
class RtcTransport : public Transport {
public:
    explicit RtcTransport(const PeerConfig& config);
    ~RtcTransport() override;

    RtcTransport(const RtcTransport&) = delete;
    RtcTransport& operator=(const RtcTransport&) = delete;

    void set_event_sink(EventSink sink) override;
    Result<void> create_offer() override;
    Result<void> set_remote_description(const std::string& sdp, SdpType type) override;
    Result<void> add_remote_candidate(const signaling::Candidate& candidate) override;
    Result<void> send(const Bytes& data) override;
    void close() override;

private:
    Result<void> ensure_peer();
    void attach_channel(std::shared_ptr<rtc::DataChannel> channel);
    std::shared_ptr<rtc::DataChannel> current_channel() const;
    void raise(TransportEvent event);

    rtc::Configuration rtc_config_;
    std::string channel_label_;

    std::mutex sink_mutex_;
    EventSink sink_;

    std::shared_ptr<rtc::PeerConnection> peer_;

    // Set from onDataChannel on a library thread on the joiner side.
    mutable std::mutex channel_mutex_;
    std::shared_ptr<rtc::DataChannel> channel_;
    bool closed_ = false;
};

} // namespace peerlink::transport
