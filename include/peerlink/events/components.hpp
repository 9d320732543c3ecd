/**
 * @file components.hpp
 * @brief Ready-made observers for a peer session
 *
 * WHY THIS FILE EXISTS:
 * Every front end wants the same two things from the event stream: a readable
 * log of what the connection is doing, and a few counters to show at the end.
 * Both are plain subscribers and can be attached to any session's bus.
 *
 * EXAMPLE:
 * auto& bus = session->bus();
 * LoggerComponent logger(bus);
 * SessionStatsComponent stats(bus);
 * // ... run the session ...
 * stats.log_summary();
 */

#pragma once

#include "peerlink/events/event_bus.hpp"
#include "peerlink/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace peerlink::events {

/**
 * @brief Logs every peer event using spdlog
 *
 * Candidate discovery and per-chunk progress are logged at debug level; the
 * rest at info, failures at warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        track<LocalDescriptionCreatedEvent>([](const LocalDescriptionCreatedEvent& e) {
            spdlog::info("[LocalDescription] role={} type={}",
                         transport::to_string(e.role), transport::to_string(e.type));
        });

        track<CandidateDiscoveredEvent>([](const CandidateDiscoveredEvent& e) {
            spdlog::debug("[Candidate] mid={} total={} line={}",
                          e.candidate.sdp_mid, e.total_candidates, e.candidate.candidate);
        });

        track<GatheringStatusChangedEvent>([](const GatheringStatusChangedEvent& e) {
            spdlog::info("[Gathering] status={}", transport::to_string(e.status));
        });

        track<ConnectivityStatusChangedEvent>([](const ConnectivityStatusChangedEvent& e) {
            if (e.status == transport::ConnectivityStatus::Failed ||
                e.status == transport::ConnectivityStatus::Disconnected) {
                spdlog::warn("[Connectivity] status={}", transport::to_string(e.status));
            } else {
                spdlog::info("[Connectivity] status={}", transport::to_string(e.status));
            }
        });

        track<ChannelStatusChangedEvent>([](const ChannelStatusChangedEvent& e) {
            spdlog::info("[Channel] status={}", transport::to_string(e.status));
        });

        track<WizardStepChangedEvent>([](const WizardStepChangedEvent& e) {
            spdlog::info("[Wizard] {} -> {}", session::to_string(e.previous), session::to_string(e.current));
        });

        track<MessageAppendedEvent>([](const MessageAppendedEvent& e) {
            spdlog::info("[Message] id={} from={} length={}",
                         e.message.id,
                         e.message.sender == session::MessageSender::Local ? "local" : "remote",
                         e.message.content.size());
        });

        track<FileTransferProgressEvent>([](const FileTransferProgressEvent& e) {
            spdlog::debug("[Transfer] id={} file={} chunk={}/{} direction={}",
                          e.transfer_id, e.file_name, e.chunks_done, e.total_chunks,
                          e.outgoing ? "out" : "in");
        });

        track<FileReceivedEvent>([](const FileReceivedEvent& e) {
            spdlog::info("[FileReceived] id={} file={} mime={} size={}",
                         e.transfer_id, e.file.name, e.file.mime_type, e.file.format_size());
        });

        track<SessionResetEvent>([](const SessionResetEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Session reset: {} messages discarded, {} transfers abandoned",
                         e.discarded_messages, e.abandoned_transfers);
            spdlog::info("════════════════════════════════════════════");
        });
    }

    ~LoggerComponent() {
        for (auto& unsubscribe : unsubscribers_) {
            unsubscribe();
        }
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    template<typename EventType>
    void track(std::function<void(const EventType&)> handler) {
        const auto id = bus_.subscribe<EventType>(std::move(handler));
        unsubscribers_.push_back([this, id] { bus_.unsubscribe<EventType>(id); });
    }

    EventBus& bus_;
    std::vector<std::function<void()>> unsubscribers_;
};

/**
 * @brief Counts what went over the channel
 *
 * USAGE:
 * SessionStatsComponent stats(bus);
 * // Later...
 * stats.get_stats().messages_received.load();
 */
class SessionStatsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> messages_sent{0};
        std::atomic<uint64_t> messages_received{0};
        std::atomic<uint64_t> bytes_received{0};
        std::atomic<uint64_t> candidates_discovered{0};
        std::atomic<uint64_t> chunks_sent{0};
        std::atomic<uint64_t> files_received{0};
        std::atomic<uint64_t> file_bytes_received{0};
        std::atomic<uint64_t> resets{0};
    };

    explicit SessionStatsComponent(EventBus& bus) : bus_(bus) {
        subscriptions_.message = bus_.subscribe<MessageAppendedEvent>([this](const MessageAppendedEvent& e) {
            if (e.message.sender == session::MessageSender::Local) {
                stats_.messages_sent++;
            } else {
                stats_.messages_received++;
            }
        });

        subscriptions_.channel = bus_.subscribe<ChannelMessageReceivedEvent>([this](const ChannelMessageReceivedEvent& e) {
            stats_.bytes_received += e.data.size();
        });

        subscriptions_.candidate = bus_.subscribe<CandidateDiscoveredEvent>([this](const CandidateDiscoveredEvent&) {
            stats_.candidates_discovered++;
        });

        subscriptions_.progress = bus_.subscribe<FileTransferProgressEvent>([this](const FileTransferProgressEvent& e) {
            if (e.outgoing) {
                stats_.chunks_sent++;
            }
        });

        subscriptions_.file = bus_.subscribe<FileReceivedEvent>([this](const FileReceivedEvent& e) {
            stats_.files_received++;
            stats_.file_bytes_received += e.file.size();
        });

        subscriptions_.reset = bus_.subscribe<SessionResetEvent>([this](const SessionResetEvent&) {
            stats_.resets++;
        });
    }

    ~SessionStatsComponent() {
        bus_.unsubscribe<MessageAppendedEvent>(subscriptions_.message);
        bus_.unsubscribe<ChannelMessageReceivedEvent>(subscriptions_.channel);
        bus_.unsubscribe<CandidateDiscoveredEvent>(subscriptions_.candidate);
        bus_.unsubscribe<FileTransferProgressEvent>(subscriptions_.progress);
        bus_.unsubscribe<FileReceivedEvent>(subscriptions_.file);
        bus_.unsubscribe<SessionResetEvent>(subscriptions_.reset);
    }

    SessionStatsComponent(const SessionStatsComponent&) = delete;
    SessionStatsComponent& operator=(const SessionStatsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void log_summary() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Session Statistics:");
        spdlog::info("  Messages sent:     {}", stats_.messages_sent.load());
        spdlog::info("  Messages received: {}", stats_.messages_received.load());
        spdlog::info("  Channel bytes in:  {}", stats_.bytes_received.load());
        spdlog::info("  Candidates found:  {}", stats_.candidates_discovered.load());
        spdlog::info("  Chunks sent:       {}", stats_.chunks_sent.load());
        spdlog::info("  Files received:    {}", stats_.files_received.load());
        spdlog::info("  File bytes in:     {}", stats_.file_bytes_received.load());
        spdlog::info("  Resets:            {}", stats_.resets.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    struct Subscriptions {
        size_t message = 0;
        size_t channel = 0;
        size_t candidate = 0;
        size_t progress = 0;
        size_t file = 0;
        size_t reset = 0;
    };

    EventBus& bus_;
    Subscriptions subscriptions_;
    Stats stats_;
};

} // namespace peerlink::events
