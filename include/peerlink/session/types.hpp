#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace peerlink::session {

/**
 * @brief User-facing progress through connection setup
 *
 * Host:   Welcome -> ChooseRole -> GeneratingCode -> SharingCode -> WaitingForAnswer -> Connected
 * Joiner: Welcome -> ChooseRole -> WaitingForConnection -> SharingCode -> Connected
 */
enum class WizardStep {
    Welcome,
    ChooseRole,
    GeneratingCode,
    WaitingForConnection,
    SharingCode,
    WaitingForAnswer,
    Connected
};

const char* to_string(WizardStep step) noexcept;

enum class MessageSender {
    Local,
    Remote
};

/**
 * @brief One chat line, immutable once appended to the session log
 */
struct Message {
    std::uint64_t id = 0;
    MessageSender sender = MessageSender::Local;
    std::string content;
    std::chrono::system_clock::time_point timestamp{};
};

} // namespace peerlink::session
