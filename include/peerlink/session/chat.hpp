#pragma once

#include "peerlink/core/result.hpp"
#include "peerlink/events/event_bus.hpp"
#include "peerlink/session/types.hpp"
#include "peerlink/transport/network_manager.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace peerlink::session {

/**
 * @brief Ordered chat log over one NetworkManager's data channel
 *
 * Local lines are echoed into the log as soon as send() is called; nothing
 * from the peer confirms delivery. Remote lines are appended in the order the
 * channel delivers them.
 */
class ChatSession {
public:
    ChatSession(transport::NetworkManager& manager, events::EventBus& bus);

    ChatSession(const ChatSession&) = delete;
    ChatSession& operator=(const ChatSession&) = delete;

    [[nodiscard]] bool is_chat_enabled() const;

    /**
     * @brief Append a Local message and forward it to the peer
     *
     * InvalidArgument for empty text, InvalidState while the channel is not
     * open; neither touches the log. A failure reported by the transport after
     * the echo leaves the echoed message in place.
     */
    Result<Message> send(const std::string& text);

    /// Appends a Remote message.
    Message on_receive(std::string text);

    [[nodiscard]] const std::vector<Message>& messages() const noexcept { return messages_; }

private:
    Message append(MessageSender sender, std::string content);

    transport::NetworkManager& manager_;
    events::EventBus& bus_;
    std::vector<Message> messages_;
    std::uint64_t next_id_ = 1;
};

} // namespace peerlink::session
