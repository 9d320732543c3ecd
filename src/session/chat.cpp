#include "peerlink/session/chat.hpp"

#include "peerlink/events/events.hpp"
#include "peerlink/session/frame.hpp"

#include <spdlog/spdlog.h>

namespace peerlink::session {

ChatSession::ChatSession(transport::NetworkManager& manager, events::EventBus& bus)
    : manager_(manager), bus_(bus) {}

bool ChatSession::is_chat_enabled() const {
    return manager_.current_state().is_channel_open();
}

Result<Message> ChatSession::send(const std::string& text) {
    if (text.empty()) {
        return Err<Message>(ErrorCode::InvalidArgument, "Cannot send an empty message");
    }
    if (!is_chat_enabled()) {
        return Err<Message>(ErrorCode::InvalidState, "Chat is disabled until the channel is open");
    }

    Message echoed = append(MessageSender::Local, text);

    auto sent = manager_.send(FrameCodec::encode_text(text));
    if (sent.is_error()) {
        spdlog::warn("[Chat] Message {} echoed but not sent: {}", echoed.id, sent.error().describe());
        return Err<Message>(sent.error());
    }
    return Ok(std::move(echoed));
}

Message ChatSession::on_receive(std::string text) {
    return append(MessageSender::Remote, std::move(text));
}

Message ChatSession::append(MessageSender sender, std::string content) {
    Message message;
    message.id = next_id_++;
    message.sender = sender;
    message.content = std::move(content);
    message.timestamp = std::chrono::system_clock::now();
    messages_.push_back(message);

    bus_.emit(events::MessageAppendedEvent{message});
    return message;
}

} // namespace peerlink::session
