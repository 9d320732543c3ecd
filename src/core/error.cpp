#include "peerlink/core/error.hpp"

namespace peerlink {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Malformed: return "Malformed";
        case ErrorCode::Incomplete: return "Incomplete";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::AlreadyStarted: return "AlreadyStarted";
        case ErrorCode::InvalidOffer: return "InvalidOffer";
        case ErrorCode::InvalidAnswer: return "InvalidAnswer";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidChunk: return "InvalidChunk";
        case ErrorCode::TransportFailure: return "TransportFailure";
        case ErrorCode::ConfigError: return "ConfigError";
    }
    return "Unknown";
}

std::string Error::describe() const {
    std::string text = to_string(code);
    if (cause.has_value()) {
        text += " (";
        text += to_string(*cause);
        text += ")";
    }
    if (!message.empty()) {
        text += ": ";
        text += message;
    }
    return text;
}

} // namespace peerlink
