#pragma once

#include <optional>
#include <string>

namespace peerlink {

enum class ErrorCode {
    Malformed,        ///< Pasted artifact is not valid base64/JSON
    Incomplete,       ///< Artifact parsed but required fields are missing
    InvalidState,
    AlreadyStarted,
    InvalidOffer,
    InvalidAnswer,
    InvalidArgument,
    InvalidChunk,
    TransportFailure,
    ConfigError
};

const char* to_string(ErrorCode code) noexcept;

/**
 * @brief Error value carried by every failed peerlink::Result
 *
 * InvalidOffer and InvalidAnswer keep the decode failure that caused them in
 * `cause`, so a bad paste can be told apart from a call in the wrong phase.
 */
struct Error {
    ErrorCode code = ErrorCode::InvalidState;
    std::string message;
    std::optional<ErrorCode> cause;

    [[nodiscard]] bool is_decode_error() const noexcept {
        const ErrorCode effective = cause.value_or(code);
        return effective == ErrorCode::Malformed || effective == ErrorCode::Incomplete;
    }

    [[nodiscard]] std::string describe() const;
};

inline Error make_error(ErrorCode code, std::string message) {
    return Error{code, std::move(message), std::nullopt};
}

inline Error wrap_error(ErrorCode code, const Error& inner) {
    return Error{code, inner.message, inner.code};
}

} // namespace peerlink
