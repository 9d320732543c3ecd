#pragma once

/**
 * @file codec.hpp
 * @brief Connection code <-> NegotiationArtifact
 *
 * WIRE FORMAT:
 * base64( {"offer": "<sdp>", "ice_candidates": [{"candidate": "...",
 *          "sdp_mid": "..."}, ...]} )
 *
 * Unknown keys are ignored.
 *
 * The "offer" key is used for both roles; the joiner's answer travels under
 * it too. Only two peerlink instances need to agree on this envelope.
 *
 * decode() is the untrusted-input boundary of the whole library: the string
 * was typed or pasted by a person. It never throws.
 * - Malformed:  not base64, not JSON, or a field of the wrong type
 * - Incomplete: well-formed JSON missing "offer", "ice_candidates" or a
 *               candidate's "candidate" line
 */

#include "peerlink/core/result.hpp"
#include "peerlink/signaling/types.hpp"

#include <string>
#include <string_view>

namespace peerlink::signaling {

class SignalingCodec {
public:
    static std::string encode(const NegotiationArtifact& artifact);

    static Result<NegotiationArtifact> decode(std::string_view code);
};

} // namespace peerlink::signaling
