#include "peerlink/signaling/codec.hpp"

#include "peerlink/core/base64.hpp"

#include <nlohmann/json.hpp>

namespace peerlink::signaling {
namespace {

using json = nlohmann::json;

constexpr const char* kDescriptionKey = "offer";
constexpr const char* kCandidatesKey = "ice_candidates";

Result<NegotiationArtifact> malformed(const std::string& message) {
    return Err<NegotiationArtifact>(ErrorCode::Malformed, message);
}

Result<NegotiationArtifact> incomplete(const std::string& message) {
    return Err<NegotiationArtifact>(ErrorCode::Incomplete, message);
}

json candidate_to_json(const Candidate& candidate) {
    json j;
    j["candidate"] = candidate.candidate;
    j["sdp_mid"] = candidate.sdp_mid;
    return j;
}

} // namespace

std::string SignalingCodec::encode(const NegotiationArtifact& artifact) {
    json candidates = json::array();
    for (const auto& candidate : artifact.candidates) {
        candidates.push_back(candidate_to_json(candidate));
    }

    json document;
    document[kDescriptionKey] = artifact.local_description;
    document[kCandidatesKey] = std::move(candidates);

    // SDP and candidate lines are ASCII; replace rather than throw on stray bytes.
    return base64_encode(document.dump(-1, ' ', false, json::error_handler_t::replace));
}

Result<NegotiationArtifact> SignalingCodec::decode(std::string_view code) {
    auto raw = base64_decode(code);
    if (!raw.has_value()) {
        return malformed("Connection code is not valid base64");
    }
    if (raw->empty()) {
        return incomplete("Connection code is empty");
    }

    const auto document = json::parse(raw->begin(), raw->end(), nullptr, false);
    if (document.is_discarded()) {
        return malformed("Connection code does not contain valid JSON");
    }
    if (!document.is_object()) {
        return malformed("Connection code must hold a JSON object");
    }

    const auto description = document.find(kDescriptionKey);
    if (description == document.end() || description->is_null()) {
        return incomplete("Connection code has no session description");
    }
    if (!description->is_string()) {
        return malformed("Session description must be a string");
    }

    const auto candidates = document.find(kCandidatesKey);
    if (candidates == document.end() || candidates->is_null()) {
        return incomplete("Connection code has no candidate list");
    }
    if (!candidates->is_array()) {
        return malformed("Candidate list must be an array");
    }

    NegotiationArtifact artifact;
    artifact.local_description = description->get<std::string>();
    if (artifact.local_description.empty()) {
        return incomplete("Session description is empty");
    }

    artifact.candidates.reserve(candidates->size());
    for (const auto& entry : *candidates) {
        if (!entry.is_object()) {
            return malformed("Candidate entries must be objects");
        }

        const auto line = entry.find("candidate");
        if (line == entry.end() || line->is_null()) {
            return incomplete("Candidate entry has no candidate line");
        }
        if (!line->is_string()) {
            return malformed("Candidate line must be a string");
        }

        Candidate candidate;
        candidate.candidate = line->get<std::string>();

        if (const auto mid = entry.find("sdp_mid"); mid != entry.end() && !mid->is_null()) {
            if (!mid->is_string()) {
                return malformed("sdp_mid must be a string");
            }
            candidate.sdp_mid = mid->get<std::string>();
        }

        artifact.candidates.push_back(std::move(candidate));
    }

    return Ok(artifact);
}

} // namespace peerlink::signaling
