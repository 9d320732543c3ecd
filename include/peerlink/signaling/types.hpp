#pragma once

#include <string>
#include <vector>

namespace peerlink::signaling {

/**
 * @brief One locally discovered ICE candidate
 *
 * The candidate line is opaque to peerlink; only the transport interprets it.
 * Candidates are matched to their media section by mid alone.
 */
struct Candidate {
    std::string candidate;
    std::string sdp_mid;

    bool operator==(const Candidate& other) const {
        return candidate == other.candidate && sdp_mid == other.sdp_mid;
    }
    bool operator!=(const Candidate& other) const { return !(*this == other); }
};

/**
 * @brief The unit two humans exchange: one side's description plus candidates
 *
 * For the host the description is its offer, for the joiner its answer.
 */
struct NegotiationArtifact {
    std::string local_description;
    std::vector<Candidate> candidates;

    bool operator==(const NegotiationArtifact& other) const {
        return local_description == other.local_description && candidates == other.candidates;
    }
    bool operator!=(const NegotiationArtifact& other) const { return !(*this == other); }
};

} // namespace peerlink::signaling
