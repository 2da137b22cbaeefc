#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "ktnsync/core/signaling/signaling_payload.hpp"

namespace ktnsync::sdp {

    /// Random numeric session id for the "o=" line.
    std::string newSessionId();

    /**
     * @brief Minimal data-channel description.
     *
     * The offer advertises setup:actpass, the answer setup:active. Extra
     * attribute lines ("a=...") are appended verbatim.
     */
    std::string buildDescription(const std::string& sessionId, SignalKind kind,
                                 const std::string& transportProto,
                                 const std::string& extraAttrs = {});

    /// Session id of the "o=" line, or nullopt when the text is not a description.
    std::optional<std::string> sessionId(const std::string& description);

    /// Value of the first "a=<name>:<value>" line.
    std::optional<std::string> attribute(const std::string& description, const std::string& name);

    struct Candidate {
        std::string foundation;
        int         component{ 1 };
        std::string transport;     ///< "udp" or "tcp"
        uint32_t    priority{ 0 };
        std::string address;
        uint16_t    port{ 0 };
        std::string type;          ///< "host", "srflx", ...
        std::string tcpType;       ///< "active", "passive", "so" or empty
    };

    std::string formatCandidate(const Candidate& c);

    /// Parse a "candidate:..." line; nullopt on any syntax error.
    std::optional<Candidate> parseCandidate(const std::string& line);

    /// Host candidate priority for the given local preference.
    uint32_t hostPriority(uint32_t localPreference, int component = 1);

}
