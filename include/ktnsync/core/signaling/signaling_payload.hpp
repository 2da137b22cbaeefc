/**
 * @file signaling_payload.hpp
 * @brief Offer/answer payload exchanged out of band during pairing.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ktnsync {

    /**
     * @enum SignalKind
     * @brief Role of a session description in the offer/answer exchange.
     */
    enum class SignalKind { Offer, Answer };

    const char* toString(SignalKind k);

    /**
     * @struct IceCandidate
     * @brief One network-reachability descriptor.
     */
    struct IceCandidate {
        std::string                candidate;     ///< "candidate:..." line
        std::optional<std::string> sdpMid;        ///< Media stream id
        std::optional<int>         sdpMLineIndex; ///< Media line index

        bool operator==(const IceCandidate&) const = default;
    };

    /**
     * @struct SignalingPayload
     * @brief Session description plus the candidates gathered for it.
     */
    struct SignalingPayload {
        SignalKind                kind{ SignalKind::Offer };
        std::string               description;
        std::vector<IceCandidate> candidates;

        bool operator==(const SignalingPayload&) const = default;
    };

    /*
     * Wire form: {"type":"offer"|"answer","sdp":"...","candidates":[{"candidate":"...","sdpMid":"0","sdpMLineIndex":0}]}
     * from_json throws SyncError(InvalidSignaling) for anything else.
     */
    void to_json(nlohmann::json& j, const IceCandidate& c);
    void from_json(const nlohmann::json& j, IceCandidate& c);
    void to_json(nlohmann::json& j, const SignalingPayload& p);
    void from_json(const nlohmann::json& j, SignalingPayload& p);

}
