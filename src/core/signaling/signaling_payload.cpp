#include "ktnsync/core/signaling/signaling_payload.hpp"
#include "ktnsync/core/util/error_types.hpp"

namespace ktnsync {

    const char* toString(SignalKind k) {
        return k == SignalKind::Offer ? "offer" : "answer";
    }

    void to_json(nlohmann::json& j, const IceCandidate& c) {
        j = nlohmann::json{ {"candidate", c.candidate} };
        if (c.sdpMid)        j["sdpMid"] = *c.sdpMid;
        if (c.sdpMLineIndex) j["sdpMLineIndex"] = *c.sdpMLineIndex;
    }

    void from_json(const nlohmann::json& j, IceCandidate& c) {
        if (!j.is_object())
            throw SyncError(SyncErr::InvalidSignaling, "candidate is not an object");
        auto it = j.find("candidate");
        if (it == j.end() || !it->is_string())
            throw SyncError(SyncErr::InvalidSignaling, "candidate without a candidate string");
        c.candidate = it->get<std::string>();

        c.sdpMid.reset();
        if (auto m = j.find("sdpMid"); m != j.end() && !m->is_null()) {
            if (!m->is_string())
                throw SyncError(SyncErr::InvalidSignaling, "sdpMid is not a string");
            c.sdpMid = m->get<std::string>();
        }
        c.sdpMLineIndex.reset();
        if (auto i = j.find("sdpMLineIndex"); i != j.end() && !i->is_null()) {
            if (!i->is_number_integer())
                throw SyncError(SyncErr::InvalidSignaling, "sdpMLineIndex is not an integer");
            c.sdpMLineIndex = i->get<int>();
        }
    }

    void to_json(nlohmann::json& j, const SignalingPayload& p) {
        j = nlohmann::json{
            {"type", toString(p.kind)},
            {"sdp", p.description},
            {"candidates", p.candidates}
        };
    }

    void from_json(const nlohmann::json& j, SignalingPayload& p) {
        if (!j.is_object())
            throw SyncError(SyncErr::InvalidSignaling, "signaling payload is not an object");

        auto type = j.find("type");
        if (type == j.end() || !type->is_string())
            throw SyncError(SyncErr::InvalidSignaling, "signaling payload without a type");
        const auto& t = type->get_ref<const std::string&>();
        if (t == "offer")       p.kind = SignalKind::Offer;
        else if (t == "answer") p.kind = SignalKind::Answer;
        else throw SyncError(SyncErr::InvalidSignaling, "unknown signaling type '" + t + "'");

        auto sdp = j.find("sdp");
        if (sdp == j.end() || !sdp->is_string() || sdp->get_ref<const std::string&>().empty())
            throw SyncError(SyncErr::InvalidSignaling, "signaling payload without a session description");
        p.description = sdp->get<std::string>();

        p.candidates.clear();
        if (auto c = j.find("candidates"); c != j.end() && !c->is_null()) {
            if (!c->is_array())
                throw SyncError(SyncErr::InvalidSignaling, "candidates is not an array");
            for (const auto& item : *c) p.candidates.push_back(item.get<IceCandidate>());
        }
    }

}
