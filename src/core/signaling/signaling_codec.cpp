#include "ktnsync/core/signaling/signaling_codec.hpp"
#include "ktnsync/core/signaling/fragment.hpp"
#include "ktnsync/core/util/error_types.hpp"
#include "ktnsync/core/util/logger.hpp"

namespace ktnsync {

    namespace {
        using nlohmann::json;

        struct KeyPair { const char* longKey; const char* shortKey; };

        constexpr KeyPair kRootKeys[] = {
            {"type", "t"}, {"sdp", "s"}, {"candidates", "c"}
        };
        constexpr KeyPair kCandidateKeys[] = {
            {"candidate", "c"}, {"sdpMid", "m"}, {"sdpMLineIndex", "i"}
        };

        template <size_t N>
        const char* rename(const std::string& key, const KeyPair (&table)[N], bool toShort) {
            for (const auto& kp : table) {
                if (key == (toShort ? kp.longKey : kp.shortKey))
                    return toShort ? kp.shortKey : kp.longKey;
            }
            return nullptr;
        }

        json transform(const json& node, bool isRoot, bool toShort) {
            if (node.is_array()) {
                json out = json::array();
                for (const auto& item : node) out.push_back(transform(item, false, toShort));
                return out;
            }
            if (!node.is_object()) return node;

            json out = json::object();
            for (auto it = node.begin(); it != node.end(); ++it) {
                const char* renamed = isRoot ? rename(it.key(), kRootKeys, toShort)
                                             : rename(it.key(), kCandidateKeys, toShort);
                if (!renamed) {
                    out[it.key()] = it.value();
                    continue;
                }
                // The candidate list is the only nested level with known keys.
                bool isCandidateList = isRoot && std::string_view(renamed) == (toShort ? "c" : "candidates");
                out[renamed] = isCandidateList ? transform(it.value(), false, toShort) : it.value();
            }
            return out;
        }
    }

    json compact(const json& payload) {
        return transform(payload, true, true);
    }

    json expand(const json& compactPayload) {
        return transform(compactPayload, true, false);
    }

    std::string compressText(std::string_view text) {
        auto j = json::parse(text, nullptr, false);
        if (j.is_discarded()) return std::string(text);
        return compact(j).dump();
    }

    std::string decompressText(std::string_view text) {
        auto j = json::parse(text, nullptr, false);
        if (j.is_discarded()) return std::string(text);
        return expand(j).dump();
    }

    std::vector<std::string> encodeForTransfer(const SignalingPayload& payload, const SyncOptions& opts) {
        if (opts.fragmentSize == 0)
            throw SyncError(SyncErr::Internal, "fragmentSize must be positive");
        std::string text = compact(json(payload)).dump();
        if (text.size() <= opts.singleCodeCapacity) {
            LOG_DEBUG("Signaling " + std::string(toString(payload.kind)) + " fits one code (" +
                      std::to_string(text.size()) + " chars)");
            return { text };
        }

        auto slices = splitFragments(text, opts.fragmentSize);
        std::vector<std::string> out;
        out.reserve(slices.size());
        const int total = static_cast<int>(slices.size());
        for (int i = 0; i < total; ++i)
            out.push_back(wrapFragment(i + 1, total, slices[static_cast<size_t>(i)]));
        LOG_DEBUG("Signaling " + std::string(toString(payload.kind)) + " split into " +
                  std::to_string(total) + " fragments");
        return out;
    }

    SignalingPayload decodeTransfer(std::string_view text) {
        auto j = json::parse(text, nullptr, false);
        if (j.is_discarded())
            throw SyncError(SyncErr::InvalidSignaling, "pairing text is not JSON");
        return expand(j).get<SignalingPayload>();
    }

}
