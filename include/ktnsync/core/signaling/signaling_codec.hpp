/**
 * @file signaling_codec.hpp
 * @brief Compact key form of the signaling payload and the out-of-band text codec.
 *
 * QR capacity is limited, so the well-known long keys are shortened before the
 * payload is rendered:
 *
 *   top level      type -> t, sdp -> s, candidates -> c
 *   per candidate  candidate -> c, sdpMid -> m, sdpMLineIndex -> i
 *
 * Unknown keys pass through untouched in both directions.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "ktnsync/core/signaling/signaling_payload.hpp"
#include "ktnsync/core/util/sync_options.hpp"

namespace ktnsync {

    /// Shorten the known keys. Arrays are processed element-wise.
    nlohmann::json compact(const nlohmann::json& payload);

    /// Inverse of compact().
    nlohmann::json expand(const nlohmann::json& compactPayload);

    /**
     * @brief compact() applied to JSON text; non-JSON text is returned unchanged.
     */
    std::string compressText(std::string_view text);

    /**
     * @brief expand() applied to JSON text; non-JSON text is returned unchanged.
     */
    std::string decompressText(std::string_view text);

    /**
     * @brief Render a payload as the strings shown to the user.
     *
     * One string (the compacted JSON) when it fits opts.singleCodeCapacity,
     * otherwise "KTN1:i/n:..." fragments of opts.fragmentSize characters.
     *
     * @throws SyncError(Internal) if opts.fragmentSize is zero
     */
    std::vector<std::string> encodeForTransfer(const SignalingPayload& payload, const SyncOptions& opts);

    /**
     * @brief Decode a complete (already reassembled) out-of-band text.
     *
     * Accepts the compacted form and the full-key form alike.
     * @throws SyncError(InvalidSignaling) if the text is not a valid payload
     */
    SignalingPayload decodeTransfer(std::string_view text);

}
