/**
 * @file sync_options.hpp
 * @brief Tunables for pairing, chunked delivery and sync.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ktnsync {

    /**
     * @struct SyncOptions
     * @brief Configuration options for one pairing-and-sync session.
     *
     * Defaults match the visual channel (QR fragments) and the data channel
     * limits of common direct transports.
     */
    struct SyncOptions {
        size_t   fragmentSize{ 1500 };           ///< Characters per out-of-band fragment
        size_t   singleCodeCapacity{ 2953 };     ///< Largest payload sent without fragmentation
        size_t   maxChunkBytes{ 16 * 1024 };     ///< Largest single frame on the channel
        size_t   highWaterBytes{ 64 * 1024 };    ///< Buffered bytes above which sends pause
        size_t   maxPendingStreams{ 8 };         ///< Incomplete inbound chunk streams kept
        uint32_t backpressurePollMs{ 50 };       ///< Poll interval while paused
        uint32_t gatherTimeoutMs{ 5000 };        ///< Candidate gathering bound
        uint32_t openTimeoutMs{ 30000 };         ///< Channel-open bound
        std::string channelLabel{ "sync" };      ///< Logical channel label
        std::vector<std::string> iceServers{ "stun:stun.l.google.com:19302" };
        bool autoStartSync{ true };              ///< Initiator sends sync_request on open
        bool strictFragments{ true };            ///< Flushing with missing fragment slices fails
    };

    void to_json(nlohmann::json& j, const SyncOptions& o);
    void from_json(const nlohmann::json& j, SyncOptions& o);

    /**
     * @brief Reject sizes that would stall splitting or reassembly.
     * @throws SyncError(Internal) if fragmentSize, maxChunkBytes or maxPendingStreams is zero
     */
    void validateSyncOptions(const SyncOptions& o);

    /**
     * @brief Load options from a JSON file; absent keys keep their defaults.
     * @throws SyncError(Internal) if the file cannot be read or parsed, or fails validation
     */
    SyncOptions loadSyncOptions(const std::string& path);

}
