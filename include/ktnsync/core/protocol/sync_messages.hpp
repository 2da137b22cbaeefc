/**
 * @file sync_messages.hpp
 * @brief Tagged application messages and the chunk envelope, with their JSON codec.
 *
 * Application messages:
 *   {"type":"sync_request","deviceId":"...","timestamp":"..."}
 *   {"type":"sync_data"|"sync_ack","folders":[...],"notebooks":[...],"notes":[...],"timestamp":"..."}
 *
 * Frame-level envelope used by ChunkedChannel:
 *   {"type":"__chunk__","chunkId":"...","index":0,"total":3,"data":"..."}
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "ktnsync/core/model/entities.hpp"

namespace ktnsync {

    /**
     * @struct SyncSnapshot
     * @brief Full contents of the three replicated collections.
     */
    struct SyncSnapshot {
        std::vector<Folder>   folders;
        std::vector<Notebook> notebooks;
        std::vector<Note>     notes;
        size_t                malformed{ 0 }; ///< Records dropped while decoding

        size_t size() const { return folders.size() + notebooks.size() + notes.size(); }
    };

    struct SyncRequest {
        std::string deviceId;
        std::string timestamp;
    };

    struct SyncData {
        SyncSnapshot snapshot;
        std::string  timestamp;
    };

    /// Reply to sync_data. An ack without collections only closes the exchange.
    struct SyncAck {
        std::optional<SyncSnapshot> snapshot;
        std::string                 timestamp;
    };

    using AppMessage = std::variant<SyncRequest, SyncData, SyncAck>;

    /// Wire tag of a message ("sync_request", "sync_data", "sync_ack").
    const char* messageType(const AppMessage& m);

    std::string encodeMessage(const AppMessage& m);

    /**
     * @brief Decode one application message.
     *
     * Malformed entity records are dropped and counted in SyncSnapshot::malformed.
     * @throws SyncError(InvalidMessage) if the text is not JSON or the tag is unknown
     */
    AppMessage decodeMessage(std::string_view text);

    constexpr std::string_view kChunkType = "__chunk__";

    /**
     * @struct ChunkEnvelope
     * @brief One slice of a message too large for a single frame.
     */
    struct ChunkEnvelope {
        std::string chunkId; ///< Stream id shared by every slice of one message
        int         index{ 0 }; ///< 0-based
        int         total{ 0 };
        std::string data;
    };

    std::string encodeChunk(const ChunkEnvelope& c);

    /**
     * @brief Recognise a chunk envelope.
     * @return The envelope, or std::nullopt if @p frame is not a well-formed chunk
     */
    std::optional<ChunkEnvelope> decodeChunk(std::string_view frame);

}
