/**
 * @file reconciliation_engine.hpp
 * @brief Snapshot exchange and last-write-wins merge of the replicated collections.
 *
 * Exchange (either side may skip the request and push sync_data first):
 *
 *   A: sync_request  ->
 *                    <-  B: sync_data (B's collections)
 *   A merges, then
 *   A: sync_ack      ->  (A's collections)
 *                        B merges, done
 *
 * Merge rule per entity: insert if absent locally, overwrite if the remote
 * updatedAt is strictly later, otherwise keep the local entity. Folders merge
 * before Notebooks before Notes.
 *
 * The engine is transport-free: handle() takes a decoded message and returns
 * the reply to send.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <optional>
#include <string>
#include "ktnsync/core/interfaces/istore.hpp"
#include "ktnsync/core/protocol/sync_messages.hpp"

namespace ktnsync {

    /**
     * @struct MergeCounts
     * @brief Entities inserted or overwritten per collection.
     */
    struct MergeCounts {
        size_t folders{ 0 };
        size_t notebooks{ 0 };
        size_t notes{ 0 };
        size_t failed{ 0 };   ///< Entities skipped after an error

        size_t total() const { return folders + notebooks + notes; }

        MergeCounts& operator+=(const MergeCounts& o) {
            folders += o.folders; notebooks += o.notebooks; notes += o.notes; failed += o.failed;
            return *this;
        }
    };

    enum class ExchangeState { Idle, AwaitingData, AwaitingAck, Done };

    const char* toString(ExchangeState s);

    class ReconciliationEngine {
    public:
        /**
         * @struct Outcome
         * @brief Result of handling one incoming message.
         */
        struct Outcome {
            std::optional<AppMessage> reply;  ///< Message to send back
            bool        finished{ false };    ///< The exchange is complete on this side
            bool        rejected{ false };    ///< Ignored: another exchange is outstanding
            bool        merged{ false };      ///< counts is meaningful
            MergeCounts counts;
        };

        ReconciliationEngine(IEntityStore& store, std::string deviceId);

        /**
         * @brief Read the three local collections.
         * @throws SyncError(Internal) if the store cannot be read
         */
        SyncSnapshot gatherSnapshot();

        /**
         * @brief Merge a remote snapshot into the local store.
         *
         * Never throws for a single entity; failures are logged and counted.
         */
        MergeCounts merge(const SyncSnapshot& remote);

        /// Start an exchange with sync_request.
        AppMessage beginSync();

        /// Start an exchange by pushing sync_data directly.
        AppMessage beginPush();

        /**
         * @brief Process one message from the peer.
         * @throws SyncError(Internal) if the local collections cannot be read for the reply
         */
        Outcome handle(const AppMessage& in);

        /// Drop any outstanding exchange (channel closed or session cancelled).
        void abort();

        bool syncInProgress() const { return inProgress_; }
        ExchangeState state() const { return state_; }
        const std::string& deviceId() const { return deviceId_; }

    private:
        IEntityStore& store_;
        std::string   deviceId_;
        ExchangeState state_{ ExchangeState::Idle };
        bool          inProgress_{ false };
    };

}
