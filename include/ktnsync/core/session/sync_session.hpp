/**
 * @file sync_session.hpp
 * @brief One pairing interaction, from the first scan to the merge report.
 *
 * Stages: Idle -> Negotiating -> Connecting -> Open -> Syncing -> Done | Failed
 *
 * A SyncSession owns its negotiator, fragment assembler, chunked channel and
 * reconciliation engine; nothing is shared between sessions. It reports to
 * the presentation layer through SyncEvent and never renders anything itself.
 * close() (or destruction) cancels every timer, closes the channel and the
 * connection and drops all state; no event is emitted afterwards.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include "ktnsync/core/identity/device_identity.hpp"
#include "ktnsync/core/interfaces/istore.hpp"
#include "ktnsync/core/interfaces/itransport.hpp"
#include "ktnsync/core/sync/reconciliation_engine.hpp"
#include "ktnsync/core/util/error_types.hpp"
#include "ktnsync/core/util/sync_options.hpp"

namespace ktnsync {

    enum class SessionStage { Idle, Negotiating, Connecting, Open, Syncing, Done, Failed };

    enum class SessionRole { Initiator, Responder };

    const char* toString(SessionStage s);

    /**
     * @enum SyncEventKind
     * @brief What a SyncEvent reports.
     */
    enum class SyncEventKind {
        Stage,            ///< stage changed
        OfferReady,       ///< transfer holds the offer strings to show
        AnswerReady,      ///< transfer holds the answer strings to show
        FragmentReceived, ///< received/total progress of the scan
        Warning,          ///< recoverable error; the session continues
        Failed,           ///< terminal error
        Completed         ///< sync finished; counts holds the merge report
    };

    const char* toString(SyncEventKind k);

    /**
     * @struct SyncEvent
     * @brief Status/progress report for the presentation layer.
     */
    struct SyncEvent {
        SyncEventKind            kind{ SyncEventKind::Stage };
        SessionStage             stage{ SessionStage::Idle };
        std::string              message;   ///< Short human-readable text
        int                      received{ 0 };
        int                      total{ 0 };
        std::vector<std::string> transfer;  ///< Out-of-band strings (OfferReady/AnswerReady)
        MergeCounts              counts;
        ErrorOpt                 error;
    };

    /**
     * @class SyncSession
     * @brief Drives pairing and one sync exchange on a single io_context.
     */
    class SyncSession {
    public:
        using EventHandler = std::function<void(const SyncEvent&)>;

        /// @throws SyncError(Internal) if @p opts fails validateSyncOptions()
        SyncSession(boost::asio::io_context& io,
                    IDirectTransport& transport,
                    IEntityStore& store,
                    DeviceIdentityManager& identity,
                    SyncOptions opts = {});
        ~SyncSession();

        SyncSession(const SyncSession&) = delete;
        SyncSession& operator=(const SyncSession&) = delete;

        /// Events are delivered synchronously; the handler may call close().
        void setEventHandler(EventHandler h);

        /**
         * @brief Produce the offer; an OfferReady event carries the strings to show.
         * @throws SyncError(Internal) unless the session is Idle
         */
        void startAsInitiator();

        /**
         * @brief Wait for the offer to be scanned.
         * @throws SyncError(Internal) unless the session is Idle
         */
        void startAsResponder();

        /**
         * @brief Feed one scanned or pasted string (a fragment or a whole payload).
         *
         * The responder expects the offer, the initiator the answer. Bad input
         * yields a Warning event and the scan can be repeated.
         */
        void submitScan(const std::string& raw);

        /**
         * @brief Assemble the fragments scanned so far without waiting for the rest.
         *
         * With strict fragments a gap yields a MissingFragment warning and the
         * scanned slices are kept. Otherwise missing slices are left empty.
         */
        void finishScan();

        /**
         * @brief Send sync_request over the open channel.
         *
         * Runs automatically on the initiator when SyncOptions::autoStartSync is set.
         */
        void startSync();

        void close();

        SessionStage stage() const;
        std::optional<SessionRole> role() const;
        bool syncInProgress() const;
        /// Accumulated merge counts of this session.
        MergeCounts counts() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
