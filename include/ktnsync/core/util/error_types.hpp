/**
 * @file error_types.hpp
 * @brief Error type definitions for ktnsync.
 *
 * Provides the error taxonomy of the pairing-and-sync engine, the error object
 * delivered to completion handlers and the exception thrown by synchronous
 * validation.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <optional>
#include <stdexcept>
#include <string>

namespace ktnsync {

    /**
     * @enum SyncErr
     * @brief Error codes for pairing and sync operations.
     *
     * - InvalidSignaling: malformed or wrong-kind signaling payload (re-entry prompted)
     * - MissingFragment: signaling reassembly completed with a gap
     * - ConnectionFailed: the direct transport reported failure
     * - ConnectionTimeout: the logical channel never opened in time
     * - ChannelClosed: the channel closed mid-send or mid-sync
     * - MergeEntity: a single entity failed to merge (logged and skipped)
     * - IdentityStore: the device identity could not be loaded or persisted
     * - InvalidMessage: an application frame carried no known tag
     * - Internal: anything else
     */
    enum class SyncErr : int {
        InvalidSignaling = 1, ///< Malformed or wrong-kind signaling payload
        MissingFragment,      ///< Reassembled signaling text has a gap
        ConnectionFailed,     ///< Underlying transport failed
        ConnectionTimeout,    ///< Channel did not open within the bound
        ChannelClosed,        ///< Channel closed during send or sync
        MergeEntity,          ///< One entity failed to merge
        IdentityStore,        ///< Device identity persistence failure
        InvalidMessage,       ///< Unknown or malformed application message
        Internal = 99         ///< Internal error
    };

    /**
     * @brief Short human-readable text for an error kind.
     *
     * This is what a presentation layer shows; diagnostics go to the log.
     */
    inline const char* userMessage(SyncErr code) {
        switch (code) {
        case SyncErr::InvalidSignaling:  return "Invalid pairing code. Please scan or paste it again.";
        case SyncErr::MissingFragment:   return "Some parts of the pairing code are missing. Please scan them again.";
        case SyncErr::ConnectionFailed:  return "Connection failed. Please try again.";
        case SyncErr::ConnectionTimeout: return "Connection timed out. Please try again.";
        case SyncErr::ChannelClosed:     return "Connection lost during sync.";
        case SyncErr::MergeEntity:       return "Some items could not be synced.";
        case SyncErr::IdentityStore:     return "Sync is unavailable on this device.";
        case SyncErr::InvalidMessage:    return "The other device sent an unexpected message.";
        case SyncErr::Internal:          break;
        }
        return "Sync failed.";
    }

    /**
     * @brief Stable lowercase name of an error kind, for logs.
     */
    inline const char* errName(SyncErr code) {
        switch (code) {
        case SyncErr::InvalidSignaling:  return "invalid_signaling";
        case SyncErr::MissingFragment:   return "missing_fragment";
        case SyncErr::ConnectionFailed:  return "connection_failed";
        case SyncErr::ConnectionTimeout: return "connection_timeout";
        case SyncErr::ChannelClosed:     return "channel_closed";
        case SyncErr::MergeEntity:       return "merge_entity";
        case SyncErr::IdentityStore:     return "identity_store";
        case SyncErr::InvalidMessage:    return "invalid_message";
        case SyncErr::Internal:          break;
        }
        return "internal";
    }

    /**
     * @struct ErrorObj
     * @brief Error delivered to completion handlers and status events.
     */
    struct ErrorObj {
        SyncErr     code;   ///< Error code
        std::string msg;    ///< Short user-facing message
        std::string detail; ///< Diagnostic detail (logged, not shown)
    };

    /**
     * @brief Build an ErrorObj whose message is the standard text for @p code.
     */
    inline ErrorObj makeError(SyncErr code, std::string detail = {}) {
        return ErrorObj{ code, userMessage(code), std::move(detail) };
    }

    /**
     * @class SyncError
     * @brief Exception thrown by synchronous validation and transport calls.
     */
    class SyncError : public std::runtime_error {
    public:
        SyncError(SyncErr code, const std::string& what)
            : std::runtime_error(what), code_(code) {}

        SyncErr code() const noexcept { return code_; }

        ErrorObj toError() const { return makeError(code_, what()); }

    private:
        SyncErr code_;
    };

    /**
     * @typedef ErrorOpt
     * @brief Completion status: empty on success.
     */
    using ErrorOpt = std::optional<ErrorObj>;

}
