#include "ktnsync/core/sync/reconciliation_engine.hpp"
#include "ktnsync/core/util/error_types.hpp"
#include "ktnsync/core/util/logger.hpp"
#include "ktnsync/core/util/time.hpp"

namespace ktnsync {

    namespace {
        template <typename T, typename Get, typename Put>
        size_t mergeCollection(const std::vector<T>& remote, const char* kind,
                               Get get, Put put, size_t& failed) {
            size_t changed = 0;
            for (const auto& entity : remote) {
                try {
                    std::optional<T> local = get(entity.id);
                    if (!local) {
                        put(entity);
                        ++changed;
                    } else if (isStrictlyLater(entity.updatedAt, local->updatedAt)) {
                        put(entity);
                        ++changed;
                    }
                }
                catch (const std::exception& e) {
                    ++failed;
                    LOG_WARN(std::string("Failed to merge ") + kind + " " + entity.id + ": " + e.what());
                }
            }
            return changed;
        }
    }

    const char* toString(ExchangeState s) {
        switch (s) {
        case ExchangeState::Idle:         return "idle";
        case ExchangeState::AwaitingData: return "awaiting-data";
        case ExchangeState::AwaitingAck:  return "awaiting-ack";
        case ExchangeState::Done:         return "done";
        }
        return "unknown";
    }

    ReconciliationEngine::ReconciliationEngine(IEntityStore& store, std::string deviceId)
        : store_(store), deviceId_(std::move(deviceId)) {}

    SyncSnapshot ReconciliationEngine::gatherSnapshot() {
        try {
            SyncSnapshot s;
            s.folders = store_.getAllFolders();
            s.notebooks = store_.getAllNotebooks();
            s.notes = store_.getAllNotes();
            return s;
        }
        catch (const std::exception& e) {
            throw SyncError(SyncErr::Internal, std::string("cannot read local collections: ") + e.what());
        }
    }

    MergeCounts ReconciliationEngine::merge(const SyncSnapshot& remote) {
        MergeCounts c;
        c.failed = remote.malformed;

        c.folders = mergeCollection(remote.folders, "folder",
            [this](const std::string& id) { return store_.getFolder(id); },
            [this](const Folder& f) { store_.upsertFolder(f); }, c.failed);
        c.notebooks = mergeCollection(remote.notebooks, "notebook",
            [this](const std::string& id) { return store_.getNotebook(id); },
            [this](const Notebook& n) { store_.upsertNotebook(n); }, c.failed);
        c.notes = mergeCollection(remote.notes, "note",
            [this](const std::string& id) { return store_.getNote(id); },
            [this](const Note& n) { store_.upsertNote(n); }, c.failed);

        LOG_INFO("Merged " + std::to_string(c.total()) + " changes (folders " + std::to_string(c.folders) +
                 ", notebooks " + std::to_string(c.notebooks) + ", notes " + std::to_string(c.notes) + ")" +
                 (c.failed ? ", " + std::to_string(c.failed) + " skipped" : std::string{}));
        return c;
    }

    AppMessage ReconciliationEngine::beginSync() {
        inProgress_ = true;
        state_ = ExchangeState::AwaitingData;
        LOG_INFO("Requesting sync");
        return SyncRequest{ deviceId_, isoNow() };
    }

    AppMessage ReconciliationEngine::beginPush() {
        SyncData data{ gatherSnapshot(), isoNow() };
        inProgress_ = true;
        state_ = ExchangeState::AwaitingAck;
        LOG_INFO("Pushing " + std::to_string(data.snapshot.size()) + " entities");
        return data;
    }

    ReconciliationEngine::Outcome ReconciliationEngine::handle(const AppMessage& in) {
        Outcome out;

        if (const auto* req = std::get_if<SyncRequest>(&in)) {
            if (inProgress_) {
                LOG_WARN("sync_request from " + req->deviceId + " rejected, a sync is already in progress");
                out.rejected = true;
                return out;
            }
            LOG_INFO("Sync requested by " + (req->deviceId.empty() ? std::string("peer") : req->deviceId));
            out.reply = SyncData{ gatherSnapshot(), isoNow() };
            inProgress_ = true;
            state_ = ExchangeState::AwaitingAck;
            return out;
        }

        if (const auto* data = std::get_if<SyncData>(&in)) {
            if (inProgress_ && state_ != ExchangeState::AwaitingData) {
                LOG_WARN("sync_data rejected, a sync is already in progress");
                out.rejected = true;
                return out;
            }
            LOG_INFO("Received sync_data with " + std::to_string(data->snapshot.size()) + " entities");
            inProgress_ = true;
            out.counts = merge(data->snapshot);
            out.merged = true;
            out.reply = SyncAck{ gatherSnapshot(), isoNow() };
            out.finished = true;
            inProgress_ = false;
            state_ = ExchangeState::Done;
            return out;
        }

        const auto& ack = std::get<SyncAck>(in);
        if (state_ != ExchangeState::AwaitingAck) {
            LOG_WARN(std::string("Unexpected sync_ack in state ") + toString(state_) + ", ignored");
            out.rejected = true;
            return out;
        }
        if (ack.snapshot) {
            out.counts = merge(*ack.snapshot);
            out.merged = true;
        }
        out.finished = true;
        inProgress_ = false;
        state_ = ExchangeState::Done;
        LOG_INFO("Sync exchange complete");
        return out;
    }

    void ReconciliationEngine::abort() {
        if (inProgress_)
            LOG_WARN(std::string("Sync aborted in state ") + toString(state_));
        inProgress_ = false;
        state_ = ExchangeState::Idle;
    }

}
