#include "ktnsync/core/util/sync_options.hpp"
#include "ktnsync/core/util/error_types.hpp"
#include "ktnsync/core/util/logger.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace ktnsync {

    void to_json(nlohmann::json& j, const SyncOptions& o) {
        j = nlohmann::json{
            {"fragmentSize",       o.fragmentSize},
            {"singleCodeCapacity", o.singleCodeCapacity},
            {"maxChunkBytes",      o.maxChunkBytes},
            {"highWaterBytes",     o.highWaterBytes},
            {"maxPendingStreams",  o.maxPendingStreams},
            {"backpressurePollMs", o.backpressurePollMs},
            {"gatherTimeoutMs",    o.gatherTimeoutMs},
            {"openTimeoutMs",      o.openTimeoutMs},
            {"channelLabel",       o.channelLabel},
            {"iceServers",         o.iceServers},
            {"autoStartSync",      o.autoStartSync},
            {"strictFragments",    o.strictFragments}
        };
    }

    void from_json(const nlohmann::json& j, SyncOptions& o) {
        o.fragmentSize       = j.value("fragmentSize",       o.fragmentSize);
        o.singleCodeCapacity = j.value("singleCodeCapacity", o.singleCodeCapacity);
        o.maxChunkBytes      = j.value("maxChunkBytes",      o.maxChunkBytes);
        o.highWaterBytes     = j.value("highWaterBytes",     o.highWaterBytes);
        o.maxPendingStreams  = j.value("maxPendingStreams",  o.maxPendingStreams);
        o.backpressurePollMs = j.value("backpressurePollMs", o.backpressurePollMs);
        o.gatherTimeoutMs    = j.value("gatherTimeoutMs",    o.gatherTimeoutMs);
        o.openTimeoutMs      = j.value("openTimeoutMs",      o.openTimeoutMs);
        o.channelLabel       = j.value("channelLabel",       o.channelLabel);
        o.iceServers         = j.value("iceServers",         o.iceServers);
        o.autoStartSync      = j.value("autoStartSync",      o.autoStartSync);
        o.strictFragments    = j.value("strictFragments",    o.strictFragments);
    }

    void validateSyncOptions(const SyncOptions& o) {
        if (o.fragmentSize == 0)
            throw SyncError(SyncErr::Internal, "fragmentSize must be positive");
        if (o.maxChunkBytes == 0)
            throw SyncError(SyncErr::Internal, "maxChunkBytes must be positive");
        if (o.maxPendingStreams == 0)
            throw SyncError(SyncErr::Internal, "maxPendingStreams must be positive");
    }

    SyncOptions loadSyncOptions(const std::string& path) {
        std::ifstream in(path);
        if (!in)
            throw SyncError(SyncErr::Internal, "cannot open options file " + path);

        try {
            auto j = nlohmann::json::parse(in);
            if (!j.is_object())
                throw SyncError(SyncErr::Internal, "options file " + path + " is not a JSON object");
            SyncOptions o = j.get<SyncOptions>();
            validateSyncOptions(o);
            LOG_DEBUG("Loaded sync options from " + path);
            return o;
        }
        catch (const nlohmann::json::exception& e) {
            throw SyncError(SyncErr::Internal, "bad options file " + path + ": " + e.what());
        }
    }

}
