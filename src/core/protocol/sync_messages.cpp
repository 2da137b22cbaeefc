#include "ktnsync/core/protocol/sync_messages.hpp"
#include "ktnsync/core/util/error_types.hpp"
#include "ktnsync/core/util/logger.hpp"

#include <nlohmann/json.hpp>

namespace ktnsync {

    namespace {
        using nlohmann::json;

        template <typename... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
        template <typename... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

        template <typename T>
        void readCollection(const json& j, const char* key, std::vector<T>& out, size_t& malformed) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) return;
            if (!it->is_array())
                throw SyncError(SyncErr::InvalidMessage, std::string(key) + " is not an array");
            out.reserve(it->size());
            for (const auto& rec : *it) {
                try {
                    out.push_back(rec.get<T>());
                }
                catch (const std::exception& e) {
                    ++malformed;
                    LOG_WARN(std::string("Dropping malformed ") + key + " record: " + e.what());
                }
            }
        }

        SyncSnapshot readSnapshot(const json& j) {
            SyncSnapshot s;
            readCollection(j, "folders", s.folders, s.malformed);
            readCollection(j, "notebooks", s.notebooks, s.malformed);
            readCollection(j, "notes", s.notes, s.malformed);
            return s;
        }

        void writeSnapshot(json& j, const SyncSnapshot& s) {
            j["folders"] = s.folders;
            j["notebooks"] = s.notebooks;
            j["notes"] = s.notes;
        }

        std::string readString(const json& j, const char* key) {
            auto it = j.find(key);
            return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string{};
        }
    }

    const char* messageType(const AppMessage& m) {
        return std::visit(Overloaded{
            [](const SyncRequest&) { return "sync_request"; },
            [](const SyncData&)    { return "sync_data"; },
            [](const SyncAck&)     { return "sync_ack"; }
        }, m);
    }

    std::string encodeMessage(const AppMessage& m) {
        json j;
        j["type"] = messageType(m);
        std::visit(Overloaded{
            [&](const SyncRequest& r) {
                j["deviceId"] = r.deviceId;
                j["timestamp"] = r.timestamp;
            },
            [&](const SyncData& d) {
                writeSnapshot(j, d.snapshot);
                j["timestamp"] = d.timestamp;
            },
            [&](const SyncAck& a) {
                if (a.snapshot) writeSnapshot(j, *a.snapshot);
                j["timestamp"] = a.timestamp;
            }
        }, m);
        return j.dump();
    }

    AppMessage decodeMessage(std::string_view text) {
        auto j = json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            throw SyncError(SyncErr::InvalidMessage, "message is not a JSON object");

        const std::string type = readString(j, "type");
        if (type == "sync_request")
            return SyncRequest{ readString(j, "deviceId"), readString(j, "timestamp") };
        if (type == "sync_data")
            return SyncData{ readSnapshot(j), readString(j, "timestamp") };
        if (type == "sync_ack") {
            SyncAck ack{ std::nullopt, readString(j, "timestamp") };
            if (j.contains("folders") || j.contains("notebooks") || j.contains("notes"))
                ack.snapshot = readSnapshot(j);
            return ack;
        }
        throw SyncError(SyncErr::InvalidMessage, "unknown message type '" + type + "'");
    }

    std::string encodeChunk(const ChunkEnvelope& c) {
        return json{
            {"type", std::string(kChunkType)},
            {"chunkId", c.chunkId},
            {"index", c.index},
            {"total", c.total},
            {"data", c.data}
        }.dump();
    }

    std::optional<ChunkEnvelope> decodeChunk(std::string_view frame) {
        // Cheap reject before parsing large non-chunk frames.
        if (frame.find(kChunkType) == std::string_view::npos) return std::nullopt;

        auto j = json::parse(frame, nullptr, false);
        if (j.is_discarded() || !j.is_object()) return std::nullopt;
        if (readString(j, "type") != kChunkType) return std::nullopt;

        auto id = j.find("chunkId");
        auto index = j.find("index");
        auto total = j.find("total");
        auto data = j.find("data");
        if (id == j.end() || !id->is_string() ||
            index == j.end() || !index->is_number_integer() ||
            total == j.end() || !total->is_number_integer() ||
            data == j.end() || !data->is_string())
            return std::nullopt;

        return ChunkEnvelope{ id->get<std::string>(), index->get<int>(), total->get<int>(), data->get<std::string>() };
    }

}
