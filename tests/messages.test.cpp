#include <catch2/catch_all.hpp>
#include "ktnsync/core/protocol/sync_messages.hpp"
#include "ktnsync/core/util/error_types.hpp"

#include <nlohmann/json.hpp>

using namespace ktnsync;

namespace {
    SyncErr decodeError(std::string_view text) {
        try {
            decodeMessage(text);
        }
        catch (const SyncError& e) {
            return e.code();
        }
        return SyncErr::Internal;
    }
}

TEST_CASE("Undecodable messages are InvalidMessage", "[messages]") {
    REQUIRE(decodeError("not json") == SyncErr::InvalidMessage);
    REQUIRE(decodeError("[1,2,3]") == SyncErr::InvalidMessage);
    REQUIRE(decodeError(R"({"type":"sync_merge"})") == SyncErr::InvalidMessage);
    REQUIRE(decodeError(R"({"timestamp":"x"})") == SyncErr::InvalidMessage);
    REQUIRE(decodeError(R"({"type":"sync_data","folders":{"id":"F1"}})") == SyncErr::InvalidMessage);
}

TEST_CASE("A request carries the device id", "[messages]") {
    auto m = decodeMessage(R"({"type":"sync_request","deviceId":"abc","timestamp":"2024-01-01T00:00:00Z"})");
    REQUIRE(std::holds_alternative<SyncRequest>(m));
    REQUIRE(std::get<SyncRequest>(m).deviceId == "abc");
    REQUIRE(std::string(messageType(m)) == "sync_request");
}

TEST_CASE("An ack with or without collections", "[messages]") {
    auto bare = decodeMessage(R"({"type":"sync_ack","timestamp":"t"})");
    REQUIRE_FALSE(std::get<SyncAck>(bare).snapshot.has_value());

    auto full = decodeMessage(R"({"type":"sync_ack","notes":[{"id":"N1","notebookId":"NB1","updatedAt":"t","title":"x"}]})");
    const auto& snap = std::get<SyncAck>(full).snapshot;
    REQUIRE(snap.has_value());
    REQUIRE(snap->notes.size() == 1);
    REQUIRE(snap->notes[0].notebookId == "NB1");
    REQUIRE(snap->notes[0].attrs.at("title") == "x");

    // Encoding a bare ack leaves the collections out.
    auto wire = nlohmann::json::parse(encodeMessage(SyncAck{ std::nullopt, "t" }));
    REQUIRE_FALSE(wire.contains("folders"));
    REQUIRE(wire.at("type") == "sync_ack");
}

TEST_CASE("Malformed entity records are dropped and counted", "[messages]") {
    auto m = decodeMessage(R"({"type":"sync_data","timestamp":"t",
        "folders":[{"id":"F1","updatedAt":"t"},{"name":"no id"},42],
        "notebooks":[{"id":""}],
        "notes":null})");
    const auto& s = std::get<SyncData>(m).snapshot;
    REQUIRE(s.folders.size() == 1);
    REQUIRE(s.notebooks.empty());
    REQUIRE(s.notes.empty());
    REQUIRE(s.malformed == 3);
}

TEST_CASE("Entity attributes survive the wire untouched", "[messages]") {
    Note n;
    n.id = "N1";
    n.updatedAt = "2024-01-01T00:00:00Z";
    n.attrs = { {"title", "T"}, {"content", {{"blocks", {1, 2, 3}}}}, {"order", 4} };
    SyncData d;
    d.snapshot.notes.push_back(n);

    auto back = std::get<SyncData>(decodeMessage(encodeMessage(d)));
    REQUIRE(back.snapshot.notes.at(0) == n);
    REQUIRE_FALSE(back.snapshot.notes.at(0).notebookId.has_value());
}

TEST_CASE("Chunk envelopes are recognised only when well formed", "[messages][chunk]") {
    auto env = decodeChunk(encodeChunk({ "lx1", 1, 3, "body" }));
    REQUIRE(env.has_value());
    REQUIRE(env->chunkId == "lx1");
    REQUIRE(env->index == 1);
    REQUIRE(env->total == 3);
    REQUIRE(env->data == "body");

    REQUIRE_FALSE(decodeChunk(R"({"type":"sync_ack"})").has_value());
    REQUIRE_FALSE(decodeChunk(R"({"type":"__chunk__","chunkId":"a","index":"0","total":1,"data":""})").has_value());
    REQUIRE_FALSE(decodeChunk(R"({"type":"__chunk__","chunkId":"a","index":0,"total":1})").has_value());
    REQUIRE_FALSE(decodeChunk("__chunk__ {").has_value());
}
