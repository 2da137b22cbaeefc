#include <catch2/catch_all.hpp>
#include "ktnsync/core/protocol/sync_messages.hpp"
#include "ktnsync/core/sync/reconciliation_engine.hpp"
#include "ktnsync/store/memory_store.hpp"
#include "ktnsync/core/util/error_types.hpp"

using namespace ktnsync;

namespace {
    Folder folder(std::string id, std::string at, std::string name = "Folder") {
        Folder f;
        f.id = std::move(id);
        f.updatedAt = std::move(at);
        f.attrs["name"] = std::move(name);
        return f;
    }

    Notebook notebook(std::string id, std::string folderId, std::string at) {
        Notebook n;
        n.id = std::move(id);
        n.folderId = std::move(folderId);
        n.updatedAt = std::move(at);
        n.attrs["name"] = "Notebook";
        return n;
    }

    Note note(std::string id, std::string notebookId, std::string at, std::string title) {
        Note n;
        n.id = std::move(id);
        n.notebookId = std::move(notebookId);
        n.updatedAt = std::move(at);
        n.attrs["title"] = std::move(title);
        return n;
    }

    SyncSnapshot snapshotOf(MemoryStore& s) {
        return SyncSnapshot{ s.getAllFolders(), s.getAllNotebooks(), s.getAllNotes(), 0 };
    }
}

TEST_CASE("A remote entity missing locally is inserted", "[merge]") {
    MemoryStore local;
    ReconciliationEngine engine(local, "dev-a");

    SyncSnapshot remote;
    remote.folders.push_back(folder("F1", "2024-01-02T10:00:00Z"));

    auto c = engine.merge(remote);
    REQUIRE(c.folders == 1);
    REQUIRE(c.total() == 1);
    REQUIRE(local.getFolder("F1") == remote.folders[0]);
}

TEST_CASE("An older remote note does not overwrite the local one", "[merge]") {
    MemoryStore local;
    local.upsertNote(note("N1", "NB1", "2024-03-01T12:00:00Z", "local title"));
    ReconciliationEngine engine(local, "dev-a");

    SyncSnapshot remote;
    remote.notes.push_back(note("N1", "NB1", "2024-02-01T12:00:00Z", "remote title"));

    auto c = engine.merge(remote);
    REQUIRE(c.notes == 0);
    REQUIRE(local.getNote("N1")->attrs.at("title") == "local title");
}

TEST_CASE("A strictly newer remote entity replaces the local record", "[merge]") {
    MemoryStore local;
    local.upsertNotebook(notebook("NB1", "F1", "2024-03-01T12:00:00Z"));
    ReconciliationEngine engine(local, "dev-a");

    SyncSnapshot remote;
    auto newer = notebook("NB1", "F2", "2024-03-01T12:00:01Z");
    newer.attrs["name"] = "Renamed";
    remote.notebooks.push_back(newer);

    REQUIRE(engine.merge(remote).notebooks == 1);
    REQUIRE(local.getNotebook("NB1") == newer);
}

TEST_CASE("Equal timestamps keep the local record", "[merge]") {
    MemoryStore local;
    local.upsertFolder(folder("F1", "2024-01-01T00:00:00Z", "mine"));
    ReconciliationEngine engine(local, "dev-a");

    SyncSnapshot remote;
    remote.folders.push_back(folder("F1", "2024-01-01T00:00:00.000Z", "theirs"));

    REQUIRE(engine.merge(remote).folders == 0);
    REQUIRE(local.getFolder("F1")->attrs.at("name") == "mine");
}

TEST_CASE("Timestamps are compared as instants, not as text", "[merge]") {
    MemoryStore local;
    local.upsertFolder(folder("F1", "2024-01-01T10:00:00Z", "utc"));
    ReconciliationEngine engine(local, "dev-a");

    SyncSnapshot remote;
    // 10:30+01:00 is 09:30Z, older although it sorts later as a string.
    remote.folders.push_back(folder("F1", "2024-01-01T10:30:00+01:00", "offset"));
    REQUIRE(engine.merge(remote).folders == 0);

    remote.folders[0].updatedAt = "2024-01-01T11:30:00+01:00";
    REQUIRE(engine.merge(remote).folders == 1);
    REQUIRE(local.getFolder("F1")->attrs.at("name") == "offset");
}

TEST_CASE("An unparseable remote timestamp never wins", "[merge]") {
    MemoryStore local;
    local.upsertFolder(folder("F1", "2024-01-01T10:00:00Z", "mine"));
    ReconciliationEngine engine(local, "dev-a");

    SyncSnapshot remote;
    remote.folders.push_back(folder("F1", "yesterday", "theirs"));
    REQUIRE(engine.merge(remote).folders == 0);
    REQUIRE(local.getFolder("F1")->attrs.at("name") == "mine");
}

TEST_CASE("Merging the same snapshot twice changes nothing the second time", "[merge]") {
    MemoryStore local;
    ReconciliationEngine engine(local, "dev-a");

    SyncSnapshot remote;
    remote.folders.push_back(folder("F1", "2024-01-02T10:00:00Z"));
    remote.notebooks.push_back(notebook("NB1", "F1", "2024-01-02T10:00:00Z"));
    remote.notes.push_back(note("N1", "NB1", "2024-01-02T10:00:00Z", "t"));

    REQUIRE(engine.merge(remote).total() == 3);
    auto before = local.toJson();
    REQUIRE(engine.merge(remote).total() == 0);
    REQUIRE(local.toJson() == before);
}

TEST_CASE("Merge order does not change the result", "[merge]") {
    auto s1 = SyncSnapshot{};
    s1.notes.push_back(note("N1", "NB1", "2024-05-01T00:00:00Z", "from one"));
    s1.notes.push_back(note("N2", "NB1", "2024-05-03T00:00:00Z", "from one"));
    auto s2 = SyncSnapshot{};
    s2.notes.push_back(note("N1", "NB1", "2024-05-02T00:00:00Z", "from two"));
    s2.notes.push_back(note("N2", "NB1", "2024-05-01T00:00:00Z", "from two"));

    MemoryStore a, b;
    ReconciliationEngine ea(a, "a"), eb(b, "b");
    ea.merge(s1);
    ea.merge(s2);
    eb.merge(s2);
    eb.merge(s1);

    REQUIRE(a.toJson() == b.toJson());
    REQUIRE(a.getNote("N1")->attrs.at("title") == "from two");
    REQUIRE(a.getNote("N2")->attrs.at("title") == "from one");
}

TEST_CASE("A failing entity is skipped and counted, the rest is merged", "[merge]") {
    MemoryStore local;
    local.failWritesFor("N2");
    ReconciliationEngine engine(local, "dev-a");

    SyncSnapshot remote;
    remote.notes.push_back(note("N1", "NB1", "2024-01-01T00:00:00Z", "one"));
    remote.notes.push_back(note("N2", "NB1", "2024-01-01T00:00:00Z", "two"));
    remote.notes.push_back(note("N3", "NB1", "2024-01-01T00:00:00Z", "three"));
    remote.malformed = 1;

    auto c = engine.merge(remote);
    REQUIRE(c.notes == 2);
    REQUIRE(c.failed == 2);
    REQUIRE(local.getNote("N1").has_value());
    REQUIRE_FALSE(local.getNote("N2").has_value());
    REQUIRE(local.getNote("N3").has_value());
}

TEST_CASE("gatherSnapshot reports an unreadable store as Internal", "[merge]") {
    MemoryStore local;
    local.setUnavailable(true);
    ReconciliationEngine engine(local, "dev-a");
    try {
        engine.gatherSnapshot();
        FAIL("expected SyncError");
    }
    catch (const SyncError& e) {
        REQUIRE(e.code() == SyncErr::Internal);
    }
}

TEST_CASE("Two engines converge through request, data and ack", "[merge][exchange]") {
    MemoryStore storeA, storeB;
    storeA.upsertFolder(folder("F1", "2024-01-01T00:00:00Z", "A's folder"));
    storeA.upsertNote(note("N1", "NB1", "2024-02-01T00:00:00Z", "A newer"));
    storeB.upsertNotebook(notebook("NB1", "F1", "2024-01-05T00:00:00Z"));
    storeB.upsertNote(note("N1", "NB1", "2024-01-15T00:00:00Z", "B older"));

    ReconciliationEngine a(storeA, "dev-a"), b(storeB, "dev-b");

    // A asks, B answers with its data, A merges and acks with its own data.
    AppMessage request = a.beginSync();
    REQUIRE(a.syncInProgress());
    REQUIRE(a.state() == ExchangeState::AwaitingData);

    auto bOut = b.handle(decodeMessage(encodeMessage(request)));
    REQUIRE(bOut.reply.has_value());
    REQUIRE(std::holds_alternative<SyncData>(*bOut.reply));
    REQUIRE(b.state() == ExchangeState::AwaitingAck);

    auto aOut = a.handle(decodeMessage(encodeMessage(*bOut.reply)));
    REQUIRE(aOut.merged);
    REQUIRE(aOut.finished);
    REQUIRE(aOut.counts.notebooks == 1);
    REQUIRE(aOut.counts.notes == 0);
    REQUIRE(std::holds_alternative<SyncAck>(*aOut.reply));
    REQUIRE_FALSE(a.syncInProgress());

    auto bFinal = b.handle(decodeMessage(encodeMessage(*aOut.reply)));
    REQUIRE(bFinal.finished);
    REQUIRE_FALSE(bFinal.reply.has_value());
    REQUIRE(bFinal.counts.folders == 1);
    REQUIRE(bFinal.counts.notes == 1);
    REQUIRE(b.state() == ExchangeState::Done);

    REQUIRE(storeA.toJson().at("folders") == storeB.toJson().at("folders"));
    REQUIRE(storeA.toJson().at("notebooks") == storeB.toJson().at("notebooks"));
    REQUIRE(storeA.toJson().at("notes") == storeB.toJson().at("notes"));
    REQUIRE(storeB.getNote("N1")->attrs.at("title") == "A newer");
}

TEST_CASE("A second request during an exchange is rejected", "[merge][exchange]") {
    MemoryStore store;
    ReconciliationEngine engine(store, "dev-b");

    auto first = engine.handle(SyncRequest{ "dev-a", "2024-01-01T00:00:00Z" });
    REQUIRE(first.reply.has_value());

    auto second = engine.handle(SyncRequest{ "dev-c", "2024-01-01T00:00:01Z" });
    REQUIRE(second.rejected);
    REQUIRE_FALSE(second.reply.has_value());
    REQUIRE(engine.state() == ExchangeState::AwaitingAck);

    engine.abort();
    REQUIRE_FALSE(engine.syncInProgress());
    REQUIRE(engine.handle(SyncRequest{ "dev-c", "2024-01-01T00:00:02Z" }).reply.has_value());
}

TEST_CASE("An ack nobody waited for is ignored", "[merge][exchange]") {
    MemoryStore store;
    ReconciliationEngine engine(store, "dev-a");

    SyncAck ack;
    ack.snapshot = SyncSnapshot{};
    ack.snapshot->folders.push_back(folder("F9", "2024-01-01T00:00:00Z"));
    auto out = engine.handle(ack);
    REQUIRE(out.rejected);
    REQUIRE(store.folderCount() == 0);
}

TEST_CASE("beginPush sends local data and accepts the ack", "[merge][exchange]") {
    MemoryStore storeA, storeB;
    storeA.upsertFolder(folder("F1", "2024-01-01T00:00:00Z"));
    ReconciliationEngine a(storeA, "dev-a"), b(storeB, "dev-b");

    AppMessage push = a.beginPush();
    REQUIRE(a.state() == ExchangeState::AwaitingAck);

    auto bOut = b.handle(push);
    REQUIRE(bOut.counts.folders == 1);
    REQUIRE(bOut.finished);

    auto aOut = a.handle(*bOut.reply);
    REQUIRE(aOut.finished);
    REQUIRE(a.state() == ExchangeState::Done);
    REQUIRE(storeB.getFolder("F1").has_value());
}
