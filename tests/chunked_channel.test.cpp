#include <catch2/catch_all.hpp>
#include "fake_channel.hpp"
#include "ktnsync/core/channel/chunked_channel.hpp"
#include "ktnsync/core/protocol/sync_messages.hpp"
#include "ktnsync/transports/loopback/loopback_transport.hpp"

#include <boost/asio/io_context.hpp>
#include <chrono>

using namespace ktnsync;
using namespace std::chrono_literals;

TEST_CASE("A small message goes out as a single frame", "[chunk]") {
    boost::asio::io_context io;
    auto fake = std::make_shared<FakeChannel>();
    ChunkedChannel ch(io, fake);

    int completions = 0;
    ch.send("{\"type\":\"sync_request\"}", [&](ErrorOpt err) {
        REQUIRE_FALSE(err.has_value());
        ++completions;
    });
    io.run();

    REQUIRE(fake->sent.size() == 1);
    REQUIRE(fake->sent[0] == "{\"type\":\"sync_request\"}");
    REQUIRE(completions == 1);
    REQUIRE(ch.queuedCount() == 0);
}

TEST_CASE("40 KiB is split into 16K, 16K and 8K chunks of one stream", "[chunk]") {
    boost::asio::io_context io;
    auto fake = std::make_shared<FakeChannel>();
    ChunkedChannel ch(io, fake);

    ch.send(std::string(40 * 1024, 'n'));
    io.run();

    REQUIRE(fake->sent.size() == 3);
    std::vector<ChunkEnvelope> env;
    for (const auto& f : fake->sent) {
        auto e = decodeChunk(f);
        REQUIRE(e.has_value());
        env.push_back(*e);
    }
    REQUIRE(env[0].data.size() == 16384);
    REQUIRE(env[1].data.size() == 16384);
    REQUIRE(env[2].data.size() == 8192);
    for (int i = 0; i < 3; ++i) {
        REQUIRE(env[i].index == i);
        REQUIRE(env[i].total == 3);
        REQUIRE(env[i].chunkId == env[0].chunkId);
    }
}

TEST_CASE("Chunks of two large messages never interleave", "[chunk]") {
    boost::asio::io_context io;
    auto fake = std::make_shared<FakeChannel>();
    ChunkedChannel ch(io, fake);

    ch.send(std::string(20000, 'a'));
    ch.send(std::string(20000, 'b'));
    io.run();

    REQUIRE(fake->sent.size() == 4);
    auto a0 = decodeChunk(fake->sent[0]), a1 = decodeChunk(fake->sent[1]);
    auto b0 = decodeChunk(fake->sent[2]), b1 = decodeChunk(fake->sent[3]);
    REQUIRE(a0->chunkId == a1->chunkId);
    REQUIRE(b0->chunkId == b1->chunkId);
    REQUIRE(a0->chunkId != b0->chunkId);
    REQUIRE(a0->data.front() == 'a');
    REQUIRE(b0->data.front() == 'b');
}

TEST_CASE("Chunks arriving out of order are joined once", "[chunk]") {
    boost::asio::io_context io;
    auto fake = std::make_shared<FakeChannel>();
    ChunkedChannel ch(io, fake);

    std::vector<std::string> delivered;
    ch.setMessageHandler([&](const std::string& m) { delivered.push_back(m); });

    fake->receive(encodeChunk({ "s1", 2, 3, "C" }));
    fake->receive(encodeChunk({ "s1", 0, 3, "A" }));
    REQUIRE(ch.pendingStreams() == 1);
    fake->receive(encodeChunk({ "s1", 0, 3, "A" }));
    fake->receive(encodeChunk({ "s1", 1, 3, "B" }));

    REQUIRE(delivered.size() == 1);
    REQUIRE(delivered[0] == "ABC");
    REQUIRE(ch.pendingStreams() == 0);
}

TEST_CASE("Frames that are not chunk envelopes are delivered as they are", "[chunk]") {
    boost::asio::io_context io;
    auto fake = std::make_shared<FakeChannel>();
    ChunkedChannel ch(io, fake);

    std::vector<std::string> delivered;
    ch.setMessageHandler([&](const std::string& m) { delivered.push_back(m); });

    ch.test_onFrame("{\"type\":\"sync_ack\",\"timestamp\":\"x\"}");
    ch.test_onFrame("plain text mentioning __chunk__ but not an envelope");
    REQUIRE(delivered.size() == 2);
    REQUIRE(delivered[1] == "plain text mentioning __chunk__ but not an envelope");
}

TEST_CASE("Chunks with an impossible index are dropped", "[chunk]") {
    boost::asio::io_context io;
    auto fake = std::make_shared<FakeChannel>();
    ChunkedChannel ch(io, fake);

    int delivered = 0;
    ch.setMessageHandler([&](const std::string&) { ++delivered; });
    fake->receive(encodeChunk({ "bad", 3, 3, "x" }));
    fake->receive(encodeChunk({ "bad", -1, 3, "x" }));
    fake->receive(encodeChunk({ "bad", 0, 0, "x" }));

    REQUIRE(delivered == 0);
    REQUIRE(ch.pendingStreams() == 0);
}

TEST_CASE("Incomplete streams beyond the limit evict the oldest", "[chunk]") {
    boost::asio::io_context io;
    auto fake = std::make_shared<FakeChannel>();
    SyncOptions opts;
    opts.maxPendingStreams = 3;
    ChunkedChannel ch(io, fake, opts);

    std::vector<std::string> delivered;
    ch.setMessageHandler([&](const std::string& m) { delivered.push_back(m); });

    for (int i = 0; i < 10; ++i)
        fake->receive(encodeChunk({ "open" + std::to_string(i), 0, 2, "x" }));
    REQUIRE(ch.pendingStreams() == 3);

    // open0 was evicted, so its second half starts a fresh stream.
    fake->receive(encodeChunk({ "open0", 1, 2, "y" }));
    REQUIRE(ch.pendingStreams() == 3);
    REQUIRE(delivered.empty());

    // The newest streams still complete.
    fake->receive(encodeChunk({ "open9", 1, 2, "9" }));
    REQUIRE(delivered == std::vector<std::string>{ "x9" });
    REQUIRE(ch.pendingStreams() == 2);
}

TEST_CASE("Zero sizes are rejected when the channel is built", "[chunk]") {
    boost::asio::io_context io;
    auto fake = std::make_shared<FakeChannel>();

    SyncOptions noChunk;
    noChunk.maxChunkBytes = 0;
    REQUIRE_THROWS_AS(ChunkedChannel(io, fake, noChunk), SyncError);

    SyncOptions noStreams;
    noStreams.maxPendingStreams = 0;
    REQUIRE_THROWS_AS(ChunkedChannel(io, fake, noStreams), SyncError);
}

TEST_CASE("Messages sent while connecting are flushed in order on open", "[chunk]") {
    boost::asio::io_context io;
    auto fake = std::make_shared<FakeChannel>(ChannelState::Connecting);
    ChunkedChannel ch(io, fake);

    ch.send("first");
    ch.send("second");
    REQUIRE(fake->sent.empty());
    REQUIRE(ch.queuedCount() == 2);

    fake->open();
    REQUIRE(fake->sent == std::vector<std::string>{ "first", "second" });
    REQUIRE(ch.queuedCount() == 0);
}

TEST_CASE("Sending on a closed channel reports ChannelClosed", "[chunk]") {
    boost::asio::io_context io;
    auto fake = std::make_shared<FakeChannel>();
    ChunkedChannel ch(io, fake);

    int closes = 0;
    ch.setCloseHandler([&] { ++closes; });
    fake->remoteClose();
    REQUIRE(closes == 1);
    REQUIRE(ch.state() == ChannelState::Closed);

    ErrorOpt result;
    ch.send("late", [&](ErrorOpt err) { result = err; });
    io.run();

    REQUIRE(result.has_value());
    REQUIRE(result->code == SyncErr::ChannelClosed);
    REQUIRE(fake->sent.empty());
}

TEST_CASE("Chunk sends pause above the high-water mark and resume below it", "[chunk]") {
    boost::asio::io_context io;
    auto fake = std::make_shared<FakeChannel>();
    fake->bufferPerSend = 70000;
    SyncOptions opts;
    opts.backpressurePollMs = 5;
    ChunkedChannel ch(io, fake, opts);

    bool done = false;
    ch.send(std::string(40 * 1024, 'x'), [&](ErrorOpt err) {
        REQUIRE_FALSE(err.has_value());
        done = true;
    });
    REQUIRE(fake->sent.size() == 1);
    io.run_for(30ms);
    io.restart();
    REQUIRE(fake->sent.size() == 1);
    REQUIRE_FALSE(done);

    fake->bufferPerSend = 0;
    fake->buffered = 0;
    io.run_for(100ms);

    REQUIRE(fake->sent.size() == 3);
    REQUIRE(done);
}

TEST_CASE("A close during a paused send fails it and reports the close", "[chunk]") {
    boost::asio::io_context io;
    auto fake = std::make_shared<FakeChannel>();
    fake->bufferPerSend = 70000;
    SyncOptions opts;
    opts.backpressurePollMs = 5;
    ChunkedChannel ch(io, fake, opts);

    ErrorOpt first, second;
    bool firstDone = false, secondDone = false;
    ch.send(std::string(40 * 1024, 'x'), [&](ErrorOpt err) { first = err; firstDone = true; });
    ch.send("queued behind", [&](ErrorOpt err) { second = err; secondDone = true; });

    int closes = 0;
    ch.setCloseHandler([&] { ++closes; });
    fake->remoteClose();
    io.run_for(50ms);

    REQUIRE(closes == 1);
    REQUIRE(firstDone);
    REQUIRE(secondDone);
    REQUIRE(first->code == SyncErr::ChannelClosed);
    REQUIRE(second->code == SyncErr::ChannelClosed);
    REQUIRE(fake->sent.size() == 1);
}

TEST_CASE("Local close detaches and closes the underlying channel", "[chunk]") {
    boost::asio::io_context io;
    auto fake = std::make_shared<FakeChannel>(ChannelState::Connecting);
    ChunkedChannel ch(io, fake);

    ErrorOpt result;
    ch.send("never sent", [&](ErrorOpt err) { result = err; });
    ch.close();
    io.run();

    REQUIRE(fake->closeCalls == 1);
    REQUIRE(fake->onMessage == nullptr);
    REQUIRE(result.has_value());
    REQUIRE(result->code == SyncErr::ChannelClosed);
}

TEST_CASE("A large message crosses a loopback channel pair intact", "[chunk][loopback]") {
    boost::asio::io_context io;
    LoopbackNetwork net(io);
    auto [left, right] = net.openChannelPair("sync");

    ChunkedChannel sender(io, left);
    ChunkedChannel receiver(io, right);

    std::string big;
    for (int i = 0; i < 12000; ++i) big += "n\xC3\xA9" + std::to_string(i % 10);

    std::string got;
    receiver.setMessageHandler([&](const std::string& m) { got = m; });
    bool sent = false;
    sender.send(big, [&](ErrorOpt err) { sent = !err.has_value(); });

    io.run_for(500ms);
    REQUIRE(sent);
    REQUIRE(got == big);
}
