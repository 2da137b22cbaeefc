#include <catch2/catch_all.hpp>
#include "test_util.hpp"
#include "ktnsync/core/negotiation/transport_negotiator.hpp"
#include "ktnsync/transports/loopback/loopback_transport.hpp"

using namespace ktnsync;
using namespace std::chrono_literals;

namespace {
    SyncOptions fastOptions() {
        SyncOptions o;
        o.gatherTimeoutMs = 200;
        o.openTimeoutMs = 1000;
        return o;
    }

    struct Pair {
        boost::asio::io_context io;
        LoopbackNetwork net{ io };
        SyncOptions opts = fastOptions();
        std::unique_ptr<TransportNegotiator> a;
        std::unique_ptr<TransportNegotiator> b;
        std::optional<SignalingPayload> offer, answer;
        std::optional<ErrorObj> failA, failB;

        void build() {
            a = std::make_unique<TransportNegotiator>(io, net, opts);
            b = std::make_unique<TransportNegotiator>(io, net, opts);
            a->setFailureHandler([this](const ErrorObj& e) { failA = e; });
            b->setFailureHandler([this](const ErrorObj& e) { failB = e; });
        }

        void exchange() {
            a->createOffer([this](ErrorOpt e, SignalingPayload p) {
                REQUIRE_FALSE(e.has_value());
                offer = std::move(p);
            });
            REQUIRE(runUntil(io, [&] { return offer.has_value(); }));
            b->acceptOffer(*offer, [this](ErrorOpt e, SignalingPayload p) {
                REQUIRE_FALSE(e.has_value());
                answer = std::move(p);
            });
            REQUIRE(runUntil(io, [&] { return answer.has_value(); }));
            a->applyAnswer(*answer);
        }
    };
}

TEST_CASE("Offer, answer and open over the loopback transport", "[negotiation]") {
    Pair p;
    p.build();

    std::shared_ptr<IDataChannel> chA, chB;
    p.a->setOpenHandler([&](std::shared_ptr<IDataChannel> ch) { chA = ch; });
    p.b->setOpenHandler([&](std::shared_ptr<IDataChannel> ch) { chB = ch; });

    p.exchange();
    REQUIRE(p.offer->kind == SignalKind::Offer);
    REQUIRE(p.offer->candidates.size() == 1);
    REQUIRE(p.answer->kind == SignalKind::Answer);
    REQUIRE(p.a->state() == NegotiationState::Connecting);
    REQUIRE(p.b->state() == NegotiationState::AnswerReady);

    REQUIRE(runUntil(p.io, [&] { return chA && chB; }));
    REQUIRE(p.a->state() == NegotiationState::Open);
    REQUIRE(p.b->state() == NegotiationState::Open);
    REQUIRE(chA->readyState() == ChannelState::Open);
    REQUIRE(chB->label() == "sync");
    REQUIRE(p.a->role() == NegotiationRole::Initiator);
    REQUIRE(p.b->role() == NegotiationRole::Responder);

    std::string got;
    chB->setMessageCallback([&](const std::string& m) { got = m; });
    chA->send("ping");
    REQUIRE(runUntil(p.io, [&] { return !got.empty(); }));
    REQUIRE(got == "ping");
    REQUIRE_FALSE(p.failA.has_value());
    REQUIRE_FALSE(p.failB.has_value());
}

TEST_CASE("Payloads of the wrong kind are rejected as invalid signaling", "[negotiation]") {
    Pair p;
    p.build();

    SignalingPayload answer{ SignalKind::Answer, "v=0\r\no=- 1 2 IN IP4 127.0.0.1\r\n", {} };
    try {
        p.b->acceptOffer(answer, [](ErrorOpt, SignalingPayload) {});
        FAIL("expected InvalidSignaling");
    }
    catch (const SyncError& e) {
        REQUIRE(e.code() == SyncErr::InvalidSignaling);
    }
    REQUIRE(p.b->state() == NegotiationState::Idle);

    // No offer is outstanding yet.
    REQUIRE_THROWS_AS(p.a->applyAnswer(answer), SyncError);

    p.a->createOffer([&](ErrorOpt, SignalingPayload o) { p.offer = o; });
    REQUIRE(runUntil(p.io, [&] { return p.offer.has_value(); }));
    try {
        p.a->applyAnswer(*p.offer);
        FAIL("expected InvalidSignaling");
    }
    catch (const SyncError& e) {
        REQUIRE(e.code() == SyncErr::InvalidSignaling);
    }
    REQUIRE(p.a->state() == NegotiationState::OfferReady);
}

TEST_CASE("A malformed offer leaves the responder ready for another scan", "[negotiation]") {
    Pair p;
    p.build();

    SignalingPayload bogus{ SignalKind::Offer, "not a session description", {} };
    REQUIRE_THROWS_AS(p.b->acceptOffer(bogus, [](ErrorOpt, SignalingPayload) {}), SyncError);
    REQUIRE(p.b->state() == NegotiationState::Idle);
    REQUIRE_FALSE(p.b->role().has_value());

    p.a->createOffer([&](ErrorOpt, SignalingPayload o) { p.offer = o; });
    REQUIRE(runUntil(p.io, [&] { return p.offer.has_value(); }));
    p.b->acceptOffer(*p.offer, [&](ErrorOpt e, SignalingPayload a) {
        REQUIRE_FALSE(e.has_value());
        p.answer = a;
    });
    REQUIRE(runUntil(p.io, [&] { return p.answer.has_value(); }));
}

TEST_CASE("Gathering that never completes is cut off by the timeout", "[negotiation]") {
    Pair p;
    p.net.options().completeGathering = false;
    p.net.options().candidateCount = 2;
    p.opts.gatherTimeoutMs = 50;
    p.build();

    auto started = std::chrono::steady_clock::now();
    p.a->createOffer([&](ErrorOpt e, SignalingPayload o) {
        REQUIRE_FALSE(e.has_value());
        p.offer = o;
    });
    REQUIRE(runUntil(p.io, [&] { return p.offer.has_value(); }));
    REQUIRE(std::chrono::steady_clock::now() - started >= 45ms);
    REQUIRE(p.offer->candidates.size() == 2);
    REQUIRE(p.a->state() == NegotiationState::OfferReady);
}

TEST_CASE("Failed connectivity checks surface as ConnectionFailed", "[negotiation]") {
    Pair p;
    p.net.options().failConnection = true;
    p.build();

    p.exchange();
    REQUIRE(runUntil(p.io, [&] { return p.failA.has_value() && p.failB.has_value(); }));
    REQUIRE(p.failA->code == SyncErr::ConnectionFailed);
    REQUIRE(p.failB->code == SyncErr::ConnectionFailed);
    REQUIRE(p.a->state() == NegotiationState::Failed);
}

TEST_CASE("A channel that never opens times out", "[negotiation]") {
    Pair p;
    p.net.options().neverOpen = true;
    p.opts.openTimeoutMs = 80;
    p.build();

    p.exchange();
    REQUIRE(runUntil(p.io, [&] { return p.failA.has_value() && p.failB.has_value(); }));
    REQUIRE(p.failA->code == SyncErr::ConnectionTimeout);
    REQUIRE(p.failB->code == SyncErr::ConnectionTimeout);
}

TEST_CASE("A transient disconnect is not terminal", "[negotiation]") {
    Pair p;
    p.build();
    bool openA = false;
    p.a->setOpenHandler([&](std::shared_ptr<IDataChannel>) { openA = true; });

    p.exchange();
    REQUIRE(runUntil(p.io, [&] { return openA; }));

    p.net.injectPeerState(PeerState::Disconnected);
    runFor(p.io, 20ms);
    REQUIRE_FALSE(p.failA.has_value());
    REQUIRE(p.a->state() == NegotiationState::Open);

    p.net.injectPeerState(PeerState::Connected);
    runFor(p.io, 20ms);
    REQUIRE_FALSE(p.failA.has_value());
}

TEST_CASE("No handler runs after close", "[negotiation]") {
    Pair p;
    p.build();

    bool called = false;
    p.a->createOffer([&](ErrorOpt, SignalingPayload) { called = true; });
    p.a->close();
    runFor(p.io, 30ms);

    REQUIRE_FALSE(called);
    REQUIRE(p.a->state() == NegotiationState::Closed);
    REQUIRE(p.net.liveConnections() == 0);
}
