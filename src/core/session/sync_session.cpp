/**
 * @file sync_session.cpp
 * @brief Implementation of SyncSession.
 */
#include "ktnsync/core/session/sync_session.hpp"
#include "ktnsync/core/channel/chunked_channel.hpp"
#include "ktnsync/core/negotiation/transport_negotiator.hpp"
#include "ktnsync/core/signaling/fragment.hpp"
#include "ktnsync/core/signaling/signaling_codec.hpp"
#include "ktnsync/core/util/logger.hpp"

#include <boost/asio/post.hpp>

namespace ktnsync {

    const char* toString(SessionStage s) {
        switch (s) {
        case SessionStage::Idle:        return "idle";
        case SessionStage::Negotiating: return "negotiating";
        case SessionStage::Connecting:  return "connecting";
        case SessionStage::Open:        return "open";
        case SessionStage::Syncing:     return "syncing";
        case SessionStage::Done:        return "done";
        case SessionStage::Failed:      return "failed";
        }
        return "unknown";
    }

    const char* toString(SyncEventKind k) {
        switch (k) {
        case SyncEventKind::Stage:            return "stage";
        case SyncEventKind::OfferReady:       return "offer-ready";
        case SyncEventKind::AnswerReady:      return "answer-ready";
        case SyncEventKind::FragmentReceived: return "fragment-received";
        case SyncEventKind::Warning:          return "warning";
        case SyncEventKind::Failed:           return "failed";
        case SyncEventKind::Completed:        return "completed";
        }
        return "unknown";
    }

    namespace {
        std::string trim(const std::string& s) {
            const char* ws = " \t\r\n";
            auto b = s.find_first_not_of(ws);
            if (b == std::string::npos) return {};
            auto e = s.find_last_not_of(ws);
            return s.substr(b, e - b + 1);
        }
    }

    struct SyncSession::Impl {
        boost::asio::io_context&              io;
        IDirectTransport&                     transport;
        IEntityStore&                         store;
        DeviceIdentityManager&                identity;
        SyncOptions                           opts;

        SessionStage                          stage{ SessionStage::Idle };
        std::optional<SessionRole>            role;
        std::unique_ptr<TransportNegotiator>  negotiator;
        std::unique_ptr<ChunkedChannel>       channel;
        std::optional<ReconciliationEngine>   engine;
        FragmentAssembler                     assembler;
        MergeCounts                           counts;
        EventHandler                          onEvent;
        bool                                  closed{ false };

        std::shared_ptr<int>                  life{ std::make_shared<int>(0) };

        Impl(boost::asio::io_context& io_, IDirectTransport& t, IEntityStore& s,
             DeviceIdentityManager& id, SyncOptions o)
            : io(io_), transport(t), store(s), identity(id), opts(std::move(o)),
              assembler(opts.strictFragments) {}

        /* The handler may close the session. Callers that continue afterwards hold a life guard. */
        void emit(SyncEvent ev) {
            if (closed || !onEvent) return;
            ev.stage = stage;
            auto h = onEvent;
            try {
                h(ev);
            }
            catch (const std::exception& e) {
                LOG_ERROR(std::string("Sync event handler threw: ") + e.what());
            }
        }

        void setStage(SessionStage s) {
            if (stage == s) return;
            LOG_INFO(std::string("Sync session ") + toString(stage) + " -> " + toString(s));
            stage = s;
            SyncEvent ev;
            ev.kind = SyncEventKind::Stage;
            ev.message = toString(s);
            emit(std::move(ev));
        }

        void warn(const ErrorObj& err) {
            LOG_WARN(std::string("Recoverable ") + errName(err.code) + ": " + err.detail);
            SyncEvent ev;
            ev.kind = SyncEventKind::Warning;
            ev.message = err.msg;
            ev.error = err;
            emit(std::move(ev));
        }

        void fail(const ErrorObj& err) {
            if (stage == SessionStage::Failed || closed) return;
            LOG_ERROR(std::string("Sync session failed (") + errName(err.code) + "): " + err.detail);
            if (engine) engine->abort();
            stage = SessionStage::Failed;

            std::weak_ptr<int> guard = life;
            SyncEvent ev;
            ev.kind = SyncEventKind::Failed;
            ev.message = err.msg;
            ev.error = err;
            ev.counts = counts;
            emit(std::move(ev));
            if (guard.expired()) return;

            // Deferred: fail() may run inside a negotiator or channel callback.
            boost::asio::post(io, [this, guard] {
                if (!guard.expired()) releaseTransport();
            });
        }

        void releaseTransport() {
            if (channel) {
                channel->close();
                channel.reset();
            }
            if (negotiator) {
                negotiator->close();
                negotiator.reset();
            }
        }

        bool prepare(SessionRole r) {
            if (stage != SessionStage::Idle || closed)
                throw SyncError(SyncErr::Internal, std::string("session already ") + toString(stage));
            role = r;

            std::string deviceId;
            try {
                deviceId = identity.ensureIdentity();
            }
            catch (const SyncError& e) {
                fail(e.code() == SyncErr::IdentityStore ? e.toError()
                                                        : makeError(SyncErr::IdentityStore, e.what()));
                return false;
            }

            engine.emplace(store, deviceId);
            negotiator = std::make_unique<TransportNegotiator>(io, transport, opts);

            std::weak_ptr<int> guard = life;
            negotiator->setOpenHandler([this, guard](std::shared_ptr<IDataChannel> ch) {
                if (!guard.expired()) onChannelOpen(std::move(ch));
            });
            negotiator->setFailureHandler([this, guard](const ErrorObj& err) {
                if (guard.expired() || stage == SessionStage::Done) return;
                fail(err);
            });
            setStage(SessionStage::Negotiating);
            return !guard.expired();
        }

        void startInitiator() {
            if (!prepare(SessionRole::Initiator)) return;
            std::weak_ptr<int> guard = life;
            negotiator->createOffer([this, guard](ErrorOpt err, SignalingPayload offer) {
                if (guard.expired()) return;
                if (err) {
                    fail(*err);
                    return;
                }
                SyncEvent ev;
                ev.kind = SyncEventKind::OfferReady;
                ev.transfer = encodeForTransfer(offer, opts);
                ev.total = static_cast<int>(ev.transfer.size());
                ev.message = "Show this code on the other device";
                emit(std::move(ev));
            });
        }

        void startResponder() {
            if (!prepare(SessionRole::Responder)) return;
            LOG_INFO("Waiting for the offer to be scanned");
        }

        /* Which description a scan should carry now, or nullopt when scans are not expected. */
        std::optional<SignalKind> expectedScan() const {
            if (closed || stage != SessionStage::Negotiating || !negotiator) {
                LOG_WARN(std::string("Scan ignored in stage ") + toString(stage));
                return std::nullopt;
            }
            const NegotiationState ns = negotiator->state();
            if (role == SessionRole::Responder && ns == NegotiationState::Idle) return SignalKind::Offer;
            if (role == SessionRole::Initiator && ns == NegotiationState::OfferReady) return SignalKind::Answer;
            LOG_WARN(std::string("Scan ignored while negotiator is ") + toString(ns));
            return std::nullopt;
        }

        void scan(const std::string& input) {
            auto expected = expectedScan();
            if (!expected) return;

            const std::string raw = trim(input);
            if (raw.empty()) return;

            FragmentAssembler::Progress p = assembler.add(raw);
            if (p.ignored) {
                warn(makeError(SyncErr::InvalidSignaling, "fragment index out of range"));
                return;
            }
            if (p.fragment) {
                SyncEvent ev;
                ev.kind = SyncEventKind::FragmentReceived;
                ev.received = p.complete ? p.total : p.received;
                ev.total = p.total;
                ev.message = "Scanned " + std::to_string(ev.received) + " of " + std::to_string(ev.total);
                std::weak_ptr<int> guard = life;
                emit(std::move(ev));
                if (guard.expired()) return;
            }
            if (p.complete) deliver(*expected, p.text);
        }

        void finishScan() {
            auto expected = expectedScan();
            if (!expected) return;

            FragmentAssembler::Progress p;
            try {
                p = assembler.flush();
            }
            catch (const SyncError& e) {
                warn(e.toError());
                return;
            }
            if (!p.complete) {
                LOG_WARN("Nothing scanned yet");
                return;
            }
            deliver(*expected, p.text);
        }

        void deliver(SignalKind expected, const std::string& text) {
            try {
                SignalingPayload payload = decodeTransfer(text);
                if (expected == SignalKind::Offer) acceptOffer(payload);
                else                               applyAnswer(payload);
            }
            catch (const SyncError& e) {
                assembler.reset();
                warn(e.toError());
            }
        }

        void acceptOffer(const SignalingPayload& offer) {
            std::weak_ptr<int> guard = life;
            negotiator->acceptOffer(offer, [this, guard](ErrorOpt err, SignalingPayload answer) {
                if (guard.expired()) return;
                if (err) {
                    fail(*err);
                    return;
                }
                SyncEvent ev;
                ev.kind = SyncEventKind::AnswerReady;
                ev.transfer = encodeForTransfer(answer, opts);
                ev.total = static_cast<int>(ev.transfer.size());
                ev.message = "Scan this code with the first device";
                emit(std::move(ev));
                if (guard.expired()) return;
                setStage(SessionStage::Connecting);
            });
        }

        void applyAnswer(const SignalingPayload& answer) {
            negotiator->applyAnswer(answer);
            setStage(SessionStage::Connecting);
        }

        void onChannelOpen(std::shared_ptr<IDataChannel> ch) {
            channel = std::make_unique<ChunkedChannel>(io, std::move(ch), opts);
            std::weak_ptr<int> guard = life;
            channel->setMessageHandler([this, guard](const std::string& text) {
                if (!guard.expired()) onMessage(text);
            });
            channel->setCloseHandler([this, guard] {
                if (!guard.expired()) onChannelClosed();
            });
            setStage(SessionStage::Open);
            if (guard.expired()) return;

            if (role == SessionRole::Initiator && opts.autoStartSync) beginSync();
        }

        void beginSync() {
            if (!channel || (stage != SessionStage::Open && stage != SessionStage::Done))
                throw SyncError(SyncErr::Internal, std::string("no open channel in stage ") + toString(stage));
            if (engine->syncInProgress()) {
                LOG_WARN("Sync already in progress");
                return;
            }
            std::weak_ptr<int> guard = life;
            setStage(SessionStage::Syncing);
            if (guard.expired()) return;
            send(engine->beginSync(), false);
        }

        void send(const AppMessage& m, bool finishesExchange) {
            std::weak_ptr<int> guard = life;
            LOG_DEBUG(std::string("Sending ") + messageType(m));
            channel->sendMessage(m, [this, guard, finishesExchange](ErrorOpt err) {
                if (guard.expired()) return;
                if (err) {
                    if (stage == SessionStage::Syncing) fail(*err);
                    return;
                }
                if (finishesExchange) finish();
            });
        }

        void onMessage(const std::string& text) {
            AppMessage m;
            try {
                m = decodeMessage(text);
            }
            catch (const SyncError& e) {
                warn(e.toError());
                return;
            }

            std::weak_ptr<int> guard = life;
            if (!std::holds_alternative<SyncAck>(m) && stage != SessionStage::Syncing && !engine->syncInProgress()) {
                setStage(SessionStage::Syncing);
                if (guard.expired()) return;
            }

            ReconciliationEngine::Outcome out;
            try {
                out = engine->handle(m);
            }
            catch (const SyncError& e) {
                fail(e.toError());
                return;
            }
            if (out.rejected) return;

            if (out.merged) {
                counts += out.counts;
                if (out.counts.failed > 0)
                    warn(makeError(SyncErr::MergeEntity,
                        std::to_string(out.counts.failed) + " entities skipped during merge"));
                if (guard.expired()) return;
            }
            if (out.reply) send(*out.reply, out.finished);
            else if (out.finished) finish();
        }

        void finish() {
            if (stage == SessionStage::Done || stage == SessionStage::Failed) return;
            stage = SessionStage::Done;
            LOG_INFO("Sync complete: " + std::to_string(counts.total()) + " changes");
            SyncEvent ev;
            ev.kind = SyncEventKind::Completed;
            ev.counts = counts;
            ev.message = "Synced " + std::to_string(counts.total()) + " changes";
            emit(std::move(ev));
        }

        void onChannelClosed() {
            switch (stage) {
            case SessionStage::Done:
                LOG_INFO("Channel closed after sync");
                break;
            case SessionStage::Failed:
                break;
            case SessionStage::Syncing:
                fail(makeError(SyncErr::ChannelClosed, "channel closed during sync"));
                break;
            default:
                fail(makeError(SyncErr::ChannelClosed, std::string("channel closed in stage ") + toString(stage)));
                break;
            }
        }

        void shutdown() {
            if (closed) return;
            closed = true;
            life.reset();
            releaseTransport();
            if (engine) engine->abort();
            assembler.reset();
            onEvent = nullptr;
            LOG_DEBUG(std::string("Sync session closed in stage ") + toString(stage));
        }
    };

    SyncSession::SyncSession(boost::asio::io_context& io, IDirectTransport& transport, IEntityStore& store,
                             DeviceIdentityManager& identity, SyncOptions opts)
        : pImpl_(std::make_unique<Impl>(io, transport, store, identity, std::move(opts)))
    {
        validateSyncOptions(pImpl_->opts);
    }

    SyncSession::~SyncSession() {
        close();
    }

    void SyncSession::setEventHandler(EventHandler h) { pImpl_->onEvent = std::move(h); }
    void SyncSession::startAsInitiator() { pImpl_->startInitiator(); }
    void SyncSession::startAsResponder() { pImpl_->startResponder(); }
    void SyncSession::submitScan(const std::string& raw) { pImpl_->scan(raw); }
    void SyncSession::finishScan() { pImpl_->finishScan(); }
    void SyncSession::startSync() { pImpl_->beginSync(); }
    void SyncSession::close() { pImpl_->shutdown(); }

    SessionStage SyncSession::stage() const { return pImpl_->stage; }
    std::optional<SessionRole> SyncSession::role() const { return pImpl_->role; }
    bool SyncSession::syncInProgress() const { return pImpl_->engine && pImpl_->engine->syncInProgress(); }
    MergeCounts SyncSession::counts() const { return pImpl_->counts; }

}
